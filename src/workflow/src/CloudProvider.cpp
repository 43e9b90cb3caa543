#include "CloudProvider.hpp"
#include "ProvisionError.hpp"
#include "StringUtils.hpp"

std::string to_string(CloudProvider provider) {
    switch (provider) {
        case CloudProvider::AWS:          return "aws";
        case CloudProvider::Azure:        return "azure";
        case CloudProvider::GCE:          return "gce";
        case CloudProvider::DigitalOcean: return "digitalocean";
    }
    return "unknown";
}

CloudProvider parse_cloud_provider(const std::string& name) {
    const std::string lower = StringUtils::to_lower(name);
    for (auto provider : ALL_CLOUD_PROVIDERS) {
        if (to_string(provider) == lower) {
            return provider;
        }
    }
    throw ConfigurationError("unknown provider: " + name);
}
