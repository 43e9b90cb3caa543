#pragma once

#include <array>
#include <string>

// Closed set of supported clouds
enum class CloudProvider {
    AWS,
    Azure,
    GCE,
    DigitalOcean
};

inline constexpr std::array<CloudProvider, 4> ALL_CLOUD_PROVIDERS = {
    CloudProvider::AWS,
    CloudProvider::Azure,
    CloudProvider::GCE,
    CloudProvider::DigitalOcean
};

std::string to_string(CloudProvider provider);

// Case-insensitive; throws ConfigurationError("unknown provider: <name>")
CloudProvider parse_cloud_provider(const std::string& name);
