#include "ClientFactoryBuilder.hpp"
#include "LogUtils.hpp"
#include "ProvisionError.hpp"
#include "SandboxCloud.hpp"
#include "StringUtils.hpp"

std::shared_ptr<CloudClientFactory> ClientFactoryBuilder::create(const BackendConfig& backend) {
    if (backend.type == BackendConfig::Type::Sandbox) {
        if (!backend.fail_on.empty()) {
            LogUtils::warn("Sandbox backend will fail operations: {}", StringUtils::join(backend.fail_on, ", "));
        }
        auto cloud = std::make_shared<SandboxCloud>(backend.latency_polls, backend.fail_on);
        return std::make_shared<SandboxClientFactory>(std::move(cloud));
    }

    throw ConfigurationError("Unsupported cloud backend type: " + std::to_string(static_cast<int>(backend.type)));
}
