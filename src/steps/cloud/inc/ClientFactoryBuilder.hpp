#pragma once

#include "BackendConfig.hpp"
#include "CloudClient.hpp"
#include <memory>

class ClientFactoryBuilder {
public:
    static std::shared_ptr<CloudClientFactory> create(const BackendConfig& backend);
};
