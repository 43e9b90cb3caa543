#pragma once
#include <string>

struct AzureConfig {
    std::string tenant_id;
    std::string subscription_id;
    std::string client_id;
    std::string client_secret;
    std::string location = "westeurope";
    std::string vnet_cidr = "10.0.0.0/16";
    std::string resource_group;          // preset name, reused when it already exists

    // Outputs
    std::string resource_group_name;
    std::string vnet_name;
};
