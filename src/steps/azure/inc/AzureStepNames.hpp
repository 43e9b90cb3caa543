#pragma once

namespace AzureSteps {

inline constexpr const char* CREATE_RESOURCE_GROUP = "azure/create-resource-group";
inline constexpr const char* CREATE_VIRTUAL_NETWORK = "azure/create-virtual-network";

}
