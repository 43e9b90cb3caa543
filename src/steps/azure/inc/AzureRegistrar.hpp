#pragma once

#include "CloudClient.hpp"
#include "StepRegistry.hpp"
#include <memory>

void register_azure_steps(StepRegistry& registry, std::shared_ptr<const CloudClientFactory> clients);
