#pragma once

#include "CloudClient.hpp"
#include "StepRegistry.hpp"
#include <memory>

// Installs every AWS step into `registry`
void register_amazon_steps(StepRegistry& registry, std::shared_ptr<const CloudClientFactory> clients);
