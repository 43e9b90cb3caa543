#include "AzureRegistrar.hpp"
#include "CreateResourceGroupStep.hpp"
#include "CreateVirtualNetworkStep.hpp"

void register_azure_steps(StepRegistry& registry, std::shared_ptr<const CloudClientFactory> clients) {
    registry.register_step(std::make_shared<CreateResourceGroupStep>(clients));
    registry.register_step(std::make_shared<CreateVirtualNetworkStep>(std::move(clients)));
}
