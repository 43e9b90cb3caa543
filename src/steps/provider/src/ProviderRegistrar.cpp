#include "ProviderRegistrar.hpp"
#include "AmazonRegistrar.hpp"
#include "AmazonStepNames.hpp"
#include "AzureRegistrar.hpp"
#include "AzureStepNames.hpp"
#include "PreProvisionStep.hpp"

PipelineCatalog::Table pre_provision_table() {
    return {
        {CloudProvider::AWS, {
            AmazonSteps::FIND_AMI,
            AmazonSteps::CREATE_VPC,
            AmazonSteps::CREATE_SECURITY_GROUPS,
            AmazonSteps::CREATE_INSTANCE_PROFILES,
            AmazonSteps::IMPORT_KEY_PAIR,
            AmazonSteps::CREATE_INTERNET_GATEWAY,
            AmazonSteps::CREATE_SUBNETS,
            AmazonSteps::CREATE_ROUTE_TABLE,
            AmazonSteps::ASSOCIATE_ROUTE_TABLE,
        }},
        {CloudProvider::Azure, {
            AzureSteps::CREATE_RESOURCE_GROUP,
            AzureSteps::CREATE_VIRTUAL_NETWORK,
        }},
        {CloudProvider::GCE, {}},
        {CloudProvider::DigitalOcean, {}},
    };
}

void register_provider_steps(StepRegistry& registry,
                             const PipelineCatalog& catalog,
                             std::shared_ptr<const CloudClientFactory> clients,
                             const PipelineExecutor& executor) {
    register_amazon_steps(registry, clients);
    register_azure_steps(registry, std::move(clients));
    registry.register_step(std::make_shared<PreProvisionStep>(registry, catalog, executor));
}
