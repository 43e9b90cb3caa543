#include "CreateResourceGroupStep.hpp"
#include "AzureStepNames.hpp"
#include <stdexcept>

namespace {
std::string ledger_key(const std::string& group) {
    return "resource-group/" + group;
}
}

CreateResourceGroupStep::CreateResourceGroupStep(std::shared_ptr<const CloudClientFactory> clients)
    : StepBase(std::move(clients), AzureSteps::CREATE_RESOURCE_GROUP, "Create the cluster resource group") {}

void CreateResourceGroupStep::apply(const ExecutionContext&, std::ostream& out, ProvisionConfig& cfg) const {
    auto azure = clients().azure(cfg.azure);

    const std::string group = cfg.azure.resource_group.empty()
        ? resource_prefix(cfg) + "-rg"
        : cfg.azure.resource_group;

    if (azure->resource_group_exists(group)) {
        if (cfg.azure.resource_group.empty()) {
            throw std::runtime_error("resource group " + group + " already exists");
        }
        cfg.azure.resource_group_name = group;
        out << "Using existing resource group " << group << std::endl;
        return;
    }

    azure->create_resource_group(group, cfg.azure.location);
    cfg.azure.resource_group_name = group;
    remember(cfg, ledger_key(group));
    out << "Created resource group " << group << " in " << cfg.azure.location << std::endl;
}

void CreateResourceGroupStep::revert(const ExecutionContext&, std::ostream& out, ProvisionConfig& cfg) const {
    const std::string group = cfg.azure.resource_group_name;
    if (group.empty() || !cfg.created(ledger_key(group))) {
        return;
    }

    auto azure = clients().azure(cfg.azure);
    out << "Deleting resource group " << group << std::endl;
    azure->delete_resource_group(group);
    forget(cfg, ledger_key(group));
    cfg.azure.resource_group_name.clear();
}
