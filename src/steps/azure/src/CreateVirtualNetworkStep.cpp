#include "CreateVirtualNetworkStep.hpp"
#include "AzureStepNames.hpp"

namespace {
std::string ledger_key(const std::string& group, const std::string& vnet) {
    return "virtual-network/" + group + "/" + vnet;
}
}

CreateVirtualNetworkStep::CreateVirtualNetworkStep(std::shared_ptr<const CloudClientFactory> clients)
    : StepBase(std::move(clients), AzureSteps::CREATE_VIRTUAL_NETWORK,
               "Create the cluster virtual network",
               {AzureSteps::CREATE_RESOURCE_GROUP}) {}

void CreateVirtualNetworkStep::apply(const ExecutionContext& ctx, std::ostream& out, ProvisionConfig& cfg) const {
    auto azure = clients().azure(cfg.azure);
    const std::string group = cfg.azure.resource_group_name;
    const std::string vnet = resource_prefix(cfg) + "-vnet";

    out << "Creating virtual network " << vnet << " (" << cfg.azure.vnet_cidr << ") in " << group << std::endl;
    azure->create_virtual_network(group, vnet, cfg.azure.location, cfg.azure.vnet_cidr);
    cfg.azure.vnet_name = vnet;
    remember(cfg, ledger_key(group, vnet));

    await_available(ctx, out, cfg, "virtual network " + vnet,
                    [&] { return azure->virtual_network_state(group, vnet); });
    out << "Virtual network " << vnet << " is available" << std::endl;
}

void CreateVirtualNetworkStep::revert(const ExecutionContext&, std::ostream& out, ProvisionConfig& cfg) const {
    const std::string group = cfg.azure.resource_group_name;
    const std::string vnet = cfg.azure.vnet_name;
    if (vnet.empty() || !cfg.created(ledger_key(group, vnet))) {
        return;
    }

    auto azure = clients().azure(cfg.azure);
    out << "Deleting virtual network " << vnet << std::endl;
    azure->delete_virtual_network(group, vnet);
    forget(cfg, ledger_key(group, vnet));
    cfg.azure.vnet_name.clear();
}
