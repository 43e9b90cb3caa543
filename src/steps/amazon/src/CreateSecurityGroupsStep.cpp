#include "CreateSecurityGroupsStep.hpp"
#include "AmazonStepNames.hpp"

namespace {
const char* ANYWHERE = "0.0.0.0/0";
}

CreateSecurityGroupsStep::CreateSecurityGroupsStep(std::shared_ptr<const CloudClientFactory> clients)
    : StepBase(std::move(clients), AmazonSteps::CREATE_SECURITY_GROUPS,
               "Create masters and nodes security groups",
               {AmazonSteps::CREATE_VPC}) {}

void CreateSecurityGroupsStep::apply(const ExecutionContext& ctx, std::ostream& out, ProvisionConfig& cfg) const {
    auto aws = clients().aws(cfg.aws);
    const std::string prefix = resource_prefix(cfg);
    auto& conf = cfg.aws;

    if (conf.masters_security_group_id.empty()) {
        conf.masters_security_group_id = aws->create_security_group(
            conf.vpc_id, prefix + "-masters", "Kubernetes masters of " + prefix);
        remember(cfg, conf.masters_security_group_id);
        out << "Created masters security group " << conf.masters_security_group_id << std::endl;
    }

    ctx.check();

    if (conf.nodes_security_group_id.empty()) {
        conf.nodes_security_group_id = aws->create_security_group(
            conf.vpc_id, prefix + "-nodes", "Kubernetes nodes of " + prefix);
        remember(cfg, conf.nodes_security_group_id);
        out << "Created nodes security group " << conf.nodes_security_group_id << std::endl;
    }

    const auto& masters = conf.masters_security_group_id;
    const auto& nodes = conf.nodes_security_group_id;

    aws->authorize_ingress(masters, "tcp", 22, 22, ANYWHERE);
    aws->authorize_ingress(masters, "tcp", 443, 443, ANYWHERE);
    aws->authorize_ingress(masters, "-1", 0, 65535, nodes);
    aws->authorize_ingress(masters, "-1", 0, 65535, masters);

    aws->authorize_ingress(nodes, "tcp", 22, 22, ANYWHERE);
    aws->authorize_ingress(nodes, "tcp", 30000, 32767, ANYWHERE);
    aws->authorize_ingress(nodes, "-1", 0, 65535, masters);
    aws->authorize_ingress(nodes, "-1", 0, 65535, nodes);
    out << "Authorized cluster ingress rules" << std::endl;
}

void CreateSecurityGroupsStep::revert(const ExecutionContext&, std::ostream& out, ProvisionConfig& cfg) const {
    auto& conf = cfg.aws;
    const bool own_nodes = cfg.created(conf.nodes_security_group_id);
    const bool own_masters = cfg.created(conf.masters_security_group_id);
    if (!own_nodes && !own_masters) {
        return;
    }

    auto aws = clients().aws(conf);
    if (own_nodes) {
        out << "Deleting nodes security group " << conf.nodes_security_group_id << std::endl;
        aws->delete_security_group(conf.nodes_security_group_id);
        forget(cfg, conf.nodes_security_group_id);
        conf.nodes_security_group_id.clear();
    }
    if (own_masters) {
        out << "Deleting masters security group " << conf.masters_security_group_id << std::endl;
        aws->delete_security_group(conf.masters_security_group_id);
        forget(cfg, conf.masters_security_group_id);
        conf.masters_security_group_id.clear();
    }
}
