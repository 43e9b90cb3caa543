#include "CreateVpcStep.hpp"
#include "AmazonStepNames.hpp"
#include <stdexcept>

CreateVpcStep::CreateVpcStep(std::shared_ptr<const CloudClientFactory> clients)
    : StepBase(std::move(clients), AmazonSteps::CREATE_VPC, "Create the cluster VPC") {}

void CreateVpcStep::apply(const ExecutionContext& ctx, std::ostream& out, ProvisionConfig& cfg) const {
    auto aws = clients().aws(cfg.aws);

    if (!cfg.aws.vpc_id.empty()) {
        if (!aws->vpc_exists(cfg.aws.vpc_id)) {
            throw std::runtime_error("VPC " + cfg.aws.vpc_id + " not found in " + cfg.aws.region);
        }
        out << "Using existing VPC " << cfg.aws.vpc_id << std::endl;
        return;
    }

    out << "Creating VPC with CIDR " << cfg.aws.vpc_cidr << " in " << cfg.aws.region << std::endl;
    const std::string vpc_id = aws->create_vpc(cfg.aws.vpc_cidr);
    cfg.aws.vpc_id = vpc_id;
    remember(cfg, vpc_id);

    await_available(ctx, out, cfg, "VPC " + vpc_id, [&] { return aws->vpc_state(vpc_id); });
    out << "VPC " << vpc_id << " is available" << std::endl;
}

void CreateVpcStep::revert(const ExecutionContext&, std::ostream& out, ProvisionConfig& cfg) const {
    const std::string vpc_id = cfg.aws.vpc_id;
    if (!cfg.created(vpc_id)) {
        return;
    }

    auto aws = clients().aws(cfg.aws);
    out << "Deleting VPC " << vpc_id << std::endl;
    aws->delete_vpc(vpc_id);
    forget(cfg, vpc_id);
    cfg.aws.vpc_id.clear();
}
