#include "CreateInternetGatewayStep.hpp"
#include "AmazonStepNames.hpp"

namespace {
std::string attachment_key(const std::string& gateway_id, const std::string& vpc_id) {
    return gateway_id + "@" + vpc_id;
}
}

CreateInternetGatewayStep::CreateInternetGatewayStep(std::shared_ptr<const CloudClientFactory> clients)
    : StepBase(std::move(clients), AmazonSteps::CREATE_INTERNET_GATEWAY,
               "Create and attach the internet gateway",
               {AmazonSteps::CREATE_VPC}) {}

void CreateInternetGatewayStep::apply(const ExecutionContext&, std::ostream& out, ProvisionConfig& cfg) const {
    auto aws = clients().aws(cfg.aws);

    cfg.aws.internet_gateway_id = aws->create_internet_gateway();
    remember(cfg, cfg.aws.internet_gateway_id);
    out << "Created internet gateway " << cfg.aws.internet_gateway_id << std::endl;

    aws->attach_internet_gateway(cfg.aws.internet_gateway_id, cfg.aws.vpc_id);
    remember(cfg, attachment_key(cfg.aws.internet_gateway_id, cfg.aws.vpc_id));
    out << "Attached " << cfg.aws.internet_gateway_id << " to " << cfg.aws.vpc_id << std::endl;
}

void CreateInternetGatewayStep::revert(const ExecutionContext&, std::ostream& out, ProvisionConfig& cfg) const {
    const std::string gateway_id = cfg.aws.internet_gateway_id;
    if (!cfg.created(gateway_id)) {
        return;
    }

    auto aws = clients().aws(cfg.aws);
    const std::string attachment = attachment_key(gateway_id, cfg.aws.vpc_id);
    if (cfg.created(attachment)) {
        out << "Detaching " << gateway_id << " from " << cfg.aws.vpc_id << std::endl;
        aws->detach_internet_gateway(gateway_id, cfg.aws.vpc_id);
        forget(cfg, attachment);
    }

    out << "Deleting internet gateway " << gateway_id << std::endl;
    aws->delete_internet_gateway(gateway_id);
    forget(cfg, gateway_id);
    cfg.aws.internet_gateway_id.clear();
}
