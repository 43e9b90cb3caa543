#include "FindAmiStep.hpp"
#include "AmazonStepNames.hpp"

FindAmiStep::FindAmiStep(std::shared_ptr<const CloudClientFactory> clients)
    : StepBase(std::move(clients), AmazonSteps::FIND_AMI, "Find the machine image for cluster nodes") {}

void FindAmiStep::apply(const ExecutionContext&, std::ostream& out, ProvisionConfig& cfg) const {
    if (!cfg.aws.image_id.empty()) {
        out << "Using preset image " << cfg.aws.image_id << std::endl;
        return;
    }

    auto aws = clients().aws(cfg.aws);
    cfg.aws.image_id = aws->find_image(cfg.aws.image_name);
    out << "Found image " << cfg.aws.image_id << " (" << cfg.aws.image_name << ") in " << cfg.aws.region << std::endl;
}

void FindAmiStep::revert(const ExecutionContext&, std::ostream&, ProvisionConfig&) const {
}
