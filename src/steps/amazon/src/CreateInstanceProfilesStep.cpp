#include "CreateInstanceProfilesStep.hpp"
#include "AmazonStepNames.hpp"

CreateInstanceProfilesStep::CreateInstanceProfilesStep(std::shared_ptr<const CloudClientFactory> clients)
    : StepBase(std::move(clients), AmazonSteps::CREATE_INSTANCE_PROFILES,
               "Create IAM instance profiles for masters and nodes") {}

void CreateInstanceProfilesStep::apply(const ExecutionContext&, std::ostream& out, ProvisionConfig& cfg) const {
    auto aws = clients().aws(cfg.aws);
    const std::string prefix = resource_prefix(cfg);

    if (cfg.aws.masters_instance_profile.empty()) {
        cfg.aws.masters_instance_profile = aws->create_instance_profile(prefix + "-masters-profile", "kubernetes-master");
        remember(cfg, cfg.aws.masters_instance_profile);
        out << "Created instance profile " << cfg.aws.masters_instance_profile << std::endl;
    }

    if (cfg.aws.nodes_instance_profile.empty()) {
        cfg.aws.nodes_instance_profile = aws->create_instance_profile(prefix + "-nodes-profile", "kubernetes-node");
        remember(cfg, cfg.aws.nodes_instance_profile);
        out << "Created instance profile " << cfg.aws.nodes_instance_profile << std::endl;
    }
}

void CreateInstanceProfilesStep::revert(const ExecutionContext&, std::ostream& out, ProvisionConfig& cfg) const {
    std::string* profiles[] = {&cfg.aws.nodes_instance_profile, &cfg.aws.masters_instance_profile};

    std::unique_ptr<AwsClient> aws;
    for (auto* profile : profiles) {
        if (!cfg.created(*profile)) {
            continue;
        }
        if (!aws) {
            aws = clients().aws(cfg.aws);
        }
        out << "Deleting instance profile " << *profile << std::endl;
        aws->delete_instance_profile(*profile);
        forget(cfg, *profile);
        profile->clear();
    }
}
