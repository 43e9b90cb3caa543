#include "ImportKeyPairStep.hpp"
#include "AmazonStepNames.hpp"
#include <stdexcept>

ImportKeyPairStep::ImportKeyPairStep(std::shared_ptr<const CloudClientFactory> clients)
    : StepBase(std::move(clients), AmazonSteps::IMPORT_KEY_PAIR, "Import the provisioning SSH key pair") {}

void ImportKeyPairStep::apply(const ExecutionContext&, std::ostream& out, ProvisionConfig& cfg) const {
    if (!cfg.aws.key_pair_name.empty()) {
        out << "Using key pair " << cfg.aws.key_pair_name << std::endl;
        return;
    }
    if (cfg.aws.public_key.empty()) {
        throw std::runtime_error("public key is required to import a key pair");
    }

    auto aws = clients().aws(cfg.aws);
    cfg.aws.key_pair_name = aws->import_key_pair(resource_prefix(cfg) + "-key", cfg.aws.public_key);
    remember(cfg, cfg.aws.key_pair_name);
    out << "Imported key pair " << cfg.aws.key_pair_name << std::endl;
}

void ImportKeyPairStep::revert(const ExecutionContext&, std::ostream& out, ProvisionConfig& cfg) const {
    if (!cfg.created(cfg.aws.key_pair_name)) {
        return;
    }

    auto aws = clients().aws(cfg.aws);
    out << "Deleting key pair " << cfg.aws.key_pair_name << std::endl;
    aws->delete_key_pair(cfg.aws.key_pair_name);
    forget(cfg, cfg.aws.key_pair_name);
    cfg.aws.key_pair_name.clear();
}
