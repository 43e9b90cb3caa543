#pragma once

#include "StepBase.hpp"

// Imports the operator's public key as an EC2 key pair.
class ImportKeyPairStep : public StepBase {
public:
    explicit ImportKeyPairStep(std::shared_ptr<const CloudClientFactory> clients);

protected:
    void apply(const ExecutionContext& ctx, std::ostream& out, ProvisionConfig& cfg) const override;
    void revert(const ExecutionContext& ctx, std::ostream& out, ProvisionConfig& cfg) const override;
};
