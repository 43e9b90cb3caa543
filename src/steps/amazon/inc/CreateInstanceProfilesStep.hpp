#pragma once

#include "StepBase.hpp"

// IAM instance profiles for masters and nodes.
class CreateInstanceProfilesStep : public StepBase {
public:
    explicit CreateInstanceProfilesStep(std::shared_ptr<const CloudClientFactory> clients);

protected:
    void apply(const ExecutionContext& ctx, std::ostream& out, ProvisionConfig& cfg) const override;
    void revert(const ExecutionContext& ctx, std::ostream& out, ProvisionConfig& cfg) const override;
};
