#pragma once

#include "StepBase.hpp"

// Masters and nodes security groups with the ingress rules the cluster needs.
class CreateSecurityGroupsStep : public StepBase {
public:
    explicit CreateSecurityGroupsStep(std::shared_ptr<const CloudClientFactory> clients);

protected:
    void apply(const ExecutionContext& ctx, std::ostream& out, ProvisionConfig& cfg) const override;
    void revert(const ExecutionContext& ctx, std::ostream& out, ProvisionConfig& cfg) const override;
};
