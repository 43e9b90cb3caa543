#pragma once

#include "StepBase.hpp"

// One subnet per availability zone, CIDR blocks carved out of the VPC range.
class CreateSubnetsStep : public StepBase {
public:
    explicit CreateSubnetsStep(std::shared_ptr<const CloudClientFactory> clients);

protected:
    void apply(const ExecutionContext& ctx, std::ostream& out, ProvisionConfig& cfg) const override;
    void revert(const ExecutionContext& ctx, std::ostream& out, ProvisionConfig& cfg) const override;
};
