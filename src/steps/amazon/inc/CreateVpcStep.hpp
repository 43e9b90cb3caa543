#pragma once

#include "StepBase.hpp"

// Creates the cluster VPC, or adopts a preset vpc_id after checking it exists.
class CreateVpcStep : public StepBase {
public:
    explicit CreateVpcStep(std::shared_ptr<const CloudClientFactory> clients);

protected:
    void apply(const ExecutionContext& ctx, std::ostream& out, ProvisionConfig& cfg) const override;
    void revert(const ExecutionContext& ctx, std::ostream& out, ProvisionConfig& cfg) const override;
};
