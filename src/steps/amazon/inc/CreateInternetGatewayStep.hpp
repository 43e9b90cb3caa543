#pragma once

#include "StepBase.hpp"

// Creates an internet gateway and attaches it to the VPC.
class CreateInternetGatewayStep : public StepBase {
public:
    explicit CreateInternetGatewayStep(std::shared_ptr<const CloudClientFactory> clients);

protected:
    void apply(const ExecutionContext& ctx, std::ostream& out, ProvisionConfig& cfg) const override;
    void revert(const ExecutionContext& ctx, std::ostream& out, ProvisionConfig& cfg) const override;
};
