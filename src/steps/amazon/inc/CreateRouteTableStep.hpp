#pragma once

#include "StepBase.hpp"

// Route table with a default route through the internet gateway.
class CreateRouteTableStep : public StepBase {
public:
    explicit CreateRouteTableStep(std::shared_ptr<const CloudClientFactory> clients);

protected:
    void apply(const ExecutionContext& ctx, std::ostream& out, ProvisionConfig& cfg) const override;
    void revert(const ExecutionContext& ctx, std::ostream& out, ProvisionConfig& cfg) const override;
};
