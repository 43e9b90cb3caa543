#pragma once

#include "StepBase.hpp"

// Associates the route table with every cluster subnet.
class AssociateRouteTableStep : public StepBase {
public:
    explicit AssociateRouteTableStep(std::shared_ptr<const CloudClientFactory> clients);

protected:
    void apply(const ExecutionContext& ctx, std::ostream& out, ProvisionConfig& cfg) const override;
    void revert(const ExecutionContext& ctx, std::ostream& out, ProvisionConfig& cfg) const override;
};
