#pragma once

#include "StepBase.hpp"

class CreateVirtualNetworkStep : public StepBase {
public:
    explicit CreateVirtualNetworkStep(std::shared_ptr<const CloudClientFactory> clients);

protected:
    void apply(const ExecutionContext& ctx, std::ostream& out, ProvisionConfig& cfg) const override;
    void revert(const ExecutionContext& ctx, std::ostream& out, ProvisionConfig& cfg) const override;
};
