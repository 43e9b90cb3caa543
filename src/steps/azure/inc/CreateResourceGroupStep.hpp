#pragma once

#include "StepBase.hpp"

// Creates the cluster resource group, or adopts a preset one that already exists.
// Adopted groups are never deleted on rollback.
class CreateResourceGroupStep : public StepBase {
public:
    explicit CreateResourceGroupStep(std::shared_ptr<const CloudClientFactory> clients);

protected:
    void apply(const ExecutionContext& ctx, std::ostream& out, ProvisionConfig& cfg) const override;
    void revert(const ExecutionContext& ctx, std::ostream& out, ProvisionConfig& cfg) const override;
};
