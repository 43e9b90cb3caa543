#pragma once

#include "StepBase.hpp"

// Resolves the machine image for cluster nodes. Read-only, nothing to revert.
class FindAmiStep : public StepBase {
public:
    explicit FindAmiStep(std::shared_ptr<const CloudClientFactory> clients);

protected:
    void apply(const ExecutionContext& ctx, std::ostream& out, ProvisionConfig& cfg) const override;
    void revert(const ExecutionContext& ctx, std::ostream& out, ProvisionConfig& cfg) const override;
};
