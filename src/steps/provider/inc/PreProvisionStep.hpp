#pragma once

#include "CompositeStep.hpp"
#include "PipelineCatalog.hpp"
#include "StepRegistry.hpp"

// Stage step that provisions the provider infrastructure a cluster needs
// before any node exists. Its inner pipeline is the catalog entry for
// cfg.provider, looked up in the registry on every run.
class PreProvisionStep : public CompositeStep {
public:
    static constexpr const char* NAME = "preProvision";

    // `registry` and `catalog` must outlive the step
    PreProvisionStep(const StepRegistry& registry, const PipelineCatalog& catalog,
                     PipelineExecutor executor = PipelineExecutor());

    std::string name() const override { return NAME; }
    std::string description() const override;
    std::vector<std::string> depends() const override { return {}; }

    Pipeline resolve(const ProvisionConfig& cfg) const override;

private:
    const StepRegistry& registry_;
    const PipelineCatalog& catalog_;
};
