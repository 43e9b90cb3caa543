#include "PreProvisionStep.hpp"

PreProvisionStep::PreProvisionStep(const StepRegistry& registry, const PipelineCatalog& catalog,
                                   PipelineExecutor executor)
    : CompositeStep(std::move(executor)), registry_(registry), catalog_(catalog) {}

std::string PreProvisionStep::description() const {
    return "Provision the cloud infrastructure of the " + catalog_.stage() + " stage";
}

Pipeline PreProvisionStep::resolve(const ProvisionConfig& cfg) const {
    return catalog_.resolve(cfg.provider, registry_);
}
