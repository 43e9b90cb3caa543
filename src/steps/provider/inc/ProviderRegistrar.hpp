#pragma once

#include "CloudClient.hpp"
#include "PipelineCatalog.hpp"
#include "PipelineExecutor.hpp"
#include "StepRegistry.hpp"
#include <memory>

// Step order per provider for the preProvision stage
PipelineCatalog::Table pre_provision_table();

// Registers every provider step plus the preProvision stage step.
// `catalog` is referenced by the stage step and must outlive `registry`.
void register_provider_steps(StepRegistry& registry,
                             const PipelineCatalog& catalog,
                             std::shared_ptr<const CloudClientFactory> clients,
                             const PipelineExecutor& executor = PipelineExecutor());
