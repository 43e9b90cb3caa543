#pragma once

#include "CloudProvider.hpp"
#include "Pipeline.hpp"
#include "StepRegistry.hpp"
#include <map>
#include <string>
#include <vector>

// Fixed, per-provider step order for one stage.
//
// The order encodes real infrastructure dependencies (network before subnets,
// subnets before route table association) and is not derived from
// Step::depends(); validate() only checks that the two agree.
class PipelineCatalog {
public:
    using Table = std::map<CloudProvider, std::vector<std::string>>;

    // Throws ConfigurationError unless every CloudProvider has an entry
    PipelineCatalog(std::string stage, Table table);

    const std::string& stage() const { return stage_; }

    // Empty for providers without steps; that is a valid no-op pipeline
    const std::vector<std::string>& pipeline_for(CloudProvider provider) const;
    const std::vector<std::string>& pipeline_for(const std::string& provider_name) const;

    // Looks every step up; throws ConfigurationError naming the first missing step
    Pipeline resolve(CloudProvider provider, const StepRegistry& registry) const;

    // Start-up check: all names registered, declared dependencies ordered earlier
    std::vector<std::string> validate(const StepRegistry& registry) const;

private:
    std::string stage_;
    Table table_;
};
