#include "PipelineCatalog.hpp"
#include "ProvisionError.hpp"
#include <set>

PipelineCatalog::PipelineCatalog(std::string stage, Table table)
    : stage_(std::move(stage)), table_(std::move(table)) {
    for (auto provider : ALL_CLOUD_PROVIDERS) {
        if (table_.find(provider) == table_.end()) {
            throw ConfigurationError(stage_ + ": no pipeline defined for provider " + to_string(provider));
        }
    }
}

const std::vector<std::string>& PipelineCatalog::pipeline_for(CloudProvider provider) const {
    auto it = table_.find(provider);
    if (it == table_.end()) {
        throw ConfigurationError("unknown provider: " + to_string(provider));
    }
    return it->second;
}

const std::vector<std::string>& PipelineCatalog::pipeline_for(const std::string& provider_name) const {
    return pipeline_for(parse_cloud_provider(provider_name));
}

Pipeline PipelineCatalog::resolve(CloudProvider provider, const StepRegistry& registry) const {
    Pipeline pipeline;
    pipeline.name = stage_;

    for (const auto& name : pipeline_for(provider)) {
        auto step = registry.get_step(name);
        if (!step) {
            throw ConfigurationError("step " + name + " required by " + to_string(provider) +
                                     " " + stage_ + " pipeline is not registered");
        }
        pipeline.steps.push_back(std::move(step));
    }
    return pipeline;
}

std::vector<std::string> PipelineCatalog::validate(const StepRegistry& registry) const {
    std::vector<std::string> problems;

    for (const auto& [provider, names] : table_) {
        std::set<std::string> seen;
        for (const auto& name : names) {
            auto step = registry.get_step(name);
            if (!step) {
                problems.push_back(to_string(provider) + ": step " + name + " is not registered");
                seen.insert(name);
                continue;
            }

            for (const auto& dependency : step->depends()) {
                if (seen.count(dependency) == 0) {
                    problems.push_back(to_string(provider) + ": step " + name + " depends on " +
                                       dependency + " which does not run before it");
                }
            }

            if (!seen.insert(name).second) {
                problems.push_back(to_string(provider) + ": step " + name + " listed twice");
            }
        }
    }
    return problems;
}
