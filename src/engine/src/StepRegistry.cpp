#include "StepRegistry.hpp"
#include "LogUtils.hpp"
#include <algorithm>
#include <stdexcept>

void StepRegistry::register_step(StepPtr step) {
    if (!step) {
        throw std::invalid_argument("Cannot register a null step");
    }

    auto name = step->name();
    if (name.empty()) {
        throw std::invalid_argument("Cannot register a step without a name");
    }

    const bool inserted = steps_.insert_or_assign(name, std::move(step)).second;
    if (!inserted) {
        LogUtils::debug("Step {} registered again, replacing previous instance", name);
    }
}

StepPtr StepRegistry::get_step(const std::string& name) const {
    auto it = steps_.find(name);
    if (it == steps_.end()) {
        return nullptr;
    }
    return it->second;
}

bool StepRegistry::contains(const std::string& name) const {
    return steps_.find(name) != steps_.end();
}

std::vector<std::string> StepRegistry::names() const {
    std::vector<std::string> result;
    result.reserve(steps_.size());
    for (const auto& [name, _] : steps_) {
        result.push_back(name);
    }
    std::sort(result.begin(), result.end());
    return result;
}
