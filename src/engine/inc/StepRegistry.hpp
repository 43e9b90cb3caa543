#pragma once

#include "Step.hpp"
#include <string>
#include <unordered_map>
#include <vector>

// Step name -> shared step instance.
// Filled once at start-up, read-only (and safe for concurrent lookups) afterwards.
class StepRegistry {
public:
    // Re-registering a name replaces the previous step
    void register_step(StepPtr step);

    // nullptr when the name was never registered
    StepPtr get_step(const std::string& name) const;

    bool contains(const std::string& name) const;
    std::vector<std::string> names() const;
    size_t size() const { return steps_.size(); }

private:
    std::unordered_map<std::string, StepPtr> steps_;
};
