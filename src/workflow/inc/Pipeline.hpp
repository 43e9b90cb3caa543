#pragma once

#include "Step.hpp"
#include <string>
#include <vector>

// Ordered steps for one stage, resolved fresh for every run
struct Pipeline {
    std::string name;
    std::vector<StepPtr> steps;

    bool empty() const { return steps.empty(); }
    size_t size() const { return steps.size(); }
};
