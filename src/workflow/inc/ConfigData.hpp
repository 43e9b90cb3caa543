#pragma once

#include <vector>
#include "BackendConfig.hpp"
#include "ClusterJob.hpp"
#include "GlobalConfig.hpp"

// Top-level config
struct ConfigData {
    GlobalConfig global;
    BackendConfig backend;
    int concurrency = 1;
    std::vector<ClusterJob> jobs;
};
