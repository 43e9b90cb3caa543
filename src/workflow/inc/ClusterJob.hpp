#pragma once

#include "ProvisionConfig.hpp"
#include <chrono>
#include <string>
#include <vector>

// One provisioning request: a cluster, its provider settings and the steps to run
struct ClusterJob {
    std::string key;                  // Job identifier
    std::string name;                 // Cluster name
    std::vector<std::string> steps;   // Top-level step names
    std::chrono::seconds timeout{1800};
    ProvisionConfig config;           // Template copied into each run

    ClusterJob() = default;
    ClusterJob(const std::string& key,
               const std::string& name,
               const std::vector<std::string>& steps)
        : key(key), name(name), steps(steps) {}
};
