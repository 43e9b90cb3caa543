#pragma once

#include "AwsConfig.hpp"
#include "AzureConfig.hpp"
#include "CloudProvider.hpp"
#include "DigitalOceanConfig.hpp"
#include "GceConfig.hpp"
#include <chrono>
#include <set>
#include <string>

// Mutable state threaded through every step of one provisioning run.
// Steps read fields written by earlier steps and only write the fields they own.
struct ProvisionConfig {
    CloudProvider provider = CloudProvider::AWS;
    std::string cluster_id;
    std::string cluster_name;

    AwsConfig aws;
    AzureConfig azure;
    GceConfig gce;
    DigitalOceanConfig digitalocean;

    // Identifiers of cloud resources created by this run; rollback only removes these
    std::set<std::string> created_resources;

    std::chrono::milliseconds poll_interval{2000};

    // Bound on undoing a failed step's own partial work
    std::chrono::seconds rollback_timeout{600};

    bool created(const std::string& id) const {
        return !id.empty() && created_resources.count(id) > 0;
    }
};
