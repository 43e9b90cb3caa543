#pragma once

#include "AwsConfig.hpp"
#include "AzureConfig.hpp"
#include "BackendConfig.hpp"
#include "ClusterJob.hpp"
#include "DigitalOceanConfig.hpp"
#include "GceConfig.hpp"
#include "GlobalConfig.hpp"
#include "LogUtils.hpp"
#include "StringUtils.hpp"

#include <chrono>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>


namespace YAML {

    inline void check_unknown_keys(const YAML::Node& node, const std::set<std::string>& valid_keys, const std::string& context) {
        if (!node.IsMap()) {
            throw std::runtime_error("Expected a mapping for " + context);
        }
        for (auto it = node.begin(); it != node.end(); ++it) {
            std::string key = it->first.as<std::string>();
            if (valid_keys.find(key) == valid_keys.end()) {
                throw std::runtime_error("Unknown configuration key in " + context + ": " + key);
            }
        }
    }

    template<>
    struct convert<GlobalConfig> {
        static bool decode(const Node& node, GlobalConfig& rhs) {
            static const std::set<std::string> valid_keys = {
                "verbose", "dry_run", "log_dir", "log_level", "poll_interval_ms", "rollback_timeout_sec", "fail_fast"
            };
            check_unknown_keys(node, valid_keys, "global");

            if (node["verbose"]) rhs.verbose = node["verbose"].as<bool>();
            if (node["dry_run"]) rhs.dry_run = node["dry_run"].as<bool>();
            if (node["fail_fast"]) rhs.fail_fast = node["fail_fast"].as<bool>();
            if (node["log_dir"]) rhs.log_dir = node["log_dir"].as<std::string>();
            if (node["log_level"]) {
                rhs.log_level = node["log_level"].as<std::string>();
                try {
                    LogUtils::parse_level(rhs.log_level);
                } catch (const std::invalid_argument& e) {
                    throw std::runtime_error(std::string(e.what()) + " in global.");
                }
            }

            if (node["poll_interval_ms"]) {
                auto value = node["poll_interval_ms"].as<int64_t>();
                if (value <= 0) {
                    throw std::runtime_error("poll_interval_ms must be greater than 0 in global.");
                }
                rhs.poll_interval = std::chrono::milliseconds(value);
            }
            if (node["rollback_timeout_sec"]) {
                auto value = node["rollback_timeout_sec"].as<int64_t>();
                if (value <= 0) {
                    throw std::runtime_error("rollback_timeout_sec must be greater than 0 in global.");
                }
                rhs.rollback_timeout = std::chrono::seconds(value);
            }
            return true;
        }
    };

    template<>
    struct convert<BackendConfig> {
        static bool decode(const Node& node, BackendConfig& rhs) {
            static const std::set<std::string> valid_keys = {"type", "latency_polls", "fail_on"};
            check_unknown_keys(node, valid_keys, "backend");

            if (node["type"]) {
                std::string type = StringUtils::to_lower(node["type"].as<std::string>());
                if (type == "sandbox") {
                    rhs.type = BackendConfig::Type::Sandbox;
                } else {
                    throw std::runtime_error("Invalid backend type: " + type);
                }
            }
            if (node["latency_polls"]) {
                rhs.latency_polls = node["latency_polls"].as<size_t>();
            }
            if (node["fail_on"]) {
                rhs.fail_on = node["fail_on"].as<std::vector<std::string>>();
            }
            return true;
        }
    };

    template<>
    struct convert<AwsConfig> {
        static bool decode(const Node& node, AwsConfig& rhs) {
            static const std::set<std::string> valid_keys = {
                "region", "access_key_id", "secret_access_key", "availability_zone",
                "vpc_cidr", "vpc_id", "image_name", "image_id", "public_key"
            };
            check_unknown_keys(node, valid_keys, "cluster::aws");

            if (node["region"]) rhs.region = node["region"].as<std::string>();
            if (node["access_key_id"]) rhs.access_key_id = node["access_key_id"].as<std::string>();
            if (node["secret_access_key"]) rhs.secret_access_key = node["secret_access_key"].as<std::string>();
            if (node["availability_zone"]) rhs.availability_zone = node["availability_zone"].as<std::string>();
            if (node["vpc_cidr"]) rhs.vpc_cidr = node["vpc_cidr"].as<std::string>();
            if (node["vpc_id"]) rhs.vpc_id = node["vpc_id"].as<std::string>();
            if (node["image_name"]) rhs.image_name = node["image_name"].as<std::string>();
            if (node["image_id"]) rhs.image_id = node["image_id"].as<std::string>();
            if (node["public_key"]) rhs.public_key = node["public_key"].as<std::string>();

            if (rhs.region.empty()) {
                throw std::runtime_error("region must not be empty in cluster::aws.");
            }
            return true;
        }
    };

    template<>
    struct convert<AzureConfig> {
        static bool decode(const Node& node, AzureConfig& rhs) {
            static const std::set<std::string> valid_keys = {
                "tenant_id", "subscription_id", "client_id", "client_secret",
                "location", "resource_group", "vnet_cidr"
            };
            check_unknown_keys(node, valid_keys, "cluster::azure");

            if (node["tenant_id"]) rhs.tenant_id = node["tenant_id"].as<std::string>();
            if (node["subscription_id"]) rhs.subscription_id = node["subscription_id"].as<std::string>();
            if (node["client_id"]) rhs.client_id = node["client_id"].as<std::string>();
            if (node["client_secret"]) rhs.client_secret = node["client_secret"].as<std::string>();
            if (node["location"]) rhs.location = node["location"].as<std::string>();
            if (node["resource_group"]) rhs.resource_group = node["resource_group"].as<std::string>();
            if (node["vnet_cidr"]) rhs.vnet_cidr = node["vnet_cidr"].as<std::string>();
            return true;
        }
    };

    template<>
    struct convert<GceConfig> {
        static bool decode(const Node& node, GceConfig& rhs) {
            static const std::set<std::string> valid_keys = {"project_id", "service_account_file", "region"};
            check_unknown_keys(node, valid_keys, "cluster::gce");

            if (node["project_id"]) rhs.project_id = node["project_id"].as<std::string>();
            if (node["service_account_file"]) rhs.service_account_file = node["service_account_file"].as<std::string>();
            if (node["region"]) rhs.region = node["region"].as<std::string>();
            return true;
        }
    };

    template<>
    struct convert<DigitalOceanConfig> {
        static bool decode(const Node& node, DigitalOceanConfig& rhs) {
            static const std::set<std::string> valid_keys = {"access_token", "region"};
            check_unknown_keys(node, valid_keys, "cluster::digitalocean");

            if (node["access_token"]) rhs.access_token = node["access_token"].as<std::string>();
            if (node["region"]) rhs.region = node["region"].as<std::string>();
            return true;
        }
    };

    // The job key is not part of the node; the caller sets it and the cluster id
    template<>
    struct convert<ClusterJob> {
        static bool decode(const Node& node, ClusterJob& rhs) {
            static const std::set<std::string> valid_keys = {
                "name", "provider", "timeout_sec", "steps", "aws", "azure", "gce", "digitalocean"
            };
            check_unknown_keys(node, valid_keys, "cluster");

            if (node["name"]) {
                rhs.name = node["name"].as<std::string>();
            }

            if (node["provider"]) {
                rhs.config.provider = parse_cloud_provider(node["provider"].as<std::string>());
            } else {
                throw std::runtime_error("Missing required field 'provider' in cluster.");
            }

            if (node["timeout_sec"]) {
                auto value = node["timeout_sec"].as<int64_t>();
                if (value <= 0) {
                    throw std::runtime_error("timeout_sec must be greater than 0 in cluster.");
                }
                rhs.timeout = std::chrono::seconds(value);
            }

            if (node["steps"]) {
                rhs.steps = node["steps"].as<std::vector<std::string>>();
                if (rhs.steps.empty()) {
                    throw std::runtime_error("steps must not be empty in cluster.");
                }
            }

            if (node["aws"]) rhs.config.aws = node["aws"].as<AwsConfig>();
            if (node["azure"]) rhs.config.azure = node["azure"].as<AzureConfig>();
            if (node["gce"]) rhs.config.gce = node["gce"].as<GceConfig>();
            if (node["digitalocean"]) rhs.config.digitalocean = node["digitalocean"].as<DigitalOceanConfig>();
            return true;
        }
    };

}
