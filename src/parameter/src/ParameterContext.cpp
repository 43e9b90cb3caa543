#include "ParameterContext.hpp"
#include "LogUtils.hpp"
#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <stdexcept>

#ifndef KUBEPROV_VERSION
#define KUBEPROV_VERSION "0.1.0"
#endif

#ifndef KUBEPROV_BUILD_TARGET
#define KUBEPROV_BUILD_TARGET "unknown"
#endif

ParameterContext::ParameterContext() {}

// Define static member variable
const std::vector<ParameterContext::CommandOption> ParameterContext::valid_options = {
    {"--config-file", 'c', "Specify the run file (YAML) describing the clusters", true},
    {"--provider", 'p', "Provision a single cluster on this provider (aws, azure, gce, digitalocean)", true},
    {"--cluster", 'n', "Cluster name; with --provider defines an ad-hoc cluster, alone selects one", true},
    {"--concurrency", 'j', "Number of clusters provisioned in parallel", true},
    {"--dry-run", 'd', "Print the steps that would run without calling any cloud API", false},
    {"--list-steps", 'l', "List registered steps and provider pipelines", false},
    {"--verbose", 'v', "Increase output verbosity", false},
    {"--version", 'V', "Output version information", false},
    {"--help", '?', "Display this help message", false}
};

void ParameterContext::show_help() {
    std::cout << "Usage: kubeprov [OPTIONS]...\n\n"
              << "Options:\n";

    // Calculate the longest option length for alignment
    size_t max_opt_len = 0;
    for (const auto& opt : valid_options) {
        size_t total_len = 4 + opt.long_opt.length(); // 4 = length of "-X, "
        max_opt_len = std::max(max_opt_len, total_len);
    }

    // Reserve fixed space for VALUE
    const size_t value_width = 8;
    const size_t desc_offset = max_opt_len + value_width;

    for (const auto& opt : valid_options) {
        std::cout << "  -" << opt.short_opt << ", " << opt.long_opt;

        size_t current_len = 4 + opt.long_opt.length();
        if (opt.requires_value) {
            std::cout << "=VALUE";
            current_len += 6;
        }

        size_t padding = desc_offset - current_len;
        std::cout << std::string(padding, ' ');
        std::cout << opt.description << "\n";
    }

    std::cout << "\nEnvironment:\n"
              << "  KUBEPROV_AWS_ACCESS_KEY_ID, KUBEPROV_AWS_SECRET_ACCESS_KEY\n"
              << "  KUBEPROV_AZURE_CLIENT_ID, KUBEPROV_AZURE_CLIENT_SECRET\n"
              << "  KUBEPROV_DO_TOKEN, KUBEPROV_CONCURRENCY\n"
              << "\nExamples:\n"
              << "  kubeprov --config-file=conf/clusters.yaml\n"
              << "  kubeprov -p aws -n demo --dry-run\n\n";
}

void ParameterContext::show_version() {
    std::cout << "kubeprov version: " << KUBEPROV_VERSION << std::endl;
    std::cout << "build: " << KUBEPROV_BUILD_TARGET << std::endl;
}

int ParameterContext::parse_concurrency(const std::string& value, const std::string& source) {
    int concurrency = 0;
    try {
        size_t pos = 0;
        concurrency = std::stoi(value, &pos);
        if (pos != value.size()) {
            throw std::invalid_argument(value);
        }
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid concurrency in " + source + ": " + value);
    }
    if (concurrency <= 0) {
        throw std::runtime_error("Concurrency must be greater than 0 in " + source + ": " + value);
    }
    return concurrency;
}

void ParameterContext::parse_global(const YAML::Node& global_yaml) {
    config_data.global = global_yaml.as<GlobalConfig>();
}

void ParameterContext::parse_backend(const YAML::Node& backend_yaml) {
    config_data.backend = backend_yaml.as<BackendConfig>();
}

void ParameterContext::parse_clusters(const YAML::Node& clusters_yaml) {
    if (!clusters_yaml.IsMap()) {
        throw std::runtime_error("clusters must be a mapping of cluster key to cluster settings");
    }

    for (const auto& cluster_node : clusters_yaml) {
        ClusterJob job = cluster_node.second.as<ClusterJob>();
        job.key = cluster_node.first.as<std::string>();
        prepare_job(job);
        config_data.jobs.push_back(std::move(job));
    }
}

void ParameterContext::prepare_job(ClusterJob& job) {
    if (job.name.empty()) {
        job.name = job.key;
    }
    if (job.steps.empty()) {
        job.steps = {DEFAULT_STEP};
    }
    job.config.cluster_id = job.key;
    job.config.cluster_name = job.name;
}

void ParameterContext::merge_yaml(const YAML::Node& config) {
    static const std::set<std::string> valid_keys = {"global", "concurrency", "backend", "clusters"};
    YAML::check_unknown_keys(config, valid_keys, "run file");

    if (config["global"]) {
        parse_global(config["global"]);
    }

    if (config["concurrency"]) {
        config_data.concurrency = parse_concurrency(config["concurrency"].as<std::string>(), "run file");
    }

    if (config["backend"]) {
        parse_backend(config["backend"]);
    }

    if (config["clusters"]) {
        parse_clusters(config["clusters"]);
    }
}

void ParameterContext::merge_yaml(const std::string& file_path) {
    try {
        YAML::Node config = YAML::LoadFile(file_path);
        merge_yaml(config);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to parse YAML file '" + file_path + "': " + e.what());
    } catch (const std::exception& e) {
        throw std::runtime_error("Error processing YAML file '" + file_path + "': " + e.what());
    }
}

void ParameterContext::merge_yaml() {
    if (cli_params.count("--config-file")) {
        merge_yaml(cli_params["--config-file"]);
    }
}

void ParameterContext::parse_commandline(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        std::string key, value;

        // Handle long option format (--key=value)
        if (arg.substr(0, 2) == "--") {
            size_t pos = arg.find('=');
            if (pos != std::string::npos) {
                key = arg.substr(0, pos);
                value = arg.substr(pos + 1);
            } else {
                key = arg;
                value = "";
            }

            auto it = std::find_if(valid_options.begin(), valid_options.end(),
                [&key](const CommandOption& opt) { return opt.long_opt == key; });

            if (it == valid_options.end()) {
                throw std::runtime_error("Unknown option: " + key);
            }

            if (it->requires_value) {
                if (pos == std::string::npos) {
                    // Try to get value from next argv
                    if (i + 1 >= argc) {
                        throw std::runtime_error("Option requires a value: " + key);
                    }
                    value = argv[++i];
                }
            } else if (pos != std::string::npos) {
                throw std::runtime_error("Option does not take a value: " + key);
            }

            cli_params[key] = value;
        }
        // Handle short option format (-k value)
        else if (arg.size() > 1 && arg[0] == '-') {
            if (arg.length() != 2) {
                throw std::runtime_error("Invalid short option format '" + arg + "'. Must be single character after '-'");
            }

            char short_opt = arg[1];
            auto it = std::find_if(valid_options.begin(), valid_options.end(),
                [short_opt](const CommandOption& opt) { return opt.short_opt == short_opt; });

            if (it == valid_options.end()) {
                throw std::runtime_error("Unknown option: " + arg);
            }

            key = it->long_opt;
            if (it->requires_value) {
                if (i + 1 >= argc) {
                    throw std::runtime_error("Option requires a value: " + key);
                }
                value = argv[++i];
            }

            cli_params[key] = value;
        } else {
            throw std::runtime_error("Unexpected argument: " + arg);
        }
    }
}

void ParameterContext::merge_commandline(int argc, char* argv[]) {
    parse_commandline(argc, argv);
    merge_commandline();
}

void ParameterContext::merge_commandline() {
    auto& global = config_data.global;

    if (cli_params.count("--verbose")) {
        global.verbose = true;
    }
    if (cli_params.count("--dry-run")) {
        global.dry_run = true;
    }
    if (cli_params.count("--concurrency")) {
        config_data.concurrency = parse_concurrency(cli_params["--concurrency"], "--concurrency");
    }

    select_commandline_job();
}

void ParameterContext::select_commandline_job() {
    const bool has_provider = cli_params.count("--provider") > 0;
    const bool has_cluster = cli_params.count("--cluster") > 0;
    if (!has_provider && !has_cluster) {
        return;
    }
    if (has_provider && !has_cluster) {
        throw std::runtime_error("--provider requires --cluster");
    }

    const std::string cluster = cli_params["--cluster"];
    if (cluster.empty()) {
        throw std::runtime_error("--cluster must not be empty");
    }

    auto it = std::find_if(config_data.jobs.begin(), config_data.jobs.end(),
        [&cluster](const ClusterJob& job) { return job.key == cluster; });

    ClusterJob job;
    if (it != config_data.jobs.end()) {
        job = *it;
    } else if (has_provider) {
        job.key = cluster;
        job.name = cluster;
    } else {
        throw std::runtime_error("Cluster not found in run file: " + cluster);
    }

    if (has_provider) {
        job.config.provider = parse_cloud_provider(cli_params["--provider"]);
    }
    prepare_job(job);

    config_data.jobs.clear();
    config_data.jobs.push_back(std::move(job));
}

void ParameterContext::merge_environment_vars() {
    auto env = [](const char* name) -> std::string {
        const char* value = std::getenv(name);
        return value ? value : "";
    };

    const std::string aws_key_id = env("KUBEPROV_AWS_ACCESS_KEY_ID");
    const std::string aws_secret = env("KUBEPROV_AWS_SECRET_ACCESS_KEY");
    const std::string azure_client_id = env("KUBEPROV_AZURE_CLIENT_ID");
    const std::string azure_client_secret = env("KUBEPROV_AZURE_CLIENT_SECRET");
    const std::string do_token = env("KUBEPROV_DO_TOKEN");

    // Credentials only fill what the run file left empty
    auto fill = [](std::string& target, const std::string& value) {
        if (target.empty() && !value.empty()) target = value;
    };

    for (auto& job : config_data.jobs) {
        auto& cfg = job.config;
        fill(cfg.aws.access_key_id, aws_key_id);
        fill(cfg.aws.secret_access_key, aws_secret);
        fill(cfg.azure.client_id, azure_client_id);
        fill(cfg.azure.client_secret, azure_client_secret);
        fill(cfg.digitalocean.access_token, do_token);
    }

    const std::string concurrency = env("KUBEPROV_CONCURRENCY");
    if (!concurrency.empty() && !cli_params.count("--concurrency")) {
        config_data.concurrency = parse_concurrency(concurrency, "KUBEPROV_CONCURRENCY");
    }
}

void ParameterContext::validate() {
    if (config_data.jobs.empty()) {
        throw std::runtime_error("No clusters to provision: use --config-file or --provider with --cluster");
    }

    std::set<std::string> keys;
    for (const auto& job : config_data.jobs) {
        if (!keys.insert(job.key).second) {
            throw std::runtime_error("Duplicate cluster key: " + job.key);
        }
    }
}

bool ParameterContext::init(int argc, char* argv[]) {
    parse_commandline(argc, argv);

    if (cli_params.count("--help")) {
        show_help();
        return false;
    } else if (cli_params.count("--version")) {
        show_version();
        return false;
    }

    // Environment only fills values neither the run file nor the command line set,
    // so it is merged last to also reach an ad-hoc --provider cluster
    merge_yaml();
    merge_commandline();
    merge_environment_vars();

    if (!list_steps_requested()) {
        validate();
    }

    LogUtils::debug("Loaded {} cluster(s), concurrency {}", config_data.jobs.size(), config_data.concurrency);
    return true;
}

const ConfigData& ParameterContext::get_config_data() const {
    return config_data;
}

const GlobalConfig& ParameterContext::get_global_config() const {
    return config_data.global;
}
