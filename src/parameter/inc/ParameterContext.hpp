#pragma once

#include "ConfigParser.hpp"
#include "ConfigData.hpp"

#include <unordered_map>
#include <vector>
#include <string>


// Builds the run configuration from the YAML run file, KUBEPROV_* environment
// variables and the command line. Precedence: CLI > env > YAML > defaults.
class ParameterContext {
public:
    static constexpr const char* DEFAULT_STEP = "preProvision";

    ParameterContext();

    // false when the invocation was fully handled (--help, --version)
    bool init(int argc, char* argv[]);
    void show_help();
    void show_version();

    // Merge parameter sources
    void parse_commandline(int argc, char* argv[]);
    void merge_commandline();
    void merge_commandline(int argc, char* argv[]);
    void merge_environment_vars();
    void merge_yaml(const YAML::Node& config);
    void merge_yaml(const std::string& file_path);
    void merge_yaml();

    bool has_option(const std::string& long_opt) const { return cli_params.count(long_opt) > 0; }
    bool list_steps_requested() const { return has_option("--list-steps"); }

    const ConfigData& get_config_data() const;
    const GlobalConfig& get_global_config() const;

private:
    ConfigData config_data;

    // Command line storage
    std::unordered_map<std::string, std::string> cli_params;

    void parse_global(const YAML::Node& global_yaml);
    void parse_backend(const YAML::Node& backend_yaml);
    void parse_clusters(const YAML::Node& clusters_yaml);
    void select_commandline_job();
    void prepare_job(ClusterJob& job);
    void validate();

    static int parse_concurrency(const std::string& value, const std::string& source);

private:
    // Command option structure definition
    struct CommandOption {
        std::string long_opt;    // Long option (e.g. "--provider")
        char short_opt;          // Short option (e.g. 'p')
        std::string description; // Option description
        bool requires_value;     // Whether value is required
    };

    // List of valid command options
    static const std::vector<CommandOption> valid_options;
};
