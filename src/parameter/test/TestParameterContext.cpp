#include "ParameterContext.hpp"
#include "ScopedEnvVar.hpp"
#include <cassert>
#include <cstdlib>
#include <iostream>
#include <vector>


static const char* RUN_FILE = R"(
global:
  verbose: false
  poll_interval_ms: 100
  fail_fast: true
concurrency: 4
backend:
  type: sandbox
  latency_polls: 2
clusters:
  prod-aws:
    name: Production
    provider: aws
    aws:
      region: eu-central-1
      access_key_id: yaml-key
      public_key: ssh-rsa AAAA prod
  staging-azure:
    provider: azure
    timeout_sec: 600
    azure:
      subscription_id: sub
)";

// Test command line parameter parsing
void test_commandline_merge() {
    ParameterContext ctx;
    const char* argv[] = {
        "dummy_program",
        "--provider=gce",
        "--cluster", "demo",
        "-j", "3",
        "-d",
        "--verbose"
    };
    ctx.merge_commandline(8, const_cast<char**>(argv));

    const auto& data = ctx.get_config_data();
    assert(data.concurrency == 3);
    assert(data.global.dry_run == true);
    assert(data.global.verbose == true);
    assert(data.jobs.size() == 1);
    assert(data.jobs[0].key == "demo");
    assert(data.jobs[0].name == "demo");
    assert(data.jobs[0].config.provider == CloudProvider::GCE);
    assert(data.jobs[0].config.cluster_id == "demo");
    assert(data.jobs[0].config.cluster_name == "demo");
    assert(data.jobs[0].steps.size() == 1);
    assert(data.jobs[0].steps[0] == ParameterContext::DEFAULT_STEP);
    std::cout << "Commandline merge test passed.\n";
}

void test_commandline_errors() {
    auto expect_error = [](std::vector<const char*> args, const std::string& message) {
        ParameterContext ctx;
        bool threw = false;
        try {
            ctx.merge_commandline(static_cast<int>(args.size()), const_cast<char**>(args.data()));
        } catch (const std::runtime_error& e) {
            threw = std::string(e.what()).find(message) != std::string::npos;
        }
        (void)threw;
        assert(threw);
    };

    expect_error({"prog", "--region=us"}, "Unknown option: --region");
    expect_error({"prog", "-x"}, "Unknown option: -x");
    expect_error({"prog", "--config-file"}, "Option requires a value");
    expect_error({"prog", "--dry-run=yes"}, "Option does not take a value");
    expect_error({"prog", "-p", "aws"}, "--provider requires --cluster");
    expect_error({"prog", "-j", "0"}, "Concurrency must be greater than 0");
    expect_error({"prog", "-j", "many"}, "Invalid concurrency");
    expect_error({"prog", "-p", "openstack", "-n", "x"}, "unknown provider: openstack");
    std::cout << "Commandline error test passed.\n";
}

// Test YAML config merge
void test_yaml_merge() {
    ParameterContext ctx;
    ctx.merge_yaml(YAML::Load(RUN_FILE));
    const auto& data = ctx.get_config_data();

    assert(data.global.poll_interval == std::chrono::milliseconds(100));
    assert(data.global.fail_fast == true);
    assert(data.concurrency == 4);
    assert(data.backend.latency_polls == 2);

    assert(data.jobs.size() == 2);
    assert(data.jobs[0].key == "prod-aws");
    assert(data.jobs[0].name == "Production");
    assert(data.jobs[0].config.cluster_id == "prod-aws");
    assert(data.jobs[0].config.cluster_name == "Production");
    assert(data.jobs[0].config.provider == CloudProvider::AWS);
    assert(data.jobs[0].config.aws.region == "eu-central-1");
    assert(data.jobs[0].timeout == std::chrono::seconds(1800));

    assert(data.jobs[1].key == "staging-azure");
    assert(data.jobs[1].name == "staging-azure");
    assert(data.jobs[1].config.provider == CloudProvider::Azure);
    assert(data.jobs[1].timeout == std::chrono::seconds(600));
    assert(data.jobs[1].steps[0] == ParameterContext::DEFAULT_STEP);
    std::cout << "YAML merge test passed.\n";
}

// Test environment variable merge
void test_environment_merge() {
    ScopedEnvVar key("KUBEPROV_AWS_ACCESS_KEY_ID", "env-key");
    ScopedEnvVar secret("KUBEPROV_AWS_SECRET_ACCESS_KEY", "env-secret");
    ScopedEnvVar client_id("KUBEPROV_AZURE_CLIENT_ID", "env-client");
    ScopedEnvVar concurrency("KUBEPROV_CONCURRENCY", "6");

    ParameterContext ctx;
    ctx.merge_yaml(YAML::Load(RUN_FILE));
    ctx.merge_environment_vars();

    const auto& data = ctx.get_config_data();
    // Values present in the run file win over the environment
    assert(data.jobs[0].config.aws.access_key_id == "yaml-key");
    assert(data.jobs[0].config.aws.secret_access_key == "env-secret");
    assert(data.jobs[1].config.azure.client_id == "env-client");
    assert(data.concurrency == 6);
    std::cout << "Environment merge test passed.\n";
}

// CLI > env > YAML
void test_priority() {
    ScopedEnvVar concurrency("KUBEPROV_CONCURRENCY", "6");
    ScopedEnvVar key("KUBEPROV_AWS_ACCESS_KEY_ID", "env-key");
    ScopedEnvVar secret("KUBEPROV_AWS_SECRET_ACCESS_KEY", "env-secret");

    ParameterContext ctx;
    const char* argv[] = {"dummy_program", "-j", "2", "-n", "prod-aws"};
    ctx.parse_commandline(5, const_cast<char**>(argv));
    ctx.merge_yaml(YAML::Load(RUN_FILE));
    ctx.merge_commandline();
    ctx.merge_environment_vars();

    const auto& data = ctx.get_config_data();
    assert(data.concurrency == 2);
    assert(data.jobs.size() == 1);
    assert(data.jobs[0].key == "prod-aws");
    assert(data.jobs[0].config.aws.access_key_id == "yaml-key");
    assert(data.jobs[0].config.aws.secret_access_key == "env-secret");
    std::cout << "Priority test passed.\n";
}

void test_provider_overrides_selected_cluster() {
    ParameterContext ctx;
    const char* argv[] = {"dummy_program", "-p", "digitalocean", "-n", "staging-azure"};
    ctx.parse_commandline(5, const_cast<char**>(argv));
    ctx.merge_yaml(YAML::Load(RUN_FILE));
    ctx.merge_commandline();

    const auto& data = ctx.get_config_data();
    assert(data.jobs.size() == 1);
    assert(data.jobs[0].key == "staging-azure");
    assert(data.jobs[0].config.provider == CloudProvider::DigitalOcean);
    assert(data.jobs[0].timeout == std::chrono::seconds(600));
    std::cout << "Provider override test passed.\n";
}

void test_unknown_cluster_selection() {
    ParameterContext ctx;
    const char* argv[] = {"dummy_program", "-n", "missing"};
    ctx.parse_commandline(3, const_cast<char**>(argv));
    ctx.merge_yaml(YAML::Load(RUN_FILE));

    bool threw = false;
    try {
        ctx.merge_commandline();
    } catch (const std::runtime_error& e) {
        threw = std::string(e.what()) == "Cluster not found in run file: missing";
    }
    (void)threw;
    assert(threw);
    std::cout << "Unknown cluster selection test passed.\n";
}

void test_unknown_key_detection() {
    ParameterContext ctx;
    YAML::Node config = YAML::Load(R"(
concurrency: 2
jobs: {}
)");

    try {
        ctx.merge_yaml(config);
        assert(false && "Should throw on unknown key in run file");
    } catch (const std::runtime_error& e) {
        std::string msg = e.what();
        (void)msg;
        assert(msg.find("Unknown configuration key in run file: jobs") != std::string::npos);
        std::cout << "Unknown key detection test passed.\n";
    }
}

void test_nested_unknown_key_detection() {
    ParameterContext ctx;
    YAML::Node config = YAML::Load(R"(
clusters:
  demo:
    provider: azure
    azure:
      resource_group: rg
      unknown_nested: 1
)");

    try {
        ctx.merge_yaml(config);
        assert(false && "Should throw on unknown key in cluster::azure");
    } catch (const std::runtime_error& e) {
        std::string msg = e.what();
        (void)msg;
        assert(msg.find("Unknown configuration key in cluster::azure: unknown_nested") != std::string::npos);
        std::cout << "Nested unknown key detection test passed.\n";
    }
}

void test_init_requires_clusters() {
    ParameterContext ctx;
    const char* argv[] = {"dummy_program", "-v"};
    bool threw = false;
    try {
        ctx.init(2, const_cast<char**>(argv));
    } catch (const std::runtime_error& e) {
        threw = std::string(e.what()).find("No clusters to provision") != std::string::npos;
    }
    (void)threw;
    assert(threw);

    // Listing steps needs no cluster
    ParameterContext list_ctx;
    const char* list_argv[] = {"dummy_program", "--list-steps"};
    bool proceed = list_ctx.init(2, const_cast<char**>(list_argv));
    (void)proceed;
    assert(proceed);
    assert(list_ctx.list_steps_requested());
    std::cout << "Init validation test passed.\n";
}

void test_init_help() {
    ParameterContext ctx;
    const char* argv[] = {"dummy_program", "--help"};
    bool proceed = ctx.init(2, const_cast<char**>(argv));
    (void)proceed;
    assert(!proceed);
    std::cout << "Help test passed.\n";
}

int main() {
    test_commandline_merge();
    test_commandline_errors();
    test_yaml_merge();
    test_environment_merge();
    test_priority();
    test_provider_overrides_selected_cluster();
    test_unknown_cluster_selection();
    test_unknown_key_detection();
    test_nested_unknown_key_detection();
    test_init_requires_clusters();
    test_init_help();

    std::cout << "All tests passed!\n";
    return 0;
}
