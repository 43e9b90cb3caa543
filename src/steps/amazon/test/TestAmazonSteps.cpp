#include "AmazonRegistrar.hpp"
#include "AmazonStepNames.hpp"
#include "PipelineExecutor.hpp"
#include "SandboxCloud.hpp"
#include <cassert>
#include <iostream>
#include <sstream>

namespace {

const std::vector<std::string> AWS_ORDER = {
    AmazonSteps::FIND_AMI,
    AmazonSteps::CREATE_VPC,
    AmazonSteps::CREATE_SECURITY_GROUPS,
    AmazonSteps::CREATE_INSTANCE_PROFILES,
    AmazonSteps::IMPORT_KEY_PAIR,
    AmazonSteps::CREATE_INTERNET_GATEWAY,
    AmazonSteps::CREATE_SUBNETS,
    AmazonSteps::CREATE_ROUTE_TABLE,
    AmazonSteps::ASSOCIATE_ROUTE_TABLE,
};

struct Fixture {
    std::shared_ptr<SandboxCloud> cloud;
    StepRegistry registry;
    Pipeline pipeline;

    explicit Fixture(size_t latency_polls = 1)
        : cloud(std::make_shared<SandboxCloud>(latency_polls)) {
        register_amazon_steps(registry, std::make_shared<SandboxClientFactory>(cloud));
        pipeline.name = "preProvision";
        for (const auto& name : AWS_ORDER) {
            pipeline.steps.push_back(registry.get_step(name));
        }
    }
};

ProvisionConfig make_config() {
    ProvisionConfig cfg;
    cfg.provider = CloudProvider::AWS;
    cfg.cluster_id = "c1";
    cfg.cluster_name = "demo";
    cfg.poll_interval = std::chrono::milliseconds(1);
    cfg.aws.access_key_id = "AKIATEST";
    cfg.aws.secret_access_key = "secret";
    cfg.aws.public_key = "ssh-rsa AAAAB3NzaC1yc2E demo@test";
    return cfg;
}

}

void test_full_run_and_rollback() {
    Fixture fx;
    ProvisionConfig cfg = make_config();
    std::ostringstream out;
    PipelineExecutor executor;

    RunResult result = executor.run(fx.pipeline, ExecutionContext(), out, &cfg);
    assert(result.ok());
    assert(result.completed == AWS_ORDER);

    const auto& aws = cfg.aws;
    assert(aws.image_id.rfind("ami-", 0) == 0);
    assert(aws.vpc_id.rfind("vpc-", 0) == 0);
    assert(!aws.masters_security_group_id.empty());
    assert(!aws.nodes_security_group_id.empty());
    assert(aws.masters_instance_profile == "demo-masters-profile");
    assert(aws.nodes_instance_profile == "demo-nodes-profile");
    assert(aws.key_pair_name == "demo-key");
    assert(aws.internet_gateway_id.rfind("igw-", 0) == 0);
    assert(aws.route_table_id.rfind("rtb-", 0) == 0);
    assert(aws.subnets.size() == 3);
    assert(aws.route_table_associations.size() == 3);

    assert(fx.cloud->count("vpc") == 1);
    assert(fx.cloud->count("security-group") == 2);
    assert(fx.cloud->count("instance-profile") == 2);
    assert(fx.cloud->count("subnet") == 3);
    assert(fx.cloud->count("route-table-association") == 3);
    assert(fx.cloud->get(aws.subnets.at("us-east-1a"))->attributes.at("cidr") == "10.2.0.0/24");
    assert(fx.cloud->get(aws.subnets.at("us-east-1c"))->attributes.at("cidr") == "10.2.2.0/24");
    // The VPC was polled until it left the pending state
    assert(fx.cloud->calls("aws:vpc_state") == 2);
    assert(out.str().find("Waiting for VPC") != std::string::npos);

    auto failures = executor.compensate(fx.pipeline.steps, ExecutionContext(), out, cfg);
    assert(failures.empty());
    assert(fx.cloud->total() == 0);
    assert(cfg.created_resources.empty());
    assert(cfg.aws.vpc_id.empty());
    assert(cfg.aws.subnets.empty());
    assert(cfg.aws.route_table_associations.empty());
    std::cout << "test_full_run_and_rollback passed" << std::endl;
}

// A rejected subnet creation unwinds everything created before it
void test_subnet_failure_leaves_nothing_behind() {
    Fixture fx;
    fx.cloud->fail_on("aws:create_subnet");
    ProvisionConfig cfg = make_config();
    std::ostringstream out;

    RunResult result = PipelineExecutor().run(fx.pipeline, ExecutionContext(), out, &cfg);

    assert(result.kind == ErrorKind::StepExecution);
    assert(result.failed_step == AmazonSteps::CREATE_SUBNETS);
    assert(result.message == "preProvision: aws/create-subnets: InternalFailure: aws:create_subnet rejected by sandbox");
    assert((result.rolled_back == std::vector<std::string>{
        AmazonSteps::CREATE_INTERNET_GATEWAY,
        AmazonSteps::IMPORT_KEY_PAIR,
        AmazonSteps::CREATE_INSTANCE_PROFILES,
        AmazonSteps::CREATE_SECURITY_GROUPS,
        AmazonSteps::CREATE_VPC,
        AmazonSteps::FIND_AMI}));
    assert(result.rollback_failures.empty());
    assert(fx.cloud->total() == 0);
    assert(cfg.created_resources.empty());
    std::cout << "test_subnet_failure_leaves_nothing_behind passed" << std::endl;
}

// Partial work of the failing step itself is reverted by the step
void test_failing_step_cleans_up_partial_work() {
    Fixture fx;
    fx.cloud->fail_on("aws:create_route");
    ProvisionConfig cfg = make_config();
    std::ostringstream out;

    RunResult result = PipelineExecutor().run(fx.pipeline, ExecutionContext(), out, &cfg);

    assert(result.failed_step == AmazonSteps::CREATE_ROUTE_TABLE);
    assert(fx.cloud->calls("aws:delete_route_table") == 1);
    assert(fx.cloud->count("route-table") == 0);
    assert(fx.cloud->total() == 0);
    std::cout << "test_failing_step_cleans_up_partial_work passed" << std::endl;
}

// A preset VPC is used but never deleted
void test_existing_vpc_is_kept() {
    Fixture fx;
    const std::string vpc = fx.cloud->create("vpc", "vpc", {}, {{"cidr", "10.2.0.0/16"}});
    fx.cloud->fail_on("aws:associate_route_table");

    ProvisionConfig cfg = make_config();
    cfg.aws.vpc_id = vpc;
    std::ostringstream out;

    RunResult result = PipelineExecutor().run(fx.pipeline, ExecutionContext(), out, &cfg);

    assert(result.failed_step == AmazonSteps::ASSOCIATE_ROUTE_TABLE);
    assert(fx.cloud->calls("aws:create_vpc") == 0);
    assert(fx.cloud->calls("aws:delete_vpc") == 0);
    assert(fx.cloud->total() == 1);
    assert(fx.cloud->exists(vpc));
    assert(cfg.aws.vpc_id == vpc);
    std::cout << "test_existing_vpc_is_kept passed" << std::endl;
}

void test_missing_preset_vpc() {
    Fixture fx;
    ProvisionConfig cfg = make_config();
    cfg.aws.vpc_id = "vpc-deadbeef";
    std::ostringstream out;

    RunResult result = PipelineExecutor().run(fx.pipeline, ExecutionContext(), out, &cfg);

    assert(result.failed_step == AmazonSteps::CREATE_VPC);
    assert(result.message == "preProvision: aws/create-vpc: VPC vpc-deadbeef not found in us-east-1");
    std::cout << "test_missing_preset_vpc passed" << std::endl;
}

void test_missing_public_key() {
    Fixture fx;
    ProvisionConfig cfg = make_config();
    cfg.aws.public_key.clear();
    std::ostringstream out;

    RunResult result = PipelineExecutor().run(fx.pipeline, ExecutionContext(), out, &cfg);

    assert(result.failed_step == AmazonSteps::IMPORT_KEY_PAIR);
    assert(result.message.find("public key is required") != std::string::npos);
    assert(fx.cloud->total() == 0);
    std::cout << "test_missing_public_key passed" << std::endl;
}

// Rollback of steps that never ran makes no API call and changes nothing
void test_rollback_without_run() {
    Fixture fx;
    ProvisionConfig cfg = make_config();
    cfg.aws.access_key_id.clear();
    std::ostringstream out;

    for (auto it = fx.pipeline.steps.rbegin(); it != fx.pipeline.steps.rend(); ++it) {
        (*it)->rollback(ExecutionContext(), out, cfg);
    }

    assert(fx.cloud->total() == 0);
    assert(cfg.created_resources.empty());
    assert(cfg.aws.vpc_cidr == "10.2.0.0/16");
    assert(cfg.aws.public_key == "ssh-rsa AAAAB3NzaC1yc2E demo@test");
    assert(out.str().empty());
    std::cout << "test_rollback_without_run passed" << std::endl;
}

// A deadline hit while waiting for the VPC deletes the VPC that was already requested
void test_timeout_while_waiting_for_vpc() {
    Fixture fx(1000000);
    ProvisionConfig cfg = make_config();
    cfg.poll_interval = std::chrono::milliseconds(10);
    std::ostringstream out;

    RunResult result = PipelineExecutor().run(
        fx.pipeline, ExecutionContext().with_timeout(std::chrono::milliseconds(100)), out, &cfg);

    assert(result.kind == ErrorKind::Cancelled);
    assert(result.failed_step == AmazonSteps::CREATE_VPC);
    assert(result.message == "preProvision: aws/create-vpc: deadline exceeded");
    assert(fx.cloud->count("vpc") == 0);
    assert(cfg.aws.vpc_id.empty());
    std::cout << "test_timeout_while_waiting_for_vpc passed" << std::endl;
}

void test_single_availability_zone() {
    Fixture fx;
    ProvisionConfig cfg = make_config();
    cfg.aws.availability_zone = "us-east-1b";
    cfg.aws.vpc_cidr = "10.20.0.0/16";
    std::ostringstream out;

    RunResult result = PipelineExecutor().run(fx.pipeline, ExecutionContext(), out, &cfg);

    assert(result.ok());
    assert(cfg.aws.subnets.size() == 1);
    assert(fx.cloud->get(cfg.aws.subnets.at("us-east-1b"))->attributes.at("cidr") == "10.20.0.0/24");
    std::cout << "test_single_availability_zone passed" << std::endl;
}

void test_step_metadata() {
    Fixture fx;
    assert(fx.registry.size() == AWS_ORDER.size());
    auto route_table = fx.registry.get_step(AmazonSteps::CREATE_ROUTE_TABLE);
    assert((route_table->depends() == std::vector<std::string>{
        AmazonSteps::CREATE_VPC, AmazonSteps::CREATE_INTERNET_GATEWAY}));
    assert(fx.registry.get_step(AmazonSteps::FIND_AMI)->depends().empty());
    assert(!fx.registry.get_step(AmazonSteps::CREATE_SUBNETS)->description().empty());
    std::cout << "test_step_metadata passed" << std::endl;
}

int main() {
    test_full_run_and_rollback();
    test_subnet_failure_leaves_nothing_behind();
    test_failing_step_cleans_up_partial_work();
    test_existing_vpc_is_kept();
    test_missing_preset_vpc();
    test_missing_public_key();
    test_rollback_without_run();
    test_timeout_while_waiting_for_vpc();
    test_single_availability_zone();
    test_step_metadata();

    std::cout << "All Amazon step tests passed!" << std::endl;
    return 0;
}
