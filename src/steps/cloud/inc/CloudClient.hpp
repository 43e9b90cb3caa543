#pragma once

#include "AwsConfig.hpp"
#include "AzureConfig.hpp"
#include <memory>
#include <string>
#include <vector>

enum class ResourceState {
    Pending,
    Available
};

// AWS API surface used by the provider steps. Calls throw on API errors.
class AwsClient {
public:
    virtual ~AwsClient() = default;

    virtual std::string find_image(const std::string& name) = 0;
    virtual std::vector<std::string> availability_zones() = 0;

    virtual std::string create_vpc(const std::string& cidr) = 0;
    virtual ResourceState vpc_state(const std::string& vpc_id) = 0;
    virtual bool vpc_exists(const std::string& vpc_id) = 0;
    virtual void delete_vpc(const std::string& vpc_id) = 0;

    virtual std::string create_security_group(const std::string& vpc_id, const std::string& name,
                                              const std::string& description) = 0;
    // `source` is a CIDR block or another security group id
    virtual void authorize_ingress(const std::string& group_id, const std::string& protocol,
                                   int from_port, int to_port, const std::string& source) = 0;
    virtual void delete_security_group(const std::string& group_id) = 0;

    virtual std::string create_instance_profile(const std::string& name, const std::string& role) = 0;
    virtual void delete_instance_profile(const std::string& name) = 0;

    virtual std::string import_key_pair(const std::string& name, const std::string& public_key) = 0;
    virtual void delete_key_pair(const std::string& name) = 0;

    virtual std::string create_internet_gateway() = 0;
    virtual void attach_internet_gateway(const std::string& gateway_id, const std::string& vpc_id) = 0;
    virtual void detach_internet_gateway(const std::string& gateway_id, const std::string& vpc_id) = 0;
    virtual void delete_internet_gateway(const std::string& gateway_id) = 0;

    virtual std::string create_subnet(const std::string& vpc_id, const std::string& cidr,
                                      const std::string& zone) = 0;
    virtual void delete_subnet(const std::string& subnet_id) = 0;

    virtual std::string create_route_table(const std::string& vpc_id) = 0;
    virtual void create_route(const std::string& route_table_id, const std::string& destination_cidr,
                              const std::string& gateway_id) = 0;
    virtual void delete_route_table(const std::string& route_table_id) = 0;
    virtual std::string associate_route_table(const std::string& route_table_id, const std::string& subnet_id) = 0;
    virtual void disassociate_route_table(const std::string& association_id) = 0;
};

// Azure Resource Manager surface used by the provider steps
class AzureClient {
public:
    virtual ~AzureClient() = default;

    virtual void create_resource_group(const std::string& name, const std::string& location) = 0;
    virtual bool resource_group_exists(const std::string& name) = 0;
    virtual void delete_resource_group(const std::string& name) = 0;

    // Provisioning completes asynchronously, poll virtual_network_state()
    virtual void create_virtual_network(const std::string& group, const std::string& name,
                                        const std::string& location, const std::string& cidr) = 0;
    virtual ResourceState virtual_network_state(const std::string& group, const std::string& name) = 0;
    virtual void delete_virtual_network(const std::string& group, const std::string& name) = 0;
};

// Builds API clients from per-run credentials. Shared, immutable, used concurrently.
class CloudClientFactory {
public:
    virtual ~CloudClientFactory() = default;

    virtual std::unique_ptr<AwsClient> aws(const AwsConfig& config) const = 0;
    virtual std::unique_ptr<AzureClient> azure(const AzureConfig& config) const = 0;
};
