#include "SandboxCloud.hpp"

namespace {

class SandboxAwsClient : public AwsClient {
public:
    SandboxAwsClient(std::shared_ptr<SandboxCloud> cloud, const AwsConfig& config)
        : cloud_(std::move(cloud)), region_(config.region) {
        if (config.access_key_id.empty() || config.secret_access_key.empty()) {
            throw SandboxError("AuthFailure: AWS credentials are missing");
        }
    }

    std::string find_image(const std::string& name) override {
        cloud_->begin("aws:find_image");
        return cloud_->find_image(region_, name);
    }

    std::vector<std::string> availability_zones() override {
        cloud_->begin("aws:availability_zones");
        return cloud_->availability_zones(region_);
    }

    std::string create_vpc(const std::string& cidr) override {
        cloud_->begin("aws:create_vpc");
        return cloud_->create("vpc", "vpc", {}, {{"cidr", cidr}, {"region", region_}});
    }

    ResourceState vpc_state(const std::string& vpc_id) override {
        cloud_->begin("aws:vpc_state");
        return cloud_->poll("vpc", vpc_id);
    }

    bool vpc_exists(const std::string& vpc_id) override {
        cloud_->begin("aws:vpc_exists");
        auto resource = cloud_->get(vpc_id);
        return resource && resource->kind == "vpc";
    }

    void delete_vpc(const std::string& vpc_id) override {
        cloud_->begin("aws:delete_vpc");
        cloud_->remove("vpc", vpc_id);
    }

    std::string create_security_group(const std::string& vpc_id, const std::string& name,
                                      const std::string& description) override {
        cloud_->begin("aws:create_security_group");
        return cloud_->create("security-group", "sg", {vpc_id}, {{"name", name}, {"description", description}});
    }

    void authorize_ingress(const std::string& group_id, const std::string& protocol,
                           int from_port, int to_port, const std::string& source) override {
        cloud_->begin("aws:authorize_ingress");
        cloud_->set_attribute(group_id,
                              "ingress:" + protocol + ":" + std::to_string(from_port) + "-" + std::to_string(to_port)
                                  + ":" + source,
                              "allow");
    }

    void delete_security_group(const std::string& group_id) override {
        cloud_->begin("aws:delete_security_group");
        cloud_->remove("security-group", group_id);
    }

    std::string create_instance_profile(const std::string& name, const std::string& role) override {
        cloud_->begin("aws:create_instance_profile");
        cloud_->create_named("instance-profile", name, {}, {{"role", role}});
        return name;
    }

    void delete_instance_profile(const std::string& name) override {
        cloud_->begin("aws:delete_instance_profile");
        cloud_->remove("instance-profile", name);
    }

    std::string import_key_pair(const std::string& name, const std::string& public_key) override {
        cloud_->begin("aws:import_key_pair");
        if (public_key.rfind("ssh-", 0) != 0 && public_key.rfind("ecdsa-", 0) != 0) {
            throw SandboxError("InvalidKey.Format: key is not in valid OpenSSH public key format");
        }
        cloud_->create_named("key-pair", name, {}, {{"public_key", public_key}});
        return name;
    }

    void delete_key_pair(const std::string& name) override {
        cloud_->begin("aws:delete_key_pair");
        cloud_->remove("key-pair", name);
    }

    std::string create_internet_gateway() override {
        cloud_->begin("aws:create_internet_gateway");
        return cloud_->create("internet-gateway", "igw");
    }

    void attach_internet_gateway(const std::string& gateway_id, const std::string& vpc_id) override {
        cloud_->begin("aws:attach_internet_gateway");
        cloud_->add_parent(gateway_id, vpc_id);
    }

    void detach_internet_gateway(const std::string& gateway_id, const std::string& vpc_id) override {
        cloud_->begin("aws:detach_internet_gateway");
        cloud_->remove_parent(gateway_id, vpc_id);
    }

    void delete_internet_gateway(const std::string& gateway_id) override {
        cloud_->begin("aws:delete_internet_gateway");
        cloud_->remove("internet-gateway", gateway_id);
    }

    std::string create_subnet(const std::string& vpc_id, const std::string& cidr,
                              const std::string& zone) override {
        cloud_->begin("aws:create_subnet");
        return cloud_->create("subnet", "subnet", {vpc_id}, {{"cidr", cidr}, {"zone", zone}});
    }

    void delete_subnet(const std::string& subnet_id) override {
        cloud_->begin("aws:delete_subnet");
        cloud_->remove("subnet", subnet_id);
    }

    std::string create_route_table(const std::string& vpc_id) override {
        cloud_->begin("aws:create_route_table");
        return cloud_->create("route-table", "rtb", {vpc_id});
    }

    void create_route(const std::string& route_table_id, const std::string& destination_cidr,
                      const std::string& gateway_id) override {
        cloud_->begin("aws:create_route");
        if (!cloud_->exists(gateway_id)) {
            throw SandboxError("InvalidGatewayID.NotFound: " + gateway_id);
        }
        cloud_->set_attribute(route_table_id, "route:" + destination_cidr, gateway_id);
    }

    void delete_route_table(const std::string& route_table_id) override {
        cloud_->begin("aws:delete_route_table");
        cloud_->remove("route-table", route_table_id);
    }

    std::string associate_route_table(const std::string& route_table_id, const std::string& subnet_id) override {
        cloud_->begin("aws:associate_route_table");
        return cloud_->create("route-table-association", "rtbassoc", {route_table_id, subnet_id});
    }

    void disassociate_route_table(const std::string& association_id) override {
        cloud_->begin("aws:disassociate_route_table");
        cloud_->remove("route-table-association", association_id);
    }

private:
    std::shared_ptr<SandboxCloud> cloud_;
    std::string region_;
};

class SandboxAzureClient : public AzureClient {
public:
    SandboxAzureClient(std::shared_ptr<SandboxCloud> cloud, const AzureConfig& config)
        : cloud_(std::move(cloud)) {
        if (config.subscription_id.empty() || config.client_id.empty() || config.client_secret.empty()) {
            throw SandboxError("AuthorizationFailed: Azure service principal credentials are missing");
        }
    }

    void create_resource_group(const std::string& name, const std::string& location) override {
        cloud_->begin("azure:create_resource_group");
        cloud_->create_named("resource-group", group_id(name), {}, {{"location", location}});
    }

    bool resource_group_exists(const std::string& name) override {
        cloud_->begin("azure:resource_group_exists");
        return cloud_->exists(group_id(name));
    }

    void delete_resource_group(const std::string& name) override {
        cloud_->begin("azure:delete_resource_group");
        cloud_->remove("resource-group", group_id(name));
    }

    void create_virtual_network(const std::string& group, const std::string& name,
                                const std::string& location, const std::string& cidr) override {
        cloud_->begin("azure:create_virtual_network");
        cloud_->create_named("virtual-network", vnet_id(group, name), {group_id(group)},
                             {{"location", location}, {"cidr", cidr}});
    }

    ResourceState virtual_network_state(const std::string& group, const std::string& name) override {
        cloud_->begin("azure:virtual_network_state");
        return cloud_->poll("virtual-network", vnet_id(group, name));
    }

    void delete_virtual_network(const std::string& group, const std::string& name) override {
        cloud_->begin("azure:delete_virtual_network");
        cloud_->remove("virtual-network", vnet_id(group, name));
    }

private:
    static std::string group_id(const std::string& name) {
        return "/resourceGroups/" + name;
    }

    static std::string vnet_id(const std::string& group, const std::string& name) {
        return group_id(group) + "/virtualNetworks/" + name;
    }

    std::shared_ptr<SandboxCloud> cloud_;
};

}

SandboxClientFactory::SandboxClientFactory(std::shared_ptr<SandboxCloud> cloud) : cloud_(std::move(cloud)) {
    if (!cloud_) {
        throw std::invalid_argument("SandboxClientFactory requires a sandbox cloud");
    }
}

std::unique_ptr<AwsClient> SandboxClientFactory::aws(const AwsConfig& config) const {
    return std::make_unique<SandboxAwsClient>(cloud_, config);
}

std::unique_ptr<AzureClient> SandboxClientFactory::azure(const AzureConfig& config) const {
    return std::make_unique<SandboxAzureClient>(cloud_, config);
}
