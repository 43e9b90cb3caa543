#pragma once

#include "CloudClient.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

class SandboxError : public std::runtime_error {
public:
    explicit SandboxError(const std::string& message) : std::runtime_error(message) {}
};

// In-memory cloud used for local runs and tests.
//
// Resources track their parents; deleting a resource that still has children
// fails with DependencyViolation, as the real APIs do. Asynchronous resources
// stay Pending for `latency_polls` state queries. Any operation can be made to
// fail by name ("aws:create_subnet", "azure:delete_resource_group").
class SandboxCloud {
public:
    struct Resource {
        std::string kind;
        std::string id;
        std::vector<std::string> parents;
        std::map<std::string, std::string> attributes;
        size_t pending_polls = 0;
    };

    explicit SandboxCloud(size_t latency_polls = 0, std::vector<std::string> fail_on = {});

    // Counts the call, then throws if the operation is set to fail
    void begin(const std::string& operation);

    void fail_on(const std::string& operation, const std::string& message = "");
    void clear_failures();
    size_t calls(const std::string& operation) const;

    std::string create(const std::string& kind, const std::string& id_prefix,
                       std::vector<std::string> parents = {},
                       std::map<std::string, std::string> attributes = {});
    void create_named(const std::string& kind, const std::string& id,
                      std::vector<std::string> parents = {},
                      std::map<std::string, std::string> attributes = {});
    void remove(const std::string& kind, const std::string& id);

    void add_parent(const std::string& id, const std::string& parent);
    void remove_parent(const std::string& id, const std::string& parent);
    void set_attribute(const std::string& id, const std::string& key, const std::string& value);

    ResourceState poll(const std::string& kind, const std::string& id);

    bool exists(const std::string& id) const;
    std::optional<Resource> get(const std::string& id) const;
    size_t count(const std::string& kind) const;
    size_t total() const;

    std::string find_image(const std::string& region, const std::string& name) const;
    std::vector<std::string> availability_zones(const std::string& region) const;

private:
    Resource& require(const std::string& kind, const std::string& id);

    mutable std::mutex mutex_;
    size_t latency_polls_;
    size_t next_id_ = 1;
    std::map<std::string, Resource> resources_;
    std::map<std::string, std::string> failures_;   // operation -> message
    std::map<std::string, size_t> calls_;
};

class SandboxClientFactory : public CloudClientFactory {
public:
    explicit SandboxClientFactory(std::shared_ptr<SandboxCloud> cloud);

    std::unique_ptr<AwsClient> aws(const AwsConfig& config) const override;
    std::unique_ptr<AzureClient> azure(const AzureConfig& config) const override;

    const std::shared_ptr<SandboxCloud>& cloud() const { return cloud_; }

private:
    std::shared_ptr<SandboxCloud> cloud_;
};
