#include "SandboxCloud.hpp"
#include <algorithm>
#include <cstdio>
#include <functional>

namespace {

const std::map<std::string, std::vector<std::string>> SANDBOX_IMAGES = {
    {"ubuntu-xenial-16.04-amd64-server", {"ami-0a1b2c3d", "ami-1a1b2c3d"}},
    {"ubuntu-bionic-18.04-amd64-server", {"ami-0b1c2d3e", "ami-1b1c2d3e"}},
    {"debian-stretch-hvm-x86_64-gp2",    {"ami-0c1d2e3f", "ami-1c1d2e3f"}},
};

}

SandboxCloud::SandboxCloud(size_t latency_polls, std::vector<std::string> fail_on)
    : latency_polls_(latency_polls) {
    for (auto& operation : fail_on) {
        failures_[operation] = "";
    }
}

void SandboxCloud::begin(const std::string& operation) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++calls_[operation];

    auto it = failures_.find(operation);
    if (it != failures_.end()) {
        throw SandboxError(it->second.empty() ? "InternalFailure: " + operation + " rejected by sandbox"
                                              : it->second);
    }
}

void SandboxCloud::fail_on(const std::string& operation, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    failures_[operation] = message;
}

void SandboxCloud::clear_failures() {
    std::lock_guard<std::mutex> lock(mutex_);
    failures_.clear();
}

size_t SandboxCloud::calls(const std::string& operation) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = calls_.find(operation);
    return it == calls_.end() ? 0 : it->second;
}

std::string SandboxCloud::create(const std::string& kind, const std::string& id_prefix,
                                 std::vector<std::string> parents,
                                 std::map<std::string, std::string> attributes) {
    std::lock_guard<std::mutex> lock(mutex_);

    for (const auto& parent : parents) {
        if (resources_.find(parent) == resources_.end()) {
            throw SandboxError("NotFound: parent resource " + parent + " does not exist");
        }
    }

    char suffix[16];
    std::snprintf(suffix, sizeof(suffix), "%08zx", next_id_++);
    std::string id = id_prefix + "-" + suffix;

    resources_[id] = Resource{kind, id, std::move(parents), std::move(attributes), latency_polls_};
    return id;
}

void SandboxCloud::create_named(const std::string& kind, const std::string& id,
                                std::vector<std::string> parents,
                                std::map<std::string, std::string> attributes) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (resources_.find(id) != resources_.end()) {
        throw SandboxError("AlreadyExists: " + kind + " " + id);
    }
    for (const auto& parent : parents) {
        if (resources_.find(parent) == resources_.end()) {
            throw SandboxError("NotFound: parent resource " + parent + " does not exist");
        }
    }

    resources_[id] = Resource{kind, id, std::move(parents), std::move(attributes), latency_polls_};
}

void SandboxCloud::remove(const std::string& kind, const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    require(kind, id);

    for (const auto& [other_id, other] : resources_) {
        if (std::find(other.parents.begin(), other.parents.end(), id) != other.parents.end()) {
            throw SandboxError("DependencyViolation: " + kind + " " + id + " is still used by " +
                               other.kind + " " + other_id);
        }
    }
    resources_.erase(id);
}

void SandboxCloud::add_parent(const std::string& id, const std::string& parent) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = resources_.find(id);
    if (it == resources_.end() || resources_.find(parent) == resources_.end()) {
        throw SandboxError("NotFound: " + (it == resources_.end() ? id : parent));
    }
    it->second.parents.push_back(parent);
}

void SandboxCloud::remove_parent(const std::string& id, const std::string& parent) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = resources_.find(id);
    if (it == resources_.end()) {
        throw SandboxError("NotFound: " + id);
    }
    auto& parents = it->second.parents;
    auto pos = std::find(parents.begin(), parents.end(), parent);
    if (pos == parents.end()) {
        throw SandboxError("NotAttached: " + id + " is not attached to " + parent);
    }
    parents.erase(pos);
}

void SandboxCloud::set_attribute(const std::string& id, const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = resources_.find(id);
    if (it == resources_.end()) {
        throw SandboxError("NotFound: " + id);
    }
    it->second.attributes[key] = value;
}

ResourceState SandboxCloud::poll(const std::string& kind, const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    Resource& resource = require(kind, id);
    if (resource.pending_polls == 0) {
        return ResourceState::Available;
    }
    --resource.pending_polls;
    return ResourceState::Pending;
}

bool SandboxCloud::exists(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return resources_.find(id) != resources_.end();
}

std::optional<SandboxCloud::Resource> SandboxCloud::get(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = resources_.find(id);
    if (it == resources_.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t SandboxCloud::count(const std::string& kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::count_if(resources_.begin(), resources_.end(),
                         [&kind](const auto& entry) { return entry.second.kind == kind; });
}

size_t SandboxCloud::total() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return resources_.size();
}

std::string SandboxCloud::find_image(const std::string& region, const std::string& name) const {
    auto it = SANDBOX_IMAGES.find(name);
    if (it == SANDBOX_IMAGES.end()) {
        throw SandboxError("InvalidAMIName.NotFound: no image named " + name + " in " + region);
    }
    // Images differ per region, like real AMI ids
    const size_t slot = std::hash<std::string>{}(region) % it->second.size();
    return it->second[slot];
}

std::vector<std::string> SandboxCloud::availability_zones(const std::string& region) const {
    if (region.empty()) {
        throw SandboxError("InvalidParameterValue: region is required");
    }
    return {region + "a", region + "b", region + "c"};
}

SandboxCloud::Resource& SandboxCloud::require(const std::string& kind, const std::string& id) {
    auto it = resources_.find(id);
    if (it == resources_.end() || it->second.kind != kind) {
        throw SandboxError("NotFound: " + kind + " " + id + " does not exist");
    }
    return it->second;
}
