#pragma once

#include "CloudClient.hpp"
#include "ExecutionContext.hpp"
#include "ProvisionConfig.hpp"
#include "Step.hpp"
#include <chrono>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

// Common base of the cloud provider steps.
//
// run() calls apply(); if apply() throws, revert() is attempted on a detached
// context to release whatever the failed attempt already created, then the
// original error is rethrown. rollback() calls revert(). Implementations record
// every created resource in ProvisionConfig::created_resources and revert()
// only touches recorded resources.
class StepBase : public Step {
public:
    StepBase(std::shared_ptr<const CloudClientFactory> clients,
             std::string name,
             std::string description,
             std::vector<std::string> depends = {});

    void run(const ExecutionContext& ctx, std::ostream& out, ProvisionConfig& cfg) const override;
    void rollback(const ExecutionContext& ctx, std::ostream& out, ProvisionConfig& cfg) const override;

    std::string name() const override { return name_; }
    std::string description() const override { return description_; }
    std::vector<std::string> depends() const override { return depends_; }

protected:
    virtual void apply(const ExecutionContext& ctx, std::ostream& out, ProvisionConfig& cfg) const = 0;
    virtual void revert(const ExecutionContext& ctx, std::ostream& out, ProvisionConfig& cfg) const = 0;

    const CloudClientFactory& clients() const { return *clients_; }

    // Prefix for names of created resources
    static std::string resource_prefix(const ProvisionConfig& cfg);

    // Polls until `poll` reports Available, sleeping cfg.poll_interval between attempts
    template <typename Poll>
    static void await_available(const ExecutionContext& ctx, std::ostream& out, const ProvisionConfig& cfg,
                                const std::string& what, Poll&& poll) {
        while (poll() != ResourceState::Available) {
            out << "Waiting for " << what << " to become available" << std::endl;
            ctx.sleep_for(cfg.poll_interval);
        }
    }

    static void remember(ProvisionConfig& cfg, const std::string& id) { cfg.created_resources.insert(id); }
    static void forget(ProvisionConfig& cfg, const std::string& id) { cfg.created_resources.erase(id); }

private:
    std::shared_ptr<const CloudClientFactory> clients_;
    std::string name_;
    std::string description_;
    std::vector<std::string> depends_;
};
