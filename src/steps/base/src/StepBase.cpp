#include "StepBase.hpp"
#include "LogUtils.hpp"
#include <stdexcept>

StepBase::StepBase(std::shared_ptr<const CloudClientFactory> clients,
                   std::string name,
                   std::string description,
                   std::vector<std::string> depends)
    : clients_(std::move(clients)),
      name_(std::move(name)),
      description_(std::move(description)),
      depends_(std::move(depends)) {
    if (!clients_) {
        throw std::invalid_argument("Step " + name_ + " requires a cloud client factory");
    }
}

void StepBase::run(const ExecutionContext& ctx, std::ostream& out, ProvisionConfig& cfg) const {
    ctx.check();

    try {
        apply(ctx, out, cfg);
    } catch (const std::exception& e) {
        out << name_ << " failed: " << e.what() << std::endl;
        try {
            revert(ctx.detached(cfg.rollback_timeout), out, cfg);
        } catch (const std::exception& cleanup) {
            out << "Cleanup after failed " << name_ << " incomplete: " << cleanup.what() << std::endl;
            LogUtils::warn("Cleanup after failed step {} incomplete: {}", name_, cleanup.what());
        }
        throw;
    }
}

void StepBase::rollback(const ExecutionContext& ctx, std::ostream& out, ProvisionConfig& cfg) const {
    revert(ctx, out, cfg);
}

std::string StepBase::resource_prefix(const ProvisionConfig& cfg) {
    if (!cfg.cluster_name.empty()) return cfg.cluster_name;
    if (!cfg.cluster_id.empty()) return cfg.cluster_id;
    throw std::invalid_argument("cluster name or id is required");
}
