#include "CreateSubnetsStep.hpp"
#include "AmazonStepNames.hpp"
#include "NetUtils.hpp"
#include <stdexcept>

CreateSubnetsStep::CreateSubnetsStep(std::shared_ptr<const CloudClientFactory> clients)
    : StepBase(std::move(clients), AmazonSteps::CREATE_SUBNETS,
               "Create one subnet per availability zone",
               {AmazonSteps::CREATE_VPC}) {}

void CreateSubnetsStep::apply(const ExecutionContext& ctx, std::ostream& out, ProvisionConfig& cfg) const {
    auto aws = clients().aws(cfg.aws);

    std::vector<std::string> zones;
    if (!cfg.aws.availability_zone.empty()) {
        zones.push_back(cfg.aws.availability_zone);
    } else {
        zones = aws->availability_zones();
    }
    if (zones.empty()) {
        throw std::runtime_error("no availability zones in region " + cfg.aws.region);
    }

    const int prefix = NetUtils::subnet_prefix_for(cfg.aws.vpc_cidr, zones.size());
    const auto cidrs = NetUtils::carve_subnets(cfg.aws.vpc_cidr, zones.size(), prefix);

    for (size_t i = 0; i < zones.size(); ++i) {
        ctx.check();
        if (cfg.aws.subnets.count(zones[i]) > 0) {
            continue;
        }

        const std::string subnet_id = aws->create_subnet(cfg.aws.vpc_id, cidrs[i], zones[i]);
        cfg.aws.subnets[zones[i]] = subnet_id;
        remember(cfg, subnet_id);
        out << "Created subnet " << subnet_id << " (" << cidrs[i] << ") in " << zones[i] << std::endl;
    }
}

void CreateSubnetsStep::revert(const ExecutionContext&, std::ostream& out, ProvisionConfig& cfg) const {
    std::unique_ptr<AwsClient> aws;
    for (auto it = cfg.aws.subnets.begin(); it != cfg.aws.subnets.end();) {
        const std::string subnet_id = it->second;
        if (!cfg.created(subnet_id)) {
            ++it;
            continue;
        }
        if (!aws) {
            aws = clients().aws(cfg.aws);
        }

        out << "Deleting subnet " << subnet_id << " in " << it->first << std::endl;
        aws->delete_subnet(subnet_id);
        forget(cfg, subnet_id);
        it = cfg.aws.subnets.erase(it);
    }
}
