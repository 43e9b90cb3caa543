#include "AssociateRouteTableStep.hpp"
#include "AmazonStepNames.hpp"

AssociateRouteTableStep::AssociateRouteTableStep(std::shared_ptr<const CloudClientFactory> clients)
    : StepBase(std::move(clients), AmazonSteps::ASSOCIATE_ROUTE_TABLE,
               "Associate the route table with the cluster subnets",
               {AmazonSteps::CREATE_SUBNETS, AmazonSteps::CREATE_ROUTE_TABLE}) {}

void AssociateRouteTableStep::apply(const ExecutionContext& ctx, std::ostream& out, ProvisionConfig& cfg) const {
    auto aws = clients().aws(cfg.aws);

    for (const auto& [zone, subnet_id] : cfg.aws.subnets) {
        ctx.check();
        if (cfg.aws.route_table_associations.count(subnet_id) > 0) {
            continue;
        }

        const std::string association_id = aws->associate_route_table(cfg.aws.route_table_id, subnet_id);
        cfg.aws.route_table_associations[subnet_id] = association_id;
        remember(cfg, association_id);
        out << "Associated " << cfg.aws.route_table_id << " with " << subnet_id << " (" << zone << ")" << std::endl;
    }
}

void AssociateRouteTableStep::revert(const ExecutionContext&, std::ostream& out, ProvisionConfig& cfg) const {
    auto& associations = cfg.aws.route_table_associations;

    std::unique_ptr<AwsClient> aws;
    for (auto it = associations.begin(); it != associations.end();) {
        if (!cfg.created(it->second)) {
            ++it;
            continue;
        }
        if (!aws) {
            aws = clients().aws(cfg.aws);
        }

        out << "Removing association " << it->second << " from " << it->first << std::endl;
        aws->disassociate_route_table(it->second);
        forget(cfg, it->second);
        it = associations.erase(it);
    }
}
