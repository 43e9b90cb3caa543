#include "CreateRouteTableStep.hpp"
#include "AmazonStepNames.hpp"

CreateRouteTableStep::CreateRouteTableStep(std::shared_ptr<const CloudClientFactory> clients)
    : StepBase(std::move(clients), AmazonSteps::CREATE_ROUTE_TABLE,
               "Create the route table with a default route",
               {AmazonSteps::CREATE_VPC, AmazonSteps::CREATE_INTERNET_GATEWAY}) {}

void CreateRouteTableStep::apply(const ExecutionContext&, std::ostream& out, ProvisionConfig& cfg) const {
    auto aws = clients().aws(cfg.aws);

    cfg.aws.route_table_id = aws->create_route_table(cfg.aws.vpc_id);
    remember(cfg, cfg.aws.route_table_id);
    out << "Created route table " << cfg.aws.route_table_id << std::endl;

    aws->create_route(cfg.aws.route_table_id, "0.0.0.0/0", cfg.aws.internet_gateway_id);
    out << "Added default route via " << cfg.aws.internet_gateway_id << std::endl;
}

void CreateRouteTableStep::revert(const ExecutionContext&, std::ostream& out, ProvisionConfig& cfg) const {
    if (!cfg.created(cfg.aws.route_table_id)) {
        return;
    }

    auto aws = clients().aws(cfg.aws);
    out << "Deleting route table " << cfg.aws.route_table_id << std::endl;
    aws->delete_route_table(cfg.aws.route_table_id);
    forget(cfg, cfg.aws.route_table_id);
    cfg.aws.route_table_id.clear();
}
