#include "AmazonRegistrar.hpp"
#include "AssociateRouteTableStep.hpp"
#include "CreateInstanceProfilesStep.hpp"
#include "CreateInternetGatewayStep.hpp"
#include "CreateRouteTableStep.hpp"
#include "CreateSecurityGroupsStep.hpp"
#include "CreateSubnetsStep.hpp"
#include "CreateVpcStep.hpp"
#include "FindAmiStep.hpp"
#include "ImportKeyPairStep.hpp"

void register_amazon_steps(StepRegistry& registry, std::shared_ptr<const CloudClientFactory> clients) {
    registry.register_step(std::make_shared<FindAmiStep>(clients));
    registry.register_step(std::make_shared<CreateVpcStep>(clients));
    registry.register_step(std::make_shared<CreateSecurityGroupsStep>(clients));
    registry.register_step(std::make_shared<CreateInstanceProfilesStep>(clients));
    registry.register_step(std::make_shared<ImportKeyPairStep>(clients));
    registry.register_step(std::make_shared<CreateInternetGatewayStep>(clients));
    registry.register_step(std::make_shared<CreateSubnetsStep>(clients));
    registry.register_step(std::make_shared<CreateRouteTableStep>(clients));
    registry.register_step(std::make_shared<AssociateRouteTableStep>(std::move(clients)));
}
