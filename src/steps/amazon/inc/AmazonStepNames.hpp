#pragma once

namespace AmazonSteps {

inline constexpr const char* FIND_AMI                 = "aws/find-ami";
inline constexpr const char* CREATE_VPC               = "aws/create-vpc";
inline constexpr const char* CREATE_SECURITY_GROUPS   = "aws/create-security-groups";
inline constexpr const char* CREATE_INSTANCE_PROFILES = "aws/create-instance-profiles";
inline constexpr const char* IMPORT_KEY_PAIR          = "aws/import-key-pair";
inline constexpr const char* CREATE_INTERNET_GATEWAY  = "aws/create-internet-gateway";
inline constexpr const char* CREATE_SUBNETS           = "aws/create-subnets";
inline constexpr const char* CREATE_ROUTE_TABLE       = "aws/create-route-table";
inline constexpr const char* ASSOCIATE_ROUTE_TABLE    = "aws/associate-route-table";

}
