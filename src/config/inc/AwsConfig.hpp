#pragma once
#include <map>
#include <string>

struct AwsConfig {
    // Credentials and placement
    std::string region = "us-east-1";
    std::string access_key_id;
    std::string secret_access_key;
    std::string availability_zone;      // empty: spread subnets over every zone of the region

    // Inputs
    std::string vpc_cidr = "10.2.0.0/16";
    std::string image_name = "ubuntu-xenial-16.04-amd64-server";
    std::string public_key;

    // Outputs, each written by exactly one step. vpc_id and image_id may be preset to reuse existing resources.
    std::string image_id;
    std::string vpc_id;
    std::string masters_security_group_id;
    std::string nodes_security_group_id;
    std::string masters_instance_profile;
    std::string nodes_instance_profile;
    std::string key_pair_name;
    std::string internet_gateway_id;
    std::string route_table_id;
    std::map<std::string, std::string> subnets;                 // zone -> subnet id
    std::map<std::string, std::string> route_table_associations; // subnet id -> association id
};
