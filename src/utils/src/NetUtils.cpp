#include "NetUtils.hpp"
#include <stdexcept>

namespace NetUtils {

namespace {

// Exactly four dot-separated decimal octets; empty fields are rejected
uint32_t parse_ipv4(const std::string& text) {
    uint32_t address = 0;
    size_t octets = 0;
    size_t begin = 0;

    while (true) {
        const size_t dot = text.find('.', begin);
        const std::string octet = text.substr(begin, dot == std::string::npos ? std::string::npos : dot - begin);

        if (octet.empty() || octet.size() > 3 ||
            octet.find_first_not_of("0123456789") != std::string::npos) {
            throw std::invalid_argument("Invalid IPv4 address: " + text);
        }
        const int value = std::stoi(octet);
        if (value > 255 || ++octets > 4) {
            throw std::invalid_argument("Invalid IPv4 address: " + text);
        }
        address = (address << 8) | static_cast<uint32_t>(value);

        if (dot == std::string::npos) {
            break;
        }
        begin = dot + 1;
    }

    if (octets != 4) {
        throw std::invalid_argument("Invalid IPv4 address: " + text);
    }
    return address;
}

uint32_t mask_for(int prefix) {
    return prefix == 0 ? 0u : ~0u << (32 - prefix);
}

}

Cidr parse_cidr(const std::string& text) {
    const size_t slash = text.find('/');
    if (slash == std::string::npos) {
        throw std::invalid_argument("CIDR missing prefix length: " + text);
    }

    Cidr cidr;
    const std::string prefix_str = text.substr(slash + 1);
    try {
        size_t consumed = 0;
        cidr.prefix = std::stoi(prefix_str, &consumed);
        if (consumed != prefix_str.size()) {
            throw std::invalid_argument(prefix_str);
        }
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid CIDR prefix length: " + text);
    }
    if (cidr.prefix < 0 || cidr.prefix > 32) {
        throw std::invalid_argument("CIDR prefix length out of range: " + text);
    }

    cidr.network = parse_ipv4(text.substr(0, slash)) & mask_for(cidr.prefix);
    return cidr;
}

std::string to_string(const Cidr& cidr) {
    return std::to_string((cidr.network >> 24) & 0xff) + "." +
           std::to_string((cidr.network >> 16) & 0xff) + "." +
           std::to_string((cidr.network >> 8) & 0xff) + "." +
           std::to_string(cidr.network & 0xff) + "/" +
           std::to_string(cidr.prefix);
}

std::vector<std::string> carve_subnets(const std::string& range, size_t count, int new_prefix) {
    const Cidr base = parse_cidr(range);
    if (new_prefix < base.prefix || new_prefix > 32) {
        throw std::invalid_argument("Subnet prefix /" + std::to_string(new_prefix) +
                                    " does not fit in " + range);
    }

    const uint64_t available = uint64_t{1} << (new_prefix - base.prefix);
    if (count > available) {
        throw std::invalid_argument("Cannot carve " + std::to_string(count) + " /" +
                                    std::to_string(new_prefix) + " subnets out of " + range);
    }

    std::vector<std::string> subnets;
    const uint64_t block = uint64_t{1} << (32 - new_prefix);
    for (size_t i = 0; i < count; ++i) {
        Cidr subnet{static_cast<uint32_t>(base.network + i * block), new_prefix};
        subnets.push_back(to_string(subnet));
    }
    return subnets;
}

int subnet_prefix_for(const std::string& range, size_t count) {
    const Cidr base = parse_cidr(range);

    int bits = 0;
    while ((size_t{1} << bits) < count) {
        ++bits;
    }

    const int needed = base.prefix + bits;
    if (needed > 32) {
        throw std::invalid_argument("Range " + range + " too small for " + std::to_string(count) + " subnets");
    }
    return needed < 24 ? 24 : needed;
}

}
