#include "address_utils.hpp"
#include <arpa/inet.h>
#include <regex>
#include <stdexcept>

namespace routecompose {

std::string Ipv4Prefix::address() const {
    return AddressUtils::formatAddress(network);
}

std::string Ipv4Prefix::toString() const {
    return address() + "/" + std::to_string(prefix_length);
}

uint32_t AddressUtils::maskBits(int prefix_length) {
    if (prefix_length <= 0) {
        return 0;
    }
    if (prefix_length >= 32) {
        return ~0U;
    }
    return ~0U << (32 - prefix_length);
}

std::optional<uint32_t> AddressUtils::parseAddress(const std::string& text) {
    // inet_pton only accepts the four-part dotted-decimal form, unlike
    // inet_aton which also takes "10.1" or hexadecimal parts
    struct in_addr addr;
    if (text.empty() || inet_pton(AF_INET, text.c_str(), &addr) != 1) {
        return std::nullopt;
    }
    return ntohl(addr.s_addr);
}

bool AddressUtils::isValidAddress(const std::string& text) {
    return parseAddress(text).has_value();
}

std::string AddressUtils::formatAddress(uint32_t address) {
    return std::to_string((address >> 24) & 0xFF) + "." +
           std::to_string((address >> 16) & 0xFF) + "." +
           std::to_string((address >> 8) & 0xFF) + "." +
           std::to_string(address & 0xFF);
}

Ipv4Prefix AddressUtils::parseCIDR(const std::string& text) {
    size_t slash_pos = text.find('/');
    std::string ip_str = text;
    int prefix_len = 32; // Bare address is a host route

    if (slash_pos != std::string::npos) {
        ip_str = text.substr(0, slash_pos);
        std::string prefix_str = text.substr(slash_pos + 1);

        if (prefix_str.empty() || prefix_str.size() > 2 ||
            prefix_str.find_first_not_of("0123456789") != std::string::npos) {
            throw std::invalid_argument("Invalid prefix length in '" + text + "'");
        }
        prefix_len = std::stoi(prefix_str);
        if (prefix_len < 0 || prefix_len > 32) {
            throw std::invalid_argument("Prefix length out of range (0-32) in '" + text + "'");
        }
    }

    auto address = parseAddress(ip_str);
    if (!address) {
        throw std::invalid_argument("Invalid IPv4 address: " + ip_str);
    }

    Ipv4Prefix prefix;
    prefix.network = *address & maskBits(prefix_len);
    prefix.prefix_length = prefix_len;
    return prefix;
}

bool AddressUtils::isAddressOrCIDR(const std::string& text) {
    try {
        parseCIDR(text);
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    }
}

bool AddressUtils::isDomainName(const std::string& text) {
    if (text.empty() || text.size() > 253) {
        return false;
    }
    static const std::regex domain_regex(
        "^([A-Za-z0-9]([A-Za-z0-9-]{0,61}[A-Za-z0-9])?\\.)+[A-Za-z]{2,63}\\.?$");
    return std::regex_match(text, domain_regex);
}

std::string AddressUtils::prefixToMask(int prefix_length) {
    if (prefix_length < 0 || prefix_length > 32) {
        return "0.0.0.0";
    }
    return formatAddress(maskBits(prefix_length));
}

int AddressUtils::maskToPrefix(const std::string& mask) {
    auto value = parseAddress(mask);
    if (!value) {
        return -1;
    }

    int prefix_length = 0;
    uint32_t bits = *value;
    while (bits & 0x80000000U) {
        ++prefix_length;
        bits <<= 1;
    }
    // Any set bit after the first zero means the mask is not contiguous
    if (bits != 0) {
        return -1;
    }
    return prefix_length;
}

bool AddressUtils::subnetContains(const Ipv4Prefix& outer, const Ipv4Prefix& inner) {
    if (outer.prefix_length > inner.prefix_length) {
        return false; // outer is more specific than inner
    }
    uint32_t mask = maskBits(outer.prefix_length);
    return (outer.network & mask) == (inner.network & mask);
}

std::string AddressUtils::hostAddress(const Ipv4Prefix& prefix) {
    uint32_t host = prefix.prefix_length >= 31 ? prefix.network : prefix.network + 1;
    if ((host & 0xFF000000U) == 0) {
        return "";
    }
    return formatAddress(host);
}

std::string AddressUtils::probeAddress(const Ipv4Prefix& prefix, const std::string& gateway,
                                       const std::string& fallback) {
    std::string host = hostAddress(prefix);
    if (!host.empty()) {
        return host;
    }
    if (auto target = parseAddress(fallback)) {
        Ipv4Prefix fallback_prefix;
        fallback_prefix.network = *target;
        fallback_prefix.prefix_length = 32;
        if (subnetContains(prefix, fallback_prefix)) {
            return fallback;
        }
    }
    return gateway;
}

} // namespace routecompose
