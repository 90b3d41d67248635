#include "profile.hpp"
#include "address_utils.hpp"
#include <algorithm>
#include <cctype>
#include <map>
#include <stdexcept>

namespace routecompose {

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

} // namespace

bool RouteSpec::isDomain() const {
    return !AddressUtils::isAddressOrCIDR(destination) && AddressUtils::isDomainName(destination);
}

RouteKey RouteSpec::key() const {
    RouteKey key;
    key.gateway = gateway;

    if (isDomain()) {
        std::string name = toLower(destination);
        if (!name.empty() && name.back() == '.') {
            name.pop_back();
        }
        key.destination = name;
        key.prefix_length = 32;
        return key;
    }

    try {
        Ipv4Prefix prefix = AddressUtils::parseCIDR(destination);
        key.destination = prefix.address();
        key.prefix_length = prefix.prefix_length;
    } catch (const std::invalid_argument&) {
        // Malformed destinations keep their raw text; isValid() reports them
        key.destination = destination;
        key.prefix_length = 32;
    }
    return key;
}

bool RouteSpec::isValid() const {
    return getErrorMessage().empty();
}

std::string RouteSpec::getErrorMessage() const {
    if (destination.empty()) {
        return "destination is required";
    }
    if (!AddressUtils::isAddressOrCIDR(destination) && !AddressUtils::isDomainName(destination)) {
        return "destination '" + destination + "' is not an IPv4 address, CIDR block or domain name";
    }
    if (gateway.empty()) {
        return "gateway is required";
    }
    if (!AddressUtils::isValidAddress(gateway)) {
        return "gateway '" + gateway + "' is not an IPv4 address";
    }
    if (interface_name.empty()) {
        return "interface is required";
    }
    if (metric < kMinMetric || metric > kMaxMetric) {
        return "metric " + std::to_string(metric) + " is out of range (" +
               std::to_string(kMinMetric) + "-" + std::to_string(kMaxMetric) + ")";
    }
    if (description.size() > kMaxDescriptionLength) {
        return "description exceeds " + std::to_string(kMaxDescriptionLength) + " characters";
    }
    return "";
}

bool Profile::isValid() const {
    return getErrorMessage().empty();
}

std::string Profile::getErrorMessage() const {
    std::map<RouteKey, std::size_t> seen;

    for (std::size_t i = 0; i < routes.size(); ++i) {
        const RouteSpec& spec = routes[i];
        std::string error = spec.getErrorMessage();
        if (!error.empty()) {
            return "Route #" + std::to_string(i + 1) + " (" + spec.destination + "): " + error;
        }

        auto inserted = seen.emplace(spec.key(), i);
        if (!inserted.second) {
            return "Route #" + std::to_string(i + 1) + " (" + spec.key().toString() +
                   ") duplicates route #" + std::to_string(inserted.first->second + 1);
        }
    }
    return "";
}

std::size_t Profile::enabledCount() const {
    return static_cast<std::size_t>(
        std::count_if(routes.begin(), routes.end(), [](const RouteSpec& spec) { return spec.enabled; }));
}

} // namespace routecompose

// YAML conversion implementations
namespace YAML {

using namespace routecompose;

Node convert<RouteSpec>::encode(const RouteSpec& spec) {
    Node node;
    node["destination"] = spec.destination;
    node["gateway"] = spec.gateway;
    node["interface"] = spec.interface_name;
    node["metric"] = spec.metric;

    if (!spec.group.empty()) {
        node["group"] = spec.group;
    }
    if (!spec.enabled) {
        node["enabled"] = spec.enabled;
    }
    if (!spec.description.empty()) {
        node["description"] = spec.description;
    }
    return node;
}

bool convert<RouteSpec>::decode(const Node& node, RouteSpec& spec) {
    if (!node.IsMap()) return false;

    // Missing required fields decode as empty strings so that
    // RouteSpec::getErrorMessage() can name the field
    if (node["destination"]) {
        spec.destination = node["destination"].as<std::string>();
    }
    if (node["gateway"]) {
        spec.gateway = node["gateway"].as<std::string>();
    }
    if (node["interface"]) {
        spec.interface_name = node["interface"].as<std::string>();
    }
    if (node["metric"]) {
        spec.metric = node["metric"].as<int>();
    } else {
        spec.metric = kDefaultMetric;
    }
    if (node["group"]) {
        spec.group = node["group"].as<std::string>();
    }
    if (node["enabled"]) {
        spec.enabled = node["enabled"].as<bool>();
    } else {
        spec.enabled = true; // default value
    }
    if (node["description"]) {
        spec.description = node["description"].as<std::string>();
    }
    return true;
}

Node convert<Profile>::encode(const Profile& profile) {
    Node node;
    node["name"] = profile.name;
    if (!profile.description.empty()) {
        node["description"] = profile.description;
    }

    Node routes(NodeType::Sequence);
    for (const auto& spec : profile.routes) {
        routes.push_back(spec);
    }
    node["routes"] = routes;
    return node;
}

bool convert<Profile>::decode(const Node& node, Profile& profile) {
    if (!node.IsMap()) return false;

    if (node["name"]) {
        profile.name = node["name"].as<std::string>();
    }
    if (node["description"]) {
        profile.description = node["description"].as<std::string>();
    }
    if (node["routes"]) {
        if (!node["routes"].IsSequence()) return false;
        profile.routes = node["routes"].as<std::vector<RouteSpec>>();
    }
    return true;
}

} // namespace YAML
