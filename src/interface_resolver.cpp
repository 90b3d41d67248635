#include "interface_resolver.hpp"
#include "logger.hpp"
#include <set>

namespace routecompose {

namespace {

const char* kComponent = "InterfaceResolver";

} // namespace

InterfaceResolver::InterfaceResolver(NetworkBackend& backend)
    : backend_(backend) {
}

uint32_t InterfaceResolver::resolveInterface(const std::string& name) {
    return lookupInterface(name, backend_.listInterfaces());
}

uint32_t InterfaceResolver::lookupInterface(const std::string& name,
                                            const std::vector<InterfaceInfo>& interfaces) const {
    for (const auto& iface : interfaces) {
        if (iface.name == name) {
            return iface.index;
        }
    }
    throw ResolutionError(ResolutionError::Kind::InterfaceNotFound,
                          "Interface '" + name + "' not found");
}

std::vector<Ipv4Prefix> InterfaceResolver::resolveDestination(const RouteSpec& spec) {
    if (AddressUtils::isAddressOrCIDR(spec.destination)) {
        return {AddressUtils::parseCIDR(spec.destination)};
    }

    if (!AddressUtils::isDomainName(spec.destination)) {
        throw ResolutionError(ResolutionError::Kind::InvalidFormat,
                              "Destination '" + spec.destination +
                              "' is not an IPv4 address, CIDR block or domain name");
    }

    std::vector<std::string> addresses = backend_.resolveHost(spec.destination);
    if (addresses.empty()) {
        throw ResolutionError(ResolutionError::Kind::NameResolutionFailed,
                              "DNS lookup for '" + spec.destination + "' returned no addresses");
    }

    std::vector<Ipv4Prefix> prefixes;
    std::set<uint32_t> seen;
    for (const auto& address : addresses) {
        auto parsed = AddressUtils::parseAddress(address);
        if (!parsed || !seen.insert(*parsed).second) {
            continue;
        }
        Ipv4Prefix prefix;
        prefix.network = *parsed;
        prefix.prefix_length = 32;
        prefixes.push_back(prefix);
    }

    if (prefixes.empty()) {
        throw ResolutionError(ResolutionError::Kind::NameResolutionFailed,
                              "DNS lookup for '" + spec.destination + "' returned no usable IPv4 addresses");
    }

    Logger::debug(kComponent, "Resolved " + spec.destination + " to " +
                  std::to_string(prefixes.size()) + " address(es)");
    return prefixes;
}

ResolutionOutcome InterfaceResolver::resolve(const Profile& profile) {
    ResolutionOutcome outcome;
    std::vector<InterfaceInfo> interfaces = backend_.listInterfaces();
    std::set<RouteKey> produced;

    for (std::size_t i = 0; i < profile.routes.size(); ++i) {
        const RouteSpec& spec = profile.routes[i];

        if (!spec.enabled) {
            outcome.skipped.push_back(spec);
            continue;
        }

        try {
            uint32_t index = lookupInterface(spec.interface_name, interfaces);
            std::vector<Ipv4Prefix> prefixes = resolveDestination(spec);

            for (const auto& prefix : prefixes) {
                ResolvedRoute route;
                route.key.destination = prefix.address();
                route.key.prefix_length = prefix.prefix_length;
                route.key.gateway = spec.gateway;
                route.interface_index = index;
                route.interface_name = spec.interface_name;
                route.metric = spec.metric;
                route.source_key = spec.key();
                route.source_index = i;
                route.group = spec.group;

                // A domain may resolve onto a route that is already listed
                if (!produced.insert(route.key).second) {
                    Logger::warning(kComponent, "Route " + route.key.toString() + " from '" +
                                    spec.destination + "' duplicates an earlier route, ignored");
                    continue;
                }
                outcome.routes.push_back(route);
            }
        } catch (const ResolutionError& e) {
            Logger::warning(kComponent, "Route #" + std::to_string(i + 1) + " (" +
                            spec.destination + ") excluded: " + e.what());

            ResolutionIssue issue;
            issue.source_index = i;
            issue.source_key = spec.key();
            issue.kind = e.kind();
            issue.message = e.what();
            outcome.issues.push_back(issue);
        }
    }

    return outcome;
}

} // namespace routecompose
