#include "profile_validator.hpp"
#include <map>
#include <set>
#include <sstream>

namespace routecompose {

namespace {

struct SpecialRange {
    const char* name;
    const char* cidr;
};

const SpecialRange kSpecialRanges[] = {
    {"loopback", "127.0.0.0/8"},
    {"link-local", "169.254.0.0/16"},
    {"multicast", "224.0.0.0/4"},
};

const char* kTunnelPrefixes[] = {"wg", "tun", "tap", "ppp"};

} // namespace

std::string ProfileWarning::typeToString(Type type) {
    switch (type) {
        case Type::DefaultRoute: return "DefaultRoute";
        case Type::SpecialRange: return "SpecialRange";
        case Type::PrefixOverlap: return "PrefixOverlap";
        case Type::DisabledRoute: return "DisabledRoute";
        case Type::FullTunnel: return "FullTunnel";
    }
    return "Unknown";
}

std::optional<std::string> ProfileValidator::specialRangeName(const Ipv4Prefix& prefix) {
    for (const auto& range : kSpecialRanges) {
        Ipv4Prefix special = AddressUtils::parseCIDR(range.cidr);
        if (AddressUtils::subnetContains(special, prefix)) {
            return std::string(range.name);
        }
    }
    return std::nullopt;
}

bool ProfileValidator::isTunnelInterface(const std::string& name) {
    for (const char* prefix : kTunnelPrefixes) {
        if (name.rfind(prefix, 0) == 0) {
            return true;
        }
    }
    return false;
}

std::optional<ProfileWarning> ProfileValidator::detectFullTunnel(const std::vector<LiveRouteEntry>& live) {
    std::map<std::string, std::set<std::string>> halves;
    std::string device;

    for (const auto& entry : live) {
        if (entry.prefix_length == 1 && (entry.destination == "0.0.0.0" || entry.destination == "128.0.0.0")) {
            std::set<std::string>& seen = halves[entry.interface_name];
            seen.insert(entry.destination);
            if (seen.size() == 2) {
                device = entry.interface_name;
                break;
            }
        } else if (entry.prefix_length == 0 && isTunnelInterface(entry.interface_name)) {
            device = entry.interface_name;
            break;
        }
    }

    if (device.empty()) {
        return std::nullopt;
    }

    ProfileWarning warning;
    warning.type = ProfileWarning::Type::FullTunnel;
    warning.message = "Full-tunnel VPN on " + device +
                      " carries all traffic; direct routes must be more specific than /1 "
                      "(use /32 hosts or exact prefixes)";
    return warning;
}

bool ProfileValidator::prefixesOverlap(const Ipv4Prefix& a, const Ipv4Prefix& b) {
    return AddressUtils::subnetContains(a, b) || AddressUtils::subnetContains(b, a);
}

std::vector<ProfileWarning> ProfileValidator::validateProfile(const Profile& profile) {
    std::vector<ProfileWarning> warnings;

    // Parse literal destinations once; domains stay unset
    std::vector<std::optional<Ipv4Prefix>> prefixes;
    prefixes.reserve(profile.routes.size());
    for (const auto& spec : profile.routes) {
        if (AddressUtils::isAddressOrCIDR(spec.destination)) {
            prefixes.push_back(AddressUtils::parseCIDR(spec.destination));
        } else {
            prefixes.push_back(std::nullopt);
        }
    }

    for (std::size_t i = 0; i < profile.routes.size(); ++i) {
        const RouteSpec& spec = profile.routes[i];

        if (!spec.enabled) {
            ProfileWarning warning;
            warning.type = ProfileWarning::Type::DisabledRoute;
            warning.route_index = i;
            warning.message = "Route #" + std::to_string(i + 1) + " (" + spec.destination +
                              ") is disabled and will be skipped";
            warnings.push_back(warning);
            continue;
        }

        if (!prefixes[i]) {
            continue;
        }
        const Ipv4Prefix& prefix = *prefixes[i];

        if (prefix.isDefault()) {
            ProfileWarning warning;
            warning.type = ProfileWarning::Type::DefaultRoute;
            warning.route_index = i;
            warning.message = "Route #" + std::to_string(i + 1) +
                              " replaces the default route; the current default gateway will be removed";
            warnings.push_back(warning);
        } else if (auto range = specialRangeName(prefix)) {
            ProfileWarning warning;
            warning.type = ProfileWarning::Type::SpecialRange;
            warning.route_index = i;
            warning.message = "Route #" + std::to_string(i + 1) + " (" + prefix.toString() +
                              ") targets the " + *range + " range";
            warnings.push_back(warning);
        }

        // Check against every earlier enabled literal route
        for (std::size_t j = 0; j < i; ++j) {
            const RouteSpec& earlier = profile.routes[j];
            if (!earlier.enabled || !prefixes[j] || earlier.gateway == spec.gateway) {
                continue;
            }
            if (!prefixesOverlap(*prefixes[j], prefix)) {
                continue;
            }

            ProfileWarning warning;
            warning.type = ProfileWarning::Type::PrefixOverlap;
            warning.route_index = i;
            warning.related_index = j;

            std::ostringstream msg;
            msg << "Route #" << (i + 1) << " (" << prefix.toString() << " via " << spec.gateway
                << ") overlaps route #" << (j + 1) << " (" << prefixes[j]->toString() << " via "
                << earlier.gateway << "); the more specific prefix wins";
            warning.message = msg.str();
            warnings.push_back(warning);
        }
    }

    return warnings;
}

} // namespace routecompose
