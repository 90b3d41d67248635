/**
 * @file interface_resolver.hpp
 * @brief Apply-time resolution of interface names and destinations
 * @author route-compose Development Team
 * @date 2026
 *
 * Interface indices are not stable across reboots, and domain names can
 * change address at any time. Both are therefore looked up fresh every
 * session and never persisted or cached.
 */

#pragma once

#include "address_utils.hpp"
#include "errors.hpp"
#include "network_backend.hpp"
#include "profile.hpp"
#include <string>
#include <vector>

namespace routecompose {

/**
 * @struct ResolutionIssue
 * @brief A route that could not be resolved and was left out of the plan
 */
struct ResolutionIssue {
    std::size_t source_index = 0;  ///< Position of the RouteSpec in its profile
    RouteKey source_key;           ///< Key of the RouteSpec
    ResolutionError::Kind kind = ResolutionError::Kind::InvalidFormat;
    std::string message;
};

/**
 * @struct ResolutionOutcome
 * @brief Result of resolving a whole profile
 */
struct ResolutionOutcome {
    std::vector<ResolvedRoute> routes;    ///< Routes ready for diffing
    std::vector<ResolutionIssue> issues;  ///< Routes excluded because resolution failed
    std::vector<RouteSpec> skipped;       ///< Disabled routes, never resolved
};

/**
 * @class InterfaceResolver
 * @brief Maps interface names to live indices and destinations to concrete prefixes
 */
class InterfaceResolver {
public:
    explicit InterfaceResolver(NetworkBackend& backend);

    /**
     * @brief Look up the current index of an interface
     * @param name Interface name as written in the profile
     * @return Live ifIndex
     * @throws ResolutionError{InterfaceNotFound} if no present interface has that name
     */
    uint32_t resolveInterface(const std::string& name);

    /**
     * @brief Turn a RouteSpec destination into concrete prefixes
     * @param spec Route specification
     * @return One prefix for address/CIDR input; one /32 per address for a domain
     * @throws ResolutionError{InvalidFormat} for malformed destinations
     * @throws ResolutionError{NameResolutionFailed} if a DNS lookup fails or is empty
     */
    std::vector<Ipv4Prefix> resolveDestination(const RouteSpec& spec);

    /**
     * @brief Resolve every enabled route of a profile
     *
     * Failures are collected per route and never abort the whole profile.
     * Interfaces are enumerated once for the call.
     */
    ResolutionOutcome resolve(const Profile& profile);

private:
    uint32_t lookupInterface(const std::string& name, const std::vector<InterfaceInfo>& interfaces) const;

    NetworkBackend& backend_;
};

} // namespace routecompose
