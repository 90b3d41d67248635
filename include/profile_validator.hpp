/**
 * @file profile_validator.hpp
 * @brief Non-fatal analysis of profiles for risky or surprising routes
 * @author route-compose Development Team
 * @date 2026
 *
 * Structural errors (bad CIDR, missing gateway, duplicate keys) are
 * rejected by Profile::isValid() when a profile is loaded. This file adds
 * a second, advisory pass that flags routes which are legal but deserve
 * attention before they are applied. Warnings never block an apply.
 */

#ifndef ROUTECOMPOSE_PROFILE_VALIDATOR_HPP
#define ROUTECOMPOSE_PROFILE_VALIDATOR_HPP

#include "address_utils.hpp"
#include "profile.hpp"
#include <optional>
#include <string>
#include <vector>

namespace routecompose {

/**
 * @struct ProfileWarning
 * @brief One advisory finding about a profile route
 */
struct ProfileWarning {
    /**
     * @enum Type
     * @brief Categories of advisory findings
     */
    enum class Type {
        DefaultRoute,   ///< Route replaces the host's default route
        SpecialRange,   ///< Destination is loopback, link-local or multicast
        PrefixOverlap,  ///< Prefix contains another route's prefix with a different gateway
        DisabledRoute,  ///< Route is disabled and will be skipped
        FullTunnel      ///< A VPN interface currently carries all traffic
    };

    Type type;                                    ///< Category of the finding
    std::string message;                          ///< Human-readable description
    std::size_t route_index = 0;                  ///< Index of the route in the profile, unused for FullTunnel
    std::optional<std::size_t> related_index;     ///< Index of the other route, for overlaps

    static std::string typeToString(Type type);
};

/**
 * @class ProfileValidator
 * @brief Static analysis of profiles
 *
 * All methods are static. Domain destinations are only checked for being
 * disabled, since their addresses are unknown until apply time.
 */
class ProfileValidator {
public:
    /**
     * @brief Run every check over a profile
     * @param profile Profile to analyze, assumed structurally valid
     * @return Warnings in route order
     */
    static std::vector<ProfileWarning> validateProfile(const Profile& profile);

    /**
     * @brief Look for a full-tunnel VPN in the live table
     *
     * A tunnel owns all traffic when one device holds both halves of the
     * address space (0.0.0.0/1 and 128.0.0.0/1), or when the default route
     * leaves through a tunnel device (wg*, tun*, tap*, ppp*). Profile routes
     * then compete with the tunnel's /1 routes and only win when they are
     * more specific.
     */
    static std::optional<ProfileWarning> detectFullTunnel(const std::vector<LiveRouteEntry>& live);

    /// True for interface names used by VPN and point-to-point tunnels
    static bool isTunnelInterface(const std::string& name);

    /**
     * @brief Check a single prefix against the special ranges
     * @return Name of the range ("loopback", "link-local", "multicast") or empty optional
     */
    static std::optional<std::string> specialRangeName(const Ipv4Prefix& prefix);

    /**
     * @brief Check whether two prefixes overlap
     * @return true if either prefix contains the other
     */
    static bool prefixesOverlap(const Ipv4Prefix& a, const Ipv4Prefix& b);
};

} // namespace routecompose

#endif // ROUTECOMPOSE_PROFILE_VALIDATOR_HPP
