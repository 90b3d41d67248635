/**
 * @file profile.hpp
 * @brief Route specifications, profiles and their YAML serialization
 * @author route-compose Development Team
 * @date 2026
 *
 * A profile is the unit of desired state: a named, ordered list of route
 * specifications authored by the user. This file defines the structures
 * and the yaml-cpp template specializations used to read and write them.
 *
 * Example profile:
 * @code
 * name: office
 * description: split tunnel for the lab
 * routes:
 *   - destination: 10.0.0.0/24
 *     gateway: 192.168.1.1
 *     interface: eth0
 *     metric: 5
 *     group: lab
 *     enabled: true
 *     description: lab network
 *   - destination: git.example.com
 *     gateway: 192.168.1.1
 *     interface: eth0
 * @endcode
 */

#pragma once

#include "route_types.hpp"
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace routecompose {

/// Default metric for routes that do not specify one
constexpr int kDefaultMetric = 5;
constexpr int kMinMetric = 1;
constexpr int kMaxMetric = 999;
constexpr std::size_t kMaxDescriptionLength = 200;

/**
 * @struct RouteSpec
 * @brief One user-authored route
 *
 * The destination may be a bare IPv4 address (a /32 host route), a CIDR
 * block or a domain literal resolved at apply time. Host bits in a CIDR
 * destination are cleared when the identity key is computed, so
 * "10.0.0.7/24" and "10.0.0.0/24" denote the same route.
 */
struct RouteSpec {
    std::string destination;           ///< IPv4 address, CIDR or domain literal
    std::string gateway;               ///< Next-hop IPv4 address
    std::string interface_name;        ///< Interface display name, resolved to an ifIndex at apply time
    int metric = kDefaultMetric;       ///< Route metric 1..999
    std::string group;                 ///< Free-form group tag
    bool enabled = true;               ///< Disabled routes are kept in the profile but never applied
    std::string description;           ///< Free text, at most 200 characters

    /// True if the destination is a domain literal rather than an address or CIDR
    bool isDomain() const;

    /**
     * @brief Identity key (destination, mask, gateway) after normalization
     *
     * Address and CIDR destinations key on their network address. Domain
     * literals key as (lower-cased name, 32, gateway).
     */
    RouteKey key() const;

    /**
     * @brief Validate the route specification
     * @return true if every field is well formed
     *
     * Checks for:
     * - A destination that is an IPv4 address, a CIDR with prefix 0..32 or a domain name
     * - A gateway that is an IPv4 address
     * - A non-empty interface name
     * - A metric in 1..999
     * - A description of at most 200 characters
     */
    bool isValid() const;

    /**
     * @brief Get detailed error message for invalid specifications
     * @return Human-readable error description or empty string if valid
     */
    std::string getErrorMessage() const;
};

/**
 * @struct Profile
 * @brief Named, ordered collection of route specifications
 */
struct Profile {
    std::string name;               ///< Profile name, also its file stem in the store
    std::string description;        ///< Optional free text
    std::vector<RouteSpec> routes;  ///< Routes in authoring order

    /**
     * @brief Validate every route and the uniqueness of route keys
     * @return true if the profile may be handed to the engine
     */
    bool isValid() const;

    /**
     * @brief Get detailed error message for invalid profiles
     * @return Description of the first problem found, or empty string if valid
     */
    std::string getErrorMessage() const;

    /// Number of enabled routes
    std::size_t enabledCount() const;
};

} // namespace routecompose

namespace YAML {

/**
 * @brief YAML conversion for RouteSpec
 *
 * The interface name is stored under the key "interface". Optional
 * fields are omitted on encode when they hold their default value.
 */
template<>
struct convert<routecompose::RouteSpec> {
    static Node encode(const routecompose::RouteSpec& spec);
    static bool decode(const Node& node, routecompose::RouteSpec& spec);
};

/**
 * @brief YAML conversion for Profile
 */
template<>
struct convert<routecompose::Profile> {
    static Node encode(const routecompose::Profile& profile);
    static bool decode(const Node& node, routecompose::Profile& profile);
};

} // namespace YAML
