/**
 * @file network_backend.hpp
 * @brief Abstract access to the host's route table, interfaces, DNS and probes
 * @author route-compose Development Team
 * @date 2026
 *
 * The engine never talks to the OS directly. Every route-table query and
 * mutation, interface enumeration, name lookup and reachability probe
 * goes through a NetworkBackend. The production implementation drives
 * iproute2; tests substitute an in-memory backend.
 */

#pragma once

#include "route_types.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace routecompose {

/**
 * @struct InterfaceInfo
 * @brief A present network interface
 */
struct InterfaceInfo {
    std::string name;    ///< Interface name, e.g. "eth0"
    uint32_t index = 0;  ///< OS ifIndex
};

/**
 * @struct MutationResult
 * @brief OS-level outcome of one add or delete
 *
 * AlreadyPresent and AlreadyAbsent are benign: the table already has the
 * desired shape, so the Applier treats them as no-ops.
 */
struct MutationResult {
    enum class Status {
        Ok,                ///< Mutation performed
        AlreadyPresent,    ///< Add of an entry that already exists
        AlreadyAbsent,     ///< Delete of an entry that does not exist
        Rejected,          ///< The OS refused the operation
        Timeout,           ///< The operation exceeded its time limit
        PermissionDenied,  ///< The OS refused for lack of privilege
        ExecutionFailed    ///< The command could not be run
    };

    Status status = Status::Ok;
    std::string message;  ///< OS-reported reason, empty on success

    bool isBenign() const {
        return status == Status::Ok || status == Status::AlreadyPresent ||
               status == Status::AlreadyAbsent;
    }

    static std::string statusToString(Status status);
};

/**
 * @struct ProbeOptions
 * @brief Bounds for one hop-trace probe
 */
struct ProbeOptions {
    int max_hops = 8;               ///< Hop limit
    int hop_timeout_ms = 1000;      ///< Wait per hop
    int overall_timeout_ms = 15000; ///< Hard limit for the whole trace
};

/**
 * @struct ProbeResult
 * @brief Outcome of one hop-trace probe
 */
struct ProbeResult {
    bool responded = false;           ///< At least one hop answered
    bool reached_destination = false; ///< The target itself answered
    int hops_answered = 0;            ///< Number of hops that answered
    std::string first_hop;            ///< Address of the first answering hop
    bool timed_out = false;           ///< The overall limit expired
    std::string error;                ///< Probe tool failure, empty otherwise
};

/**
 * @struct RouteLookup
 * @brief The route the OS selects for one destination address
 */
struct RouteLookup {
    bool found = false;          ///< A unicast route matched
    std::string gateway;         ///< Selected next hop, empty for on-link
    std::string interface_name;  ///< Selected output device
    std::string error;           ///< Why nothing matched, or why the lookup failed
    bool lookup_failed = false;  ///< The lookup itself could not run
};

/**
 * @class NetworkBackend
 * @brief Interface to the OS networking facilities the engine needs
 *
 * All calls are blocking and bounded by implementation-defined timeouts.
 * Implementations must be safe to call from several threads at once.
 */
class NetworkBackend {
public:
    virtual ~NetworkBackend() = default;

    /**
     * @brief List unicast IPv4 routes of the managed table
     * @return Entries in OS order
     * @throws OSCommandError if the table cannot be read
     */
    virtual std::vector<LiveRouteEntry> listRoutes() = 0;

    /**
     * @brief Add a route tagged with @p protocol
     * @param entry Route to add; interface_index selects the device
     * @param protocol Route protocol tag marking tool-owned routes
     */
    virtual MutationResult addRoute(const LiveRouteEntry& entry, const std::string& protocol) = 0;

    /**
     * @brief Delete exactly the given route
     * @param entry Route to delete, matched on prefix, gateway, device and metric
     */
    virtual MutationResult deleteRoute(const LiveRouteEntry& entry) = 0;

    /// Enumerate currently present interfaces, up or down
    virtual std::vector<InterfaceInfo> listInterfaces() = 0;

    /**
     * @brief Resolve a host name to IPv4 addresses
     * @return Addresses in first-seen order, without duplicates, never empty
     * @throws ResolutionError{NameResolutionFailed} on lookup failure, timeout or empty answer
     */
    virtual std::vector<std::string> resolveHost(const std::string& name) = 0;

    /// Ask the OS which route traffic to @p address takes
    virtual RouteLookup lookupRoute(const std::string& address) = 0;

    /// Run a bounded hop-trace toward @p address
    virtual ProbeResult probe(const std::string& address, const ProbeOptions& options) = 0;

    /// True if the process may mutate the route table
    virtual bool hasMutationPrivilege() = 0;
};

} // namespace routecompose
