/**
 * @file route_types.hpp
 * @brief Core data model shared by the reconciliation engine
 * @author route-compose Development Team
 * @date 2026
 *
 * Value types flowing between the resolver, the live-state reader, the
 * diff engine, the applier, the snapshot manager and the validator:
 * - RouteKey: identity of a route (destination, prefix length, gateway)
 * - ResolvedRoute: a desired route with concrete destination and live ifIndex
 * - LiveRouteEntry: an entry as currently held by the OS route table
 * - DiffOperation / DiffPlan: ordered Add/Delete operations
 * - Snapshot: immutable capture of a route table
 * - ValidationResult: post-apply table and reachability status
 * - AuditEvent: one append-only audit record
 *
 * None of these types talks to the OS. Resolved and live values are
 * recomputed each session and are never cached between sessions.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace routecompose {

/**
 * @struct RouteKey
 * @brief Identity key of a route: (destination, mask, gateway)
 *
 * The destination is the normalized network address, or a lower-cased
 * domain literal for a RouteSpec that has not been resolved yet. An
 * empty gateway denotes an on-link route.
 */
struct RouteKey {
    std::string destination;  ///< Network address or domain literal
    int prefix_length = 32;   ///< Prefix length 0..32
    std::string gateway;      ///< Next hop, empty for on-link routes

    /// Destination in CIDR notation, e.g. "10.0.0.0/24"
    std::string prefix() const;

    /// Human-readable form, e.g. "10.0.0.0/24 via 192.168.1.1"
    std::string toString() const;

    /// True for the default route 0.0.0.0/0
    bool isDefault() const;

    bool operator==(const RouteKey& other) const;
    bool operator!=(const RouteKey& other) const { return !(*this == other); }
    bool operator<(const RouteKey& other) const;
};

/**
 * @struct ResolvedRoute
 * @brief A RouteSpec after apply-time resolution
 *
 * A domain RouteSpec expands to one ResolvedRoute per resolved address;
 * all of them share the same source_key so previews can trace them back.
 */
struct ResolvedRoute {
    RouteKey key;                  ///< Concrete destination/mask/gateway
    uint32_t interface_index = 0;  ///< Live ifIndex looked up this session
    std::string interface_name;    ///< Interface display name from the profile
    int metric = 0;                ///< Route metric
    RouteKey source_key;           ///< Key of the originating RouteSpec
    std::size_t source_index = 0;  ///< Position of the RouteSpec in its profile
    std::string group;             ///< Group tag carried from the RouteSpec
};

/**
 * @struct LiveRouteEntry
 * @brief One unicast IPv4 route as reported by the OS
 *
 * Equality compares destination, mask, gateway, ifIndex and metric only.
 * The interface name and protocol tag are informational: the name is used
 * to re-resolve the index when a snapshot is restored after a reboot, and
 * the protocol tag decides whether the entry belongs to this tool.
 */
struct LiveRouteEntry {
    std::string destination;       ///< Network address
    int prefix_length = 32;        ///< Prefix length 0..32
    std::string gateway;           ///< Next hop, empty for on-link routes
    uint32_t interface_index = 0;  ///< OS ifIndex
    std::string interface_name;    ///< Device name at the time of reading
    int metric = 0;                ///< Route metric
    std::string protocol;          ///< Route protocol tag ("kernel", "boot", "250", ...)

    RouteKey key() const;
    std::string prefix() const;

    /// "10.0.0.0/24 via 192.168.1.1 dev eth0 (ifindex 2) metric 5"
    std::string toString() const;

    /// Canonical single-line encoding used for fingerprinting
    std::string canonical() const;

    bool operator==(const LiveRouteEntry& other) const;
    bool operator!=(const LiveRouteEntry& other) const { return !(*this == other); }

    /// Canonical order: key, then ifIndex, then metric
    bool operator<(const LiveRouteEntry& other) const;
};

/**
 * @enum OperationType
 * @brief The closed set of route-table primitives a plan may contain
 */
enum class OperationType {
    Add,    ///< Add a route
    Delete  ///< Delete a route
};

std::string operationTypeToString(OperationType type);

/**
 * @struct DiffOperation
 * @brief One step of a DiffPlan
 *
 * A changed route is never modified in place. It appears as an Add of the
 * new entry and a Delete of the old one, both flagged @c modify and both
 * carrying the desired key of the route they belong to.
 */
struct DiffOperation {
    OperationType type = OperationType::Add;
    LiveRouteEntry entry;                 ///< Full entry to add or delete
    std::optional<RouteKey> desired_key;  ///< Source RouteSpec key, empty for orphan deletes
    bool modify = false;                  ///< Half of a Delete-old/Add-new pair
    std::string reason;                   ///< Why this operation exists, for previews and audit

    /// "add 10.0.0.0/24 via 192.168.1.1 dev eth0 (ifindex 2) metric 5"
    std::string describe() const;
};

/**
 * @struct DiffPlan
 * @brief Ordered operations plus the fingerprint of the live state they were computed against
 */
struct DiffPlan {
    std::vector<DiffOperation> operations;
    uint64_t source_fingerprint = 0;

    bool empty() const { return operations.empty(); }
    std::size_t size() const { return operations.size(); }
};

/// Format a fingerprint as 16 lower-case hex digits
std::string formatFingerprint(uint64_t fingerprint);

/**
 * @brief Parse a fingerprint previously produced by formatFingerprint()
 * @throws std::invalid_argument if @p text is not 1..16 hex digits
 */
uint64_t parseFingerprint(const std::string& text);

/**
 * @class Snapshot
 * @brief Immutable capture of a route table
 *
 * Once constructed a snapshot exposes only const accessors. Persisted
 * snapshots are loaded into a fresh instance, never edited in place.
 */
class Snapshot {
public:
    Snapshot(std::string id,
             std::string timestamp,
             std::string table,
             std::vector<LiveRouteEntry> entries);

    const std::string& id() const { return id_; }
    const std::string& timestamp() const { return timestamp_; }
    const std::string& table() const { return table_; }
    const std::vector<LiveRouteEntry>& entries() const { return entries_; }

private:
    std::string id_;
    std::string timestamp_;
    std::string table_;
    std::vector<LiveRouteEntry> entries_;
};

/// Route-table presence of a desired route
enum class TableStatus {
    Verified,  ///< An entry with matching destination/mask/gateway/interface exists
    Missing    ///< No matching entry
};

/// Outcome of the hop-trace probe
enum class Reachability {
    Reachable,    ///< At least one hop answered
    Unreachable,  ///< No hop answered within the hop and time bounds
    NotProbed     ///< Probing disabled, cancelled or unavailable
};

/// Whether the OS's own route lookup selects the route
enum class RouteHit {
    Hit,        ///< Lookup picked this route's gateway and device
    Shadowed,   ///< Lookup picked another route, or none
    NotChecked  ///< Entry missing, no address to look up, or the lookup could not run
};

/// Combined per-route status
enum class ValidationStatus {
    Verified,
    Missing,
    Unreachable
};

std::string tableStatusToString(TableStatus status);
std::string reachabilityToString(Reachability reachability);
std::string routeHitToString(RouteHit hit);
std::string validationStatusToString(ValidationStatus status);

/**
 * @struct ValidationResult
 * @brief Table and reachability status of one resolved route
 *
 * The two dimensions are kept apart: a route can be present in the
 * table and still be unreachable because its gateway is down.
 */
struct ValidationResult {
    RouteKey key;
    RouteKey source_key;
    TableStatus table_status = TableStatus::Missing;
    Reachability reachability = Reachability::NotProbed;
    std::string probe_target;  ///< Address the probe was sent to
    int hops_answered = 0;     ///< Number of hops that responded
    std::string detail;        ///< Extra context (probe error, cancellation)

    RouteHit route_hit = RouteHit::NotChecked;
    std::string lookup_target;        ///< Address passed to the route lookup
    std::string effective_gateway;    ///< Next hop the OS selected
    std::string effective_interface;  ///< Device the OS selected

    /// Missing dominates, then Unreachable, else Verified. Shadowing is
    /// reported through route_hit and does not change this status.
    ValidationStatus status() const;
};

/**
 * @struct AuditEvent
 * @brief One append-only audit record
 */
struct AuditEvent {
    std::string timestamp;  ///< ISO-8601 UTC
    std::string intent;     ///< What the actor asked for ("apply home", "rollback snap-...")
    std::string operation;  ///< What was attempted ("add 10.0.0.0/24 ...", "session")
    std::string outcome;    ///< Result ("ok", "already-present", "failed: ...")
};

/// Current UTC time as "YYYY-MM-DDTHH:MM:SS.mmmZ"
std::string currentTimestamp();

} // namespace routecompose
