/**
 * @file errors.hpp
 * @brief Error taxonomy for route-compose
 * @author route-compose Development Team
 * @date 2026
 *
 * Every error the engine raises derives from std::runtime_error and carries
 * a kind enumeration so callers can branch on the failure class without
 * parsing messages. Severity, from least to most severe:
 *
 * - ValidationError: malformed route specification, rejected at load/import
 * - ResolutionError: a single route could not be resolved; the route is
 *   flagged and excluded from the plan
 * - ApplyError: a session could not start (lock held, live state drifted)
 * - PermissionError: the process may not mutate the route table
 * - OSCommandError: the OS rejected a mutation; aborts the plan and
 *   triggers automatic rollback
 * - RollbackError: restoring a snapshot failed; the host routing state
 *   is undefined and needs manual intervention
 */

#pragma once

#include <stdexcept>
#include <string>

namespace routecompose {

/**
 * @class ValidationError
 * @brief Malformed RouteSpec or profile (bad CIDR, missing gateway, duplicate key)
 */
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @class ResolutionError
 * @brief A symbolic field of a route could not be resolved at apply time
 */
class ResolutionError : public std::runtime_error {
public:
    enum class Kind {
        InterfaceNotFound,    ///< No present interface has the given name
        InvalidFormat,        ///< Destination is not an IP, CIDR or domain literal
        NameResolutionFailed  ///< DNS lookup failed, timed out or returned nothing
    };

    ResolutionError(Kind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    Kind kind() const { return kind_; }

    static std::string kindToString(Kind kind);

private:
    Kind kind_;
};

/**
 * @class OSCommandError
 * @brief The OS rejected or failed to complete a route-table operation
 *
 * Carries the operation description (e.g. "add"), the route it targeted
 * and the reason the OS reported, so that reports can show full context.
 */
class OSCommandError : public std::runtime_error {
public:
    enum class Kind {
        Rejected,          ///< Non-zero exit: duplicate entry, invalid parameter, ...
        Timeout,           ///< The command exceeded its time budget
        PermissionDenied,  ///< The OS refused the mutation for lack of privilege
        ExecutionFailed    ///< The command could not be spawned or its output read
    };

    OSCommandError(Kind kind,
                   const std::string& operation,
                   const std::string& route,
                   const std::string& os_reason);

    Kind kind() const { return kind_; }
    const std::string& operation() const { return operation_; }
    const std::string& route() const { return route_; }
    const std::string& osReason() const { return os_reason_; }

    static std::string kindToString(Kind kind);

private:
    Kind kind_;
    std::string operation_;
    std::string route_;
    std::string os_reason_;
};

/**
 * @class RollbackError
 * @brief Restoring a snapshot failed
 *
 * The most severe error class: the route table may be partially restored.
 * Never retried automatically.
 */
class RollbackError : public std::runtime_error {
public:
    enum class Kind {
        SnapshotNotFound,  ///< No snapshot with the requested identifier
        SnapshotCorrupt,   ///< The snapshot record exists but cannot be read
        RestoreFailed      ///< An OS operation failed while restoring
    };

    RollbackError(Kind kind, const std::string& snapshot_id, const std::string& message);

    Kind kind() const { return kind_; }
    const std::string& snapshotId() const { return snapshot_id_; }

    static std::string kindToString(Kind kind);

private:
    Kind kind_;
    std::string snapshot_id_;
};

/**
 * @class ApplyError
 * @brief An apply or rollback session could not start
 */
class ApplyError : public std::runtime_error {
public:
    enum class Kind {
        StaleState,      ///< Live state changed since the plan was computed
        Busy,            ///< Another mutation session holds the lock
        LockUnavailable  ///< The system-wide lock file could not be opened
    };

    ApplyError(Kind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    Kind kind() const { return kind_; }

    static std::string kindToString(Kind kind);

private:
    Kind kind_;
};

/**
 * @class PermissionError
 * @brief The process lacks the privilege required to mutate the route table
 */
class PermissionError : public std::runtime_error {
public:
    explicit PermissionError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace routecompose
