/**
 * @file route_manager.hpp
 * @brief Session orchestration for route-compose
 * @author route-compose Development Team
 * @date 2026
 *
 * RouteManager wires the engine components together and exposes one
 * method per user-facing operation. It owns the lock, the audit log and
 * the snapshot store for the lifetime of a run.
 */

#pragma once

#include "applier.hpp"
#include "audit_log.hpp"
#include "background_worker.hpp"
#include "diff_engine.hpp"
#include "interface_resolver.hpp"
#include "live_state_reader.hpp"
#include "mutation_lock.hpp"
#include "network_backend.hpp"
#include "profile.hpp"
#include "profile_validator.hpp"
#include "settings.hpp"
#include "snapshot_manager.hpp"
#include "validator.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace routecompose {

/**
 * @struct PreviewResult
 * @brief Everything an apply would do, computed without mutating
 */
struct PreviewResult {
    std::string profile_name;
    std::vector<ProfileWarning> warnings;  ///< Advisory lint findings
    ResolutionOutcome resolution;          ///< Resolved routes, issues and skipped routes
    DiffPlan plan;                         ///< Ordered operations
    std::vector<PlanRow> rows;             ///< Plan grouped for display
    uint64_t fingerprint = 0;              ///< Fingerprint of the live table the plan was computed on
};

/**
 * @struct ApplyOptions
 * @brief Per-invocation apply switches
 */
struct ApplyOptions {
    std::optional<uint64_t> expected_fingerprint;  ///< Abort with StaleState unless the live table still matches
    bool validate = true;                          ///< Run the validator after a successful apply
    bool probe = true;                             ///< Include reachability probes in that validation
    const CancellationToken* cancel = nullptr;     ///< Cancels post-apply probing
};

/**
 * @struct ApplySession
 * @brief Outcome of RouteManager::apply
 */
struct ApplySession {
    PreviewResult preview;
    std::optional<ApplyReport> report;                 ///< Absent when the plan was empty
    std::map<RouteKey, ValidationResult> validation;   ///< Post-apply validation, if run
    std::vector<std::string> pruned;                   ///< Snapshots removed by retention

    bool noop() const { return !report.has_value(); }
    bool succeeded() const { return !report || report->succeeded(); }
};

/**
 * @struct ValidationSession
 * @brief Outcome of RouteManager::validate
 */
struct ValidationSession {
    ResolutionOutcome resolution;
    std::map<RouteKey, ValidationResult> results;
};

/**
 * @class RouteManager
 * @brief Facade over resolution, diffing, snapshots, apply and validation
 *
 * Mutating operations check privilege first, then take the mutation
 * lock for their whole duration. Lock contention is audited and raised
 * as ApplyError{Busy}.
 */
class RouteManager {
public:
    RouteManager(NetworkBackend& backend, const AppSettings& settings);
    ~RouteManager() = default;

    RouteManager(const RouteManager&) = delete;
    RouteManager& operator=(const RouteManager&) = delete;

    /**
     * @brief Lint, resolve, read and diff without mutating
     * @throws OSCommandError if the live table cannot be read
     */
    PreviewResult preview(const Profile& profile);

    /**
     * @brief Reconcile the live table with a profile
     *
     * Captures a snapshot before the first mutation. An OS failure rolls
     * back automatically and is reported in the session's ApplyReport
     * rather than thrown.
     *
     * @throws PermissionError if the process cannot mutate routes
     * @throws ApplyError on lock contention or a stale fingerprint
     * @throws OSCommandError if the live table cannot be read
     */
    ApplySession apply(const Profile& profile, const ApplyOptions& options);

    /**
     * @brief Restore the live table to a snapshot
     * @throws PermissionError, ApplyError, RollbackError
     */
    RestoreReport rollback(const std::string& snapshot_id);

    /**
     * @brief Resolve a profile and check its routes against the live table
     * @param probe Run reachability probes
     * @param cancel Optional cancellation token checked between probes
     */
    ValidationSession validate(const Profile& profile, bool probe, const CancellationToken* cancel = nullptr);

    Snapshot captureSnapshot();
    std::vector<SnapshotInfo> listSnapshots() const;
    void removeSnapshot(const std::string& id);
    std::vector<std::string> pruneSnapshots(std::size_t keep);

    std::vector<LiveRouteEntry> liveRoutes();
    std::vector<InterfaceInfo> interfaces();
    std::vector<AuditEvent> history(std::size_t count) const;

    const AppSettings& settings() const { return settings_; }

private:
    void requirePrivilege(const std::string& intent);
    MutationLock::Guard acquireLock(const std::string& intent);
    ValidatorOptions validatorOptions(bool probe) const;

    NetworkBackend& backend_;
    AppSettings settings_;
    AuditLog audit_;
    MutationLock lock_;
    LiveStateReader reader_;
    InterfaceResolver resolver_;
    DiffEngine engine_;
    Applier applier_;
    SnapshotManager snapshots_;
    Validator validator_;
};

} // namespace routecompose
