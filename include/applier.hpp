/**
 * @file applier.hpp
 * @brief Ordered execution of DiffPlans with automatic rollback
 * @author route-compose Development Team
 * @date 2026
 *
 * The Applier is the only component that mutates the route table. A
 * forward apply runs in three phases:
 * 1. Stale check: the live table is re-read and its fingerprint compared
 *    with the one the plan was computed against.
 * 2. Execution: operations run strictly in plan order. Benign outcomes
 *    ("already present", "already absent") count as success.
 * 3. On the first failure the remaining operations are abandoned and the
 *    pre-apply snapshot is restored through the SnapshotManager.
 */

#pragma once

#include "audit_log.hpp"
#include "errors.hpp"
#include "live_state_reader.hpp"
#include "mutation_lock.hpp"
#include "network_backend.hpp"
#include "route_types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace routecompose {

class SnapshotManager;

/**
 * @struct OperationResult
 * @brief OS-level outcome of one executed plan operation
 */
struct OperationResult {
    DiffOperation operation;
    MutationResult::Status status = MutationResult::Status::Ok;
    std::string message;  ///< OS-reported reason for non-Ok outcomes

    bool succeeded() const {
        return status == MutationResult::Status::Ok ||
               status == MutationResult::Status::AlreadyPresent ||
               status == MutationResult::Status::AlreadyAbsent;
    }
};

/**
 * @struct ExecutionOutcome
 * @brief Result of running a plan up to completion or first failure
 */
struct ExecutionOutcome {
    std::vector<OperationResult> results;   ///< One per attempted operation
    std::optional<OSCommandError> failure;  ///< First failure, if any

    bool succeeded() const { return !failure.has_value(); }
};

/**
 * @struct RestoreReport
 * @brief Result of restoring a snapshot
 */
struct RestoreReport {
    std::string snapshot_id;
    DiffPlan plan;                          ///< Plan computed against the live table
    std::vector<OperationResult> results;   ///< Executed restore operations
    std::vector<std::string> remapped;      ///< Interfaces whose index changed since capture
};

/**
 * @struct ApplyReport
 * @brief Result of a forward apply session
 *
 * Severity, from best to worst: success; failure with a successful
 * rollback; failure with rollback_error set, which leaves the route
 * table in an undefined state.
 */
struct ApplyReport {
    std::string snapshot_id;                      ///< Pre-apply snapshot of this session
    std::vector<OperationResult> results;         ///< Executed operations, in order
    std::optional<OSCommandError> failure;        ///< Operation failure that aborted the plan
    std::optional<std::size_t> failed_index;      ///< Plan position of the failed operation
    std::optional<RestoreReport> rollback;        ///< Automatic rollback outcome
    std::optional<RollbackError> rollback_error;  ///< Automatic rollback failure

    bool succeeded() const { return !failure.has_value(); }
    bool rolledBack() const { return failure.has_value() && rollback.has_value(); }
};

/**
 * @class Applier
 * @brief Executes DiffPlans against a NetworkBackend
 */
class Applier {
public:
    /**
     * @param backend OS access
     * @param reader Live-state reader used for the stale check
     * @param audit Audit log receiving one event per attempted operation
     * @param managed_protocol Protocol tag for added routes that carry none
     */
    Applier(NetworkBackend& backend,
            LiveStateReader& reader,
            AuditLog& audit,
            std::string managed_protocol);

    /**
     * @brief Execute a forward plan with automatic rollback
     * @param plan Plan to execute
     * @param guard Proof that the caller holds the mutation lock
     * @param snapshot_id Pre-apply snapshot to restore on failure
     * @param snapshots Snapshot manager used for the automatic rollback
     * @param intent Audit intent, e.g. "apply office"
     * @return Report with every attempted operation and, on failure, the rollback outcome
     * @throws ApplyError{StaleState} if the live table changed since the plan was computed
     * @throws std::logic_error if @p guard does not hold the lock
     */
    ApplyReport apply(const DiffPlan& plan,
                      const MutationLock::Guard& guard,
                      const std::string& snapshot_id,
                      SnapshotManager& snapshots,
                      const std::string& intent);

    /**
     * @brief Run operations in order, stopping at the first failure
     *
     * No stale check and no rollback. Used for restore plans, whose own
     * failure must surface as a RollbackError rather than recurse.
     */
    ExecutionOutcome execute(const DiffPlan& plan,
                             const MutationLock::Guard& guard,
                             const std::string& intent);

private:
    OperationResult executeOperation(const DiffOperation& op);

    static OSCommandError::Kind toErrorKind(MutationResult::Status status);

    NetworkBackend& backend_;
    LiveStateReader& reader_;
    AuditLog& audit_;
    std::string managed_protocol_;
};

} // namespace routecompose
