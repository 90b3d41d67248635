#include "applier.hpp"
#include "logger.hpp"
#include "snapshot_manager.hpp"
#include <stdexcept>

namespace routecompose {

namespace {

const char* kComponent = "Applier";

void requireLock(const MutationLock::Guard& guard) {
    if (!guard.owns()) {
        throw std::logic_error("Route table mutation attempted without holding the mutation lock");
    }
}

} // namespace

Applier::Applier(NetworkBackend& backend,
                 LiveStateReader& reader,
                 AuditLog& audit,
                 std::string managed_protocol)
    : backend_(backend),
      reader_(reader),
      audit_(audit),
      managed_protocol_(std::move(managed_protocol)) {
}

OSCommandError::Kind Applier::toErrorKind(MutationResult::Status status) {
    switch (status) {
        case MutationResult::Status::Timeout:
            return OSCommandError::Kind::Timeout;
        case MutationResult::Status::PermissionDenied:
            return OSCommandError::Kind::PermissionDenied;
        case MutationResult::Status::ExecutionFailed:
            return OSCommandError::Kind::ExecutionFailed;
        default:
            return OSCommandError::Kind::Rejected;
    }
}

OperationResult Applier::executeOperation(const DiffOperation& op) {
    MutationResult mutation;
    if (op.type == OperationType::Add) {
        const std::string& protocol = op.entry.protocol.empty() ? managed_protocol_ : op.entry.protocol;
        mutation = backend_.addRoute(op.entry, protocol);
    } else {
        mutation = backend_.deleteRoute(op.entry);
    }

    OperationResult result;
    result.operation = op;
    result.status = mutation.status;
    result.message = mutation.message;
    return result;
}

ExecutionOutcome Applier::execute(const DiffPlan& plan,
                                  const MutationLock::Guard& guard,
                                  const std::string& intent) {
    requireLock(guard);

    ExecutionOutcome outcome;
    for (std::size_t i = 0; i < plan.operations.size(); ++i) {
        const DiffOperation& op = plan.operations[i];
        Logger::info(kComponent, "[" + std::to_string(i + 1) + "/" + std::to_string(plan.size()) + "] " +
                     op.describe());

        OperationResult result = executeOperation(op);
        std::string status = MutationResult::statusToString(result.status);
        audit_.record(intent, op.describe(),
                      result.message.empty() ? status : status + ": " + result.message);
        outcome.results.push_back(result);

        if (!result.succeeded()) {
            Logger::error(kComponent, op.describe() + " failed (" + status + "): " + result.message);
            outcome.failure = OSCommandError(toErrorKind(result.status),
                                             operationTypeToString(op.type),
                                             op.entry.toString(),
                                             result.message);
            break;
        }

        if (result.status != MutationResult::Status::Ok) {
            Logger::debug(kComponent, op.describe() + ": " + status + ", treated as done");
        }
    }
    return outcome;
}

ApplyReport Applier::apply(const DiffPlan& plan,
                           const MutationLock::Guard& guard,
                           const std::string& snapshot_id,
                           SnapshotManager& snapshots,
                           const std::string& intent) {
    requireLock(guard);

    // The plan is only valid for the table it was computed against
    uint64_t current = LiveStateReader::fingerprint(reader_.read());
    if (current != plan.source_fingerprint) {
        throw ApplyError(ApplyError::Kind::StaleState,
                         "Live route table changed since the plan was computed (expected " +
                         formatFingerprint(plan.source_fingerprint) + ", found " +
                         formatFingerprint(current) + "); preview again");
    }

    ApplyReport report;
    report.snapshot_id = snapshot_id;

    ExecutionOutcome outcome = execute(plan, guard, intent);
    report.results = outcome.results;
    if (outcome.succeeded()) {
        Logger::info(kComponent, "Applied " + std::to_string(plan.size()) + " operation(s)");
        return report;
    }

    report.failure = outcome.failure;
    report.failed_index = outcome.results.size() - 1;

    Logger::warning(kComponent, "Rolling back to snapshot " + snapshot_id);
    try {
        report.rollback = snapshots.restore(snapshot_id, guard, intent + " (automatic rollback)");
        Logger::info(kComponent, "Automatic rollback to " + snapshot_id + " completed");
    } catch (const RollbackError& e) {
        Logger::error(kComponent, e.what());
        report.rollback_error = e;
    }
    return report;
}

} // namespace routecompose
