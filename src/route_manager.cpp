#include "route_manager.hpp"
#include "errors.hpp"
#include "logger.hpp"

namespace routecompose {

namespace {

const char* kComponent = "RouteManager";

std::string summarizeValidation(const std::map<RouteKey, ValidationResult>& results) {
    std::size_t verified = 0;
    std::size_t missing = 0;
    std::size_t unreachable = 0;
    for (const auto& entry : results) {
        switch (entry.second.status()) {
            case ValidationStatus::Verified: ++verified; break;
            case ValidationStatus::Missing: ++missing; break;
            case ValidationStatus::Unreachable: ++unreachable; break;
        }
    }
    return std::to_string(verified) + " verified, " + std::to_string(missing) + " missing, " +
           std::to_string(unreachable) + " unreachable";
}

} // namespace

RouteManager::RouteManager(NetworkBackend& backend, const AppSettings& settings)
    : backend_(backend),
      settings_(settings),
      audit_(settings.audit_log),
      lock_(settings.lock_file),
      reader_(backend),
      resolver_(backend),
      engine_(DiffOptions{settings.route_protocol}),
      applier_(backend, reader_, audit_, settings.route_protocol),
      snapshots_(settings.snapshot_dir, settings.route_table, backend, reader_, engine_, applier_, audit_),
      validator_(backend, reader_, audit_) {
}

void RouteManager::requirePrivilege(const std::string& intent) {
    if (!backend_.hasMutationPrivilege()) {
        audit_.record(intent, "session", "failed: permission denied");
        throw PermissionError("Modifying the route table requires root privileges (or CAP_NET_ADMIN)");
    }
}

MutationLock::Guard RouteManager::acquireLock(const std::string& intent) {
    try {
        return lock_.acquire();
    } catch (const ApplyError& e) {
        audit_.record(intent, "session", "failed: " + ApplyError::kindToString(e.kind()) + ": " + e.what());
        throw;
    }
}

ValidatorOptions RouteManager::validatorOptions(bool probe) const {
    ValidatorOptions options;
    options.probe_enabled = probe && settings_.probe.enabled;
    options.probe.max_hops = settings_.probe.max_hops;
    options.probe.hop_timeout_ms = settings_.probe.hop_timeout_ms;
    options.probe.overall_timeout_ms = settings_.probe.overall_timeout_ms;
    options.default_target = settings_.probe.default_target;
    return options;
}

PreviewResult RouteManager::preview(const Profile& profile) {
    PreviewResult result;
    result.profile_name = profile.name;
    result.warnings = ProfileValidator::validateProfile(profile);
    for (const auto& warning : result.warnings) {
        Logger::warning(kComponent, warning.message);
    }

    result.resolution = resolver_.resolve(profile);
    for (const auto& issue : result.resolution.issues) {
        Logger::warning(kComponent, "Route #" + std::to_string(issue.source_index + 1) + " (" +
                        issue.source_key.toString() + ") excluded: " + issue.message);
    }

    std::vector<LiveRouteEntry> live = reader_.read();
    if (auto tunnel = ProfileValidator::detectFullTunnel(live)) {
        Logger::warning(kComponent, tunnel->message);
        result.warnings.push_back(*tunnel);
    }
    result.plan = engine_.computeDiff(result.resolution.routes, live);
    result.rows = DiffEngine::summarize(result.plan);
    result.fingerprint = result.plan.source_fingerprint;

    Logger::info(kComponent, "Profile " + profile.name + ": " +
                 std::to_string(result.resolution.routes.size()) + " resolved, " +
                 std::to_string(result.resolution.issues.size()) + " unresolved, " +
                 std::to_string(result.plan.size()) + " operation(s) planned");
    return result;
}

ApplySession RouteManager::apply(const Profile& profile, const ApplyOptions& options) {
    const std::string intent = "apply " + profile.name;

    requirePrivilege(intent);
    MutationLock::Guard guard = acquireLock(intent);

    ApplySession session;
    session.preview = preview(profile);
    const DiffPlan& plan = session.preview.plan;

    if (options.expected_fingerprint && *options.expected_fingerprint != plan.source_fingerprint) {
        std::string message = "Live route table changed since preview (expected " +
                              formatFingerprint(*options.expected_fingerprint) + ", found " +
                              formatFingerprint(plan.source_fingerprint) + ")";
        audit_.record(intent, "session", "failed: StaleState: " + message);
        throw ApplyError(ApplyError::Kind::StaleState, message + "; preview again");
    }

    if (plan.empty()) {
        Logger::info(kComponent, "Live table already matches profile " + profile.name);
        audit_.record(intent, "session", "ok: no changes");
        return session;
    }

    Snapshot snapshot = snapshots_.capture();
    if (settings_.snapshot_retention > 0) {
        session.pruned = snapshots_.prune(static_cast<std::size_t>(settings_.snapshot_retention), snapshot.id());
    }

    try {
        session.report = applier_.apply(plan, guard, snapshot.id(), snapshots_, intent);
    } catch (const ApplyError& e) {
        audit_.record(intent, "session", "failed: " + ApplyError::kindToString(e.kind()) + ": " + e.what());
        throw;
    }

    const ApplyReport& report = *session.report;
    if (report.succeeded()) {
        audit_.record(intent, "session", "ok: " + std::to_string(report.results.size()) +
                      " operation(s), snapshot " + snapshot.id());
    } else if (report.rollback_error) {
        audit_.record(intent, "session", "failed: " + std::string(report.failure->what()) +
                      "; ROLLBACK FAILED: " + report.rollback_error->what());
        return session;
    } else {
        audit_.record(intent, "session", "failed: " + std::string(report.failure->what()) +
                      "; rolled back to " + snapshot.id());
        return session;
    }

    if (options.validate) {
        // Validation is informational; its failures never undo an apply
        try {
            session.validation = validator_.validate(session.preview.resolution.routes,
                                                     validatorOptions(options.probe),
                                                     options.cancel, intent);
        } catch (const OSCommandError& e) {
            Logger::warning(kComponent, std::string("Post-apply validation skipped: ") + e.what());
        }
    }
    return session;
}

RestoreReport RouteManager::rollback(const std::string& snapshot_id) {
    const std::string intent = "rollback " + snapshot_id;

    requirePrivilege(intent);
    MutationLock::Guard guard = acquireLock(intent);

    try {
        RestoreReport report = snapshots_.restore(snapshot_id, guard, intent);
        audit_.record(intent, "session", "ok: " + std::to_string(report.results.size()) + " operation(s)");
        return report;
    } catch (const RollbackError& e) {
        audit_.record(intent, "session", "failed: " + RollbackError::kindToString(e.kind()) + ": " + e.what());
        throw;
    }
}

ValidationSession RouteManager::validate(const Profile& profile, bool probe, const CancellationToken* cancel) {
    const std::string intent = "validate " + profile.name;

    ValidationSession session;
    session.resolution = resolver_.resolve(profile);
    for (const auto& issue : session.resolution.issues) {
        Logger::warning(kComponent, "Route #" + std::to_string(issue.source_index + 1) + " (" +
                        issue.source_key.toString() + ") not validated: " + issue.message);
    }

    session.results = validator_.validate(session.resolution.routes, validatorOptions(probe), cancel, intent);
    audit_.record(intent, "session", "ok: " + summarizeValidation(session.results));
    return session;
}

Snapshot RouteManager::captureSnapshot() {
    return snapshots_.capture();
}

std::vector<SnapshotInfo> RouteManager::listSnapshots() const {
    return snapshots_.list();
}

void RouteManager::removeSnapshot(const std::string& id) {
    snapshots_.remove(id);
}

std::vector<std::string> RouteManager::pruneSnapshots(std::size_t keep) {
    std::vector<std::string> removed = snapshots_.prune(keep);
    audit_.record("prune " + std::to_string(keep), "session",
                  "ok: removed " + std::to_string(removed.size()) + " snapshot(s)");
    return removed;
}

std::vector<LiveRouteEntry> RouteManager::liveRoutes() {
    return reader_.read();
}

std::vector<InterfaceInfo> RouteManager::interfaces() {
    return backend_.listInterfaces();
}

std::vector<AuditEvent> RouteManager::history(std::size_t count) const {
    return audit_.tail(count);
}

} // namespace routecompose
