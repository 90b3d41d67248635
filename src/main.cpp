#include <chrono>
#include <csignal>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <string>
#include "background_worker.hpp"
#include "cli_parser.hpp"
#include "errors.hpp"
#include "ip_route_backend.hpp"
#include "logger.hpp"
#include "profile_store.hpp"
#include "route_manager.hpp"
#include "settings.hpp"
#include "system_utils.hpp"

using namespace routecompose;

namespace {

// Exit codes
constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitInvalid = 2;
constexpr int kExitRolledBack = 3;
constexpr int kExitRollbackFailed = 4;
constexpr int kExitBusy = 5;
constexpr int kExitPermission = 6;

constexpr std::size_t kDefaultHistoryCount = 20;

volatile std::sig_atomic_t g_interrupted = 0;

void handleInterrupt(int) {
    g_interrupted = 1;
}

void printManualIntervention(const std::string& snapshot_id) {
    std::cerr << "\nMANUAL INTERVENTION REQUIRED\n";
    std::cerr << "The route table could not be restored and may be partially modified.\n";
    std::cerr << "Inspect it with 'ip -4 route show' and compare against snapshot " << snapshot_id << ".\n";
    std::cerr << "Retry with 'route-compose rollback " << snapshot_id << "' once the cause is fixed.\n";
}

Profile loadProfile(const ProfileStore& store, const std::string& argument) {
    if (ProfileStore::looksLikePath(argument)) {
        return ProfileStore::loadFile(argument);
    }
    return store.load(argument);
}

void printResults(const std::vector<OperationResult>& results) {
    for (const auto& result : results) {
        std::cout << "  " << result.operation.describe() << ": "
                  << MutationResult::statusToString(result.status);
        if (!result.message.empty()) {
            std::cout << " (" << result.message << ")";
        }
        std::cout << "\n";
    }
}

void printPreview(const PreviewResult& preview) {
    std::cout << "Profile: " << preview.profile_name << "\n";

    if (!preview.warnings.empty()) {
        std::cout << "\nWarnings:\n";
        for (const auto& warning : preview.warnings) {
            std::cout << "  WARNING (" << ProfileWarning::typeToString(warning.type) << "): "
                      << warning.message << "\n";
        }
    }

    if (!preview.resolution.issues.empty()) {
        std::cout << "\nUnresolved routes (excluded from the plan):\n";
        for (const auto& issue : preview.resolution.issues) {
            std::cout << "  Route #" << (issue.source_index + 1) << " " << issue.source_key.toString() << ": "
                      << ResolutionError::kindToString(issue.kind) << ": " << issue.message << "\n";
        }
    }

    if (!preview.resolution.skipped.empty()) {
        std::cout << "\nSkipped (disabled):\n";
        for (const auto& spec : preview.resolution.skipped) {
            std::cout << "  " << spec.key().toString() << "\n";
        }
    }

    std::cout << "\n";
    if (preview.rows.empty()) {
        std::cout << "No changes: the route table already matches the profile.\n";
    } else {
        std::cout << "Plan (" << preview.plan.size() << " operation(s)):\n";
        for (const auto& row : preview.rows) {
            std::cout << "  " << row.describe() << "\n";
        }
    }
    std::cout << "\nFingerprint: " << formatFingerprint(preview.fingerprint) << "\n";
}

void printValidation(const std::map<RouteKey, ValidationResult>& results) {
    for (const auto& entry : results) {
        const ValidationResult& result = entry.second;
        std::cout << "  " << std::left << std::setw(12) << validationStatusToString(result.status())
                  << result.key.toString();
        if (!(result.source_key == result.key)) {
            std::cout << " [" << result.source_key.destination << "]";
        }
        std::cout << "  table=" << tableStatusToString(result.table_status)
                  << " lookup=" << routeHitToString(result.route_hit);
        if (!result.effective_interface.empty()) {
            std::cout << " (via " << (result.effective_gateway.empty() ? "on-link" : result.effective_gateway)
                      << " dev " << result.effective_interface << ")";
        }
        std::cout << " probe=" << reachabilityToString(result.reachability);
        if (!result.detail.empty()) {
            std::cout << " (" << result.detail << ")";
        }
        std::cout << "\n";
    }
}

int runApply(RouteManager& manager, const Profile& profile, const CLIParser::Options& options,
             const CancellationToken& cancel) {
    ApplyOptions apply_options;
    apply_options.expected_fingerprint = options.expected_fingerprint;
    apply_options.validate = !options.no_validate;
    apply_options.probe = !options.no_probe;
    apply_options.cancel = &cancel;

    ApplySession session = manager.apply(profile, apply_options);
    printPreview(session.preview);

    if (session.noop()) {
        return kExitOk;
    }

    const ApplyReport& report = *session.report;
    std::cout << "\nSnapshot: " << report.snapshot_id << "\n";
    for (const auto& id : session.pruned) {
        std::cout << "Pruned snapshot " << id << "\n";
    }
    std::cout << "\nResults:\n";
    printResults(report.results);

    if (!report.succeeded()) {
        std::cerr << "\nApply failed: " << report.failure->what() << "\n";
        if (report.rollback_error) {
            std::cerr << "Automatic rollback failed: " << report.rollback_error->what() << "\n";
            printManualIntervention(report.snapshot_id);
            return kExitRollbackFailed;
        }
        std::cerr << "The route table was rolled back to snapshot " << report.snapshot_id << ".\n";
        if (report.rollback) {
            printResults(report.rollback->results);
        }
        return kExitRolledBack;
    }

    std::cout << "\nApplied " << report.results.size() << " operation(s).\n";
    if (!session.validation.empty()) {
        std::cout << "\nValidation:\n";
        printValidation(session.validation);
    }
    return kExitOk;
}

int runCommand(const CLIParser::Options& options, const AppSettings& settings, const CancellationToken& cancel) {
    IpRouteBackendOptions backend_options;
    backend_options.table = settings.route_table;
    backend_options.command_timeout_ms = settings.command_timeout_ms;
    backend_options.dns_timeout_ms = settings.dns_timeout_ms;
    IpRouteBackend backend(backend_options);

    RouteManager manager(backend, settings);
    ProfileStore store(settings.profiles_dir);
    const auto& args = options.arguments;

    switch (options.command) {
        case CLIParser::Command::Preview:
            printPreview(manager.preview(loadProfile(store, args[0])));
            return kExitOk;

        case CLIParser::Command::Apply:
            return runApply(manager, loadProfile(store, args[0]), options, cancel);

        case CLIParser::Command::Validate: {
            ValidationSession session = manager.validate(loadProfile(store, args[0]), !options.no_probe, &cancel);
            for (const auto& issue : session.resolution.issues) {
                std::cout << "  UNRESOLVED  " << issue.source_key.toString() << ": " << issue.message << "\n";
            }
            printValidation(session.results);
            return kExitOk;
        }

        case CLIParser::Command::Rollback: {
            RestoreReport report = manager.rollback(args[0]);
            for (const auto& note : report.remapped) {
                std::cout << "Interface remapped: " << note << "\n";
            }
            if (report.plan.empty()) {
                std::cout << "Route table already matches snapshot " << report.snapshot_id << ".\n";
            } else {
                printResults(report.results);
                std::cout << "Restored snapshot " << report.snapshot_id << ".\n";
            }
            return kExitOk;
        }

        case CLIParser::Command::Snapshot: {
            Snapshot snapshot = manager.captureSnapshot();
            std::cout << snapshot.id() << " (" << snapshot.entries().size() << " routes)\n";
            return kExitOk;
        }

        case CLIParser::Command::Snapshots:
            for (const auto& info : manager.listSnapshots()) {
                std::cout << info.id << "  " << info.timestamp << "  table " << info.table << "  "
                          << info.entry_count << " routes\n";
            }
            return kExitOk;

        case CLIParser::Command::Prune: {
            std::size_t keep = args.empty() ? static_cast<std::size_t>(settings.snapshot_retention)
                                            : static_cast<std::size_t>(std::stoul(args[0]));
            for (const auto& id : manager.pruneSnapshots(keep)) {
                std::cout << "Removed " << id << "\n";
            }
            return kExitOk;
        }

        case CLIParser::Command::Drop:
            manager.removeSnapshot(args[0]);
            std::cout << "Removed " << args[0] << "\n";
            return kExitOk;

        case CLIParser::Command::Profiles:
            for (const auto& name : store.list()) {
                std::cout << name << "\n";
            }
            return kExitOk;

        case CLIParser::Command::Show: {
            YAML::Emitter out;
            out << YAML::convert<Profile>::encode(loadProfile(store, args[0]));
            std::cout << out.c_str() << "\n";
            return kExitOk;
        }

        case CLIParser::Command::Import: {
            Profile profile = store.importFile(args[0], args[1]);
            std::cout << "Imported " << profile.routes.size() << " route(s) as profile " << profile.name << "\n";
            return kExitOk;
        }

        case CLIParser::Command::Export:
            store.exportTo(args[0], args[1]);
            std::cout << "Exported profile " << args[0] << " to " << args[1] << "\n";
            return kExitOk;

        case CLIParser::Command::Routes:
            for (const auto& entry : manager.liveRoutes()) {
                std::cout << (entry.protocol == settings.route_protocol ? "* " : "  ")
                          << entry.toString() << " proto " << entry.protocol << "\n";
            }
            return kExitOk;

        case CLIParser::Command::Interfaces:
            for (const auto& info : manager.interfaces()) {
                std::cout << std::setw(4) << info.index << "  " << info.name << "\n";
            }
            return kExitOk;

        case CLIParser::Command::History: {
            std::size_t count = args.empty() ? kDefaultHistoryCount : static_cast<std::size_t>(std::stoul(args[0]));
            for (const auto& event : manager.history(count)) {
                std::cout << event.timestamp << "  " << event.intent << "  " << event.operation
                          << "  " << event.outcome << "\n";
            }
            return kExitOk;
        }

        case CLIParser::Command::Info:
            SystemUtils::printSystemInfo();
            return kExitOk;

        case CLIParser::Command::None:
            break;
    }
    return kExitError;
}

int runInBackground(const CLIParser::Options& options, const AppSettings& settings) {
    CancellationToken cancel;
    BackgroundWorker worker;

    std::signal(SIGINT, handleInterrupt);
    std::future<int> result = worker.submit([&]() { return runCommand(options, settings, cancel); });

    // Mutations run to completion; only probing observes the token
    while (result.wait_for(std::chrono::milliseconds(100)) != std::future_status::ready) {
        if (g_interrupted && !cancel.isCancelled()) {
            std::cerr << "\nInterrupted, finishing current step..." << std::endl;
            cancel.cancel();
        }
    }
    return result.get();
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        auto options = CLIParser::parse(argc, argv);

        if (options.help) {
            CLIParser::printUsage(argv[0]);
            return kExitOk;
        }

        if (options.show_license) {
            CLIParser::printLicense();
            return kExitOk;
        }

        AppSettings settings = SettingsParser::loadFromFile(options.settings_file.value_or(kDefaultSettingsPath),
                                                            options.settings_file.has_value());
        if (options.profiles_dir) settings.profiles_dir = *options.profiles_dir;
        if (options.snapshot_dir) settings.snapshot_dir = *options.snapshot_dir;
        if (options.audit_log) settings.audit_log = *options.audit_log;
        if (options.no_probe) settings.probe.enabled = false;

        Logger::setLevel(settings.log_level);
        if (options.verbose) Logger::setLevel(LogLevel::Debug);
        if (options.quiet) Logger::setLevel(LogLevel::Error);

        if (CLIParser::isMutating(options.command)) {
            if (!options.debug) {
                auto errors = SystemUtils::validateSystemRequirements();
                if (!errors.empty()) {
                    for (const auto& error : errors) {
                        std::cerr << error << std::endl;
                    }
                    std::cerr << "\nSystem validation failed. Use --help for usage information." << std::endl;
                    return SystemUtils::isRunningAsRoot() ? kExitError : kExitPermission;
                }
            } else {
                Logger::info("main", "Debug mode: skipping system validation");
            }
        }
        if (options.command == CLIParser::Command::Apply || options.command == CLIParser::Command::Validate) {
            for (const auto& warning : SystemUtils::optionalToolWarnings()) {
                Logger::warning("main", warning);
            }
        }

        return runInBackground(options, settings);

    } catch (const std::invalid_argument& e) {
        if (std::string(e.what()) == "No command specified") {
            CLIParser::printUsage(argv[0]);
        } else {
            std::cerr << "Error: " << e.what() << std::endl;
            std::cerr << "Use --help for usage information." << std::endl;
        }
        return kExitError;
    } catch (const ValidationError& e) {
        std::cerr << "Validation error: " << e.what() << std::endl;
        return kExitInvalid;
    } catch (const ResolutionError& e) {
        std::cerr << "Resolution error (" << ResolutionError::kindToString(e.kind()) << "): " << e.what() << std::endl;
        return kExitInvalid;
    } catch (const PermissionError& e) {
        std::cerr << "Permission error: " << e.what() << std::endl;
        return kExitPermission;
    } catch (const ApplyError& e) {
        std::cerr << "Apply error (" << ApplyError::kindToString(e.kind()) << "): " << e.what() << std::endl;
        return e.kind() == ApplyError::Kind::LockUnavailable ? kExitError : kExitBusy;
    } catch (const RollbackError& e) {
        std::cerr << "Rollback error (" << RollbackError::kindToString(e.kind()) << "): " << e.what() << std::endl;
        if (e.kind() == RollbackError::Kind::RestoreFailed) {
            printManualIntervention(e.snapshotId());
            return kExitRollbackFailed;
        }
        return kExitError;
    } catch (const OSCommandError& e) {
        std::cerr << "OS command error (" << OSCommandError::kindToString(e.kind()) << "): " << e.what() << std::endl;
        return kExitError;
    } catch (const std::filesystem::filesystem_error& e) {
        std::cerr << "File system error: " << e.what() << std::endl;
        return kExitError;
    } catch (const std::runtime_error& e) {
        std::cerr << "Runtime error: " << e.what() << std::endl;
        return kExitError;
    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        std::cerr << "Please report this issue with the command you were trying to execute." << std::endl;
        return kExitError;
    }
}
