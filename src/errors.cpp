#include "errors.hpp"

namespace routecompose {

std::string ResolutionError::kindToString(Kind kind) {
    switch (kind) {
        case Kind::InterfaceNotFound: return "InterfaceNotFound";
        case Kind::InvalidFormat: return "InvalidFormat";
        case Kind::NameResolutionFailed: return "NameResolutionFailed";
    }
    return "Unknown";
}

OSCommandError::OSCommandError(Kind kind,
                               const std::string& operation,
                               const std::string& route,
                               const std::string& os_reason)
    : std::runtime_error(operation + " " + route + " failed (" + kindToString(kind) + "): " + os_reason),
      kind_(kind),
      operation_(operation),
      route_(route),
      os_reason_(os_reason) {
}

std::string OSCommandError::kindToString(Kind kind) {
    switch (kind) {
        case Kind::Rejected: return "Rejected";
        case Kind::Timeout: return "Timeout";
        case Kind::PermissionDenied: return "PermissionDenied";
        case Kind::ExecutionFailed: return "ExecutionFailed";
    }
    return "Unknown";
}

RollbackError::RollbackError(Kind kind, const std::string& snapshot_id, const std::string& message)
    : std::runtime_error("Rollback to snapshot '" + snapshot_id + "' failed (" + kindToString(kind) + "): " + message),
      kind_(kind),
      snapshot_id_(snapshot_id) {
}

std::string RollbackError::kindToString(Kind kind) {
    switch (kind) {
        case Kind::SnapshotNotFound: return "SnapshotNotFound";
        case Kind::SnapshotCorrupt: return "SnapshotCorrupt";
        case Kind::RestoreFailed: return "RestoreFailed";
    }
    return "Unknown";
}

std::string ApplyError::kindToString(Kind kind) {
    switch (kind) {
        case Kind::StaleState: return "StaleState";
        case Kind::Busy: return "Busy";
        case Kind::LockUnavailable: return "LockUnavailable";
    }
    return "Unknown";
}

} // namespace routecompose
