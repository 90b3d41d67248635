#include "network_backend.hpp"

namespace routecompose {

std::string MutationResult::statusToString(Status status) {
    switch (status) {
        case Status::Ok: return "ok";
        case Status::AlreadyPresent: return "already-present";
        case Status::AlreadyAbsent: return "already-absent";
        case Status::Rejected: return "rejected";
        case Status::Timeout: return "timeout";
        case Status::PermissionDenied: return "permission-denied";
        case Status::ExecutionFailed: return "execution-failed";
    }
    return "unknown";
}

} // namespace routecompose
