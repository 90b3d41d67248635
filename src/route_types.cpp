#include "route_types.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <tuple>

namespace routecompose {

std::string RouteKey::prefix() const {
    return destination + "/" + std::to_string(prefix_length);
}

std::string RouteKey::toString() const {
    if (gateway.empty()) {
        return prefix() + " on-link";
    }
    return prefix() + " via " + gateway;
}

bool RouteKey::isDefault() const {
    return prefix_length == 0 && destination == "0.0.0.0";
}

bool RouteKey::operator==(const RouteKey& other) const {
    return destination == other.destination &&
           prefix_length == other.prefix_length &&
           gateway == other.gateway;
}

bool RouteKey::operator<(const RouteKey& other) const {
    return std::tie(destination, prefix_length, gateway) <
           std::tie(other.destination, other.prefix_length, other.gateway);
}

RouteKey LiveRouteEntry::key() const {
    RouteKey key;
    key.destination = destination;
    key.prefix_length = prefix_length;
    key.gateway = gateway;
    return key;
}

std::string LiveRouteEntry::prefix() const {
    return destination + "/" + std::to_string(prefix_length);
}

std::string LiveRouteEntry::toString() const {
    std::ostringstream out;
    out << prefix();
    if (!gateway.empty()) {
        out << " via " << gateway;
    }
    out << " dev " << (interface_name.empty() ? "?" : interface_name)
        << " (ifindex " << interface_index << ") metric " << metric;
    return out.str();
}

std::string LiveRouteEntry::canonical() const {
    return prefix() + "|" + gateway + "|" + std::to_string(interface_index) + "|" +
           std::to_string(metric);
}

bool LiveRouteEntry::operator==(const LiveRouteEntry& other) const {
    return destination == other.destination &&
           prefix_length == other.prefix_length &&
           gateway == other.gateway &&
           interface_index == other.interface_index &&
           metric == other.metric;
}

bool LiveRouteEntry::operator<(const LiveRouteEntry& other) const {
    return std::tie(destination, prefix_length, gateway, interface_index, metric) <
           std::tie(other.destination, other.prefix_length, other.gateway,
                    other.interface_index, other.metric);
}

std::string operationTypeToString(OperationType type) {
    switch (type) {
        case OperationType::Add: return "add";
        case OperationType::Delete: return "delete";
    }
    return "unknown";
}

std::string DiffOperation::describe() const {
    return operationTypeToString(type) + " " + entry.toString();
}

std::string formatFingerprint(uint64_t fingerprint) {
    std::ostringstream out;
    out << std::hex << std::setw(16) << std::setfill('0') << fingerprint;
    return out.str();
}

uint64_t parseFingerprint(const std::string& text) {
    if (text.empty() || text.size() > 16 ||
        text.find_first_not_of("0123456789abcdefABCDEF") != std::string::npos) {
        throw std::invalid_argument("Invalid fingerprint: '" + text + "'");
    }
    return std::stoull(text, nullptr, 16);
}

Snapshot::Snapshot(std::string id,
                   std::string timestamp,
                   std::string table,
                   std::vector<LiveRouteEntry> entries)
    : id_(std::move(id)),
      timestamp_(std::move(timestamp)),
      table_(std::move(table)),
      entries_(std::move(entries)) {
}

std::string tableStatusToString(TableStatus status) {
    switch (status) {
        case TableStatus::Verified: return "Verified";
        case TableStatus::Missing: return "Missing";
    }
    return "Unknown";
}

std::string reachabilityToString(Reachability reachability) {
    switch (reachability) {
        case Reachability::Reachable: return "Reachable";
        case Reachability::Unreachable: return "Unreachable";
        case Reachability::NotProbed: return "NotProbed";
    }
    return "Unknown";
}

std::string routeHitToString(RouteHit hit) {
    switch (hit) {
        case RouteHit::Hit: return "Hit";
        case RouteHit::Shadowed: return "Shadowed";
        case RouteHit::NotChecked: return "NotChecked";
    }
    return "Unknown";
}

std::string validationStatusToString(ValidationStatus status) {
    switch (status) {
        case ValidationStatus::Verified: return "Verified";
        case ValidationStatus::Missing: return "Missing";
        case ValidationStatus::Unreachable: return "Unreachable";
    }
    return "Unknown";
}

ValidationStatus ValidationResult::status() const {
    if (table_status == TableStatus::Missing) {
        return ValidationStatus::Missing;
    }
    if (reachability == Reachability::Unreachable) {
        return ValidationStatus::Unreachable;
    }
    return ValidationStatus::Verified;
}

std::string currentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm utc_tm{};
    gmtime_r(&time_t, &utc_tm);

    std::ostringstream out;
    out << std::put_time(&utc_tm, "%Y-%m-%dT%H:%M:%S");
    out << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return out.str();
}

} // namespace routecompose
