/**
 * @file audit_log.hpp
 * @brief Append-only record of attempted and completed state transitions
 * @author route-compose Development Team
 * @date 2026
 *
 * Each event is one line holding a YAML flow map:
 * @code
 * {timestamp: 2026-10-18T09:12:44.120Z, intent: apply office, operation: add 10.0.0.0/24 via 192.168.1.1 dev eth0 (ifindex 2) metric 5, outcome: ok}
 * @endcode
 */

#pragma once

#include "route_types.hpp"
#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

namespace routecompose {

/**
 * @class AuditLog
 * @brief Thread-safe, append-only audit file
 *
 * A failed append is logged at Error level and otherwise ignored: losing
 * an audit line must not abort a mutation session halfway. An empty path
 * disables the log.
 */
class AuditLog {
public:
    explicit AuditLog(std::string path);

    AuditLog(const AuditLog&) = delete;
    AuditLog& operator=(const AuditLog&) = delete;

    /**
     * @brief Append one event stamped with the current time
     * @param intent What the actor asked for, e.g. "apply office"
     * @param operation What was attempted, e.g. "add 10.0.0.0/24 ..." or "session"
     * @param outcome Result, e.g. "ok" or "failed: ..."
     */
    void record(const std::string& intent, const std::string& operation, const std::string& outcome);

    /// Append a fully formed event
    void append(const AuditEvent& event);

    /**
     * @brief Read every event in file order
     * @return Events; empty if the file does not exist yet
     *
     * Lines that do not parse are skipped with a warning.
     */
    std::vector<AuditEvent> readAll() const;

    /// The last @p count events, oldest first
    std::vector<AuditEvent> tail(std::size_t count) const;

    const std::string& path() const { return path_; }

    /// Encode an event as a single-line YAML flow map
    static std::string formatEvent(const AuditEvent& event);

    /**
     * @brief Decode one line produced by formatEvent()
     * @throws std::runtime_error if the line is not a valid event
     */
    static AuditEvent parseEvent(const std::string& line);

private:
    std::string path_;
    mutable std::mutex mutex_;
};

} // namespace routecompose
