/**
 * @file validator.hpp
 * @brief Post-apply confirmation of route presence and reachability
 * @author route-compose Development Team
 * @date 2026
 */

#pragma once

#include "audit_log.hpp"
#include "background_worker.hpp"
#include "live_state_reader.hpp"
#include "network_backend.hpp"
#include "route_types.hpp"
#include <map>
#include <string>
#include <vector>

namespace routecompose {

/**
 * @struct ValidatorOptions
 * @brief Probe configuration for a validation pass
 */
struct ValidatorOptions {
    bool probe_enabled = true;  ///< Run hop-trace probes in addition to the table check
    ProbeOptions probe;         ///< Hop and time bounds per probe
    std::string default_target; ///< Probe and lookup address for prefixes with no usable host, e.g. 0.0.0.0/0
};

/**
 * @class Validator
 * @brief Classifies resolved routes as Verified, Missing or Unreachable
 *
 * Three checks run per route. The table check looks for the exact entry.
 * The route lookup asks the OS which route a host inside the prefix
 * actually takes, which catches an entry shadowed by a more specific or
 * lower-metric route. The reachability probe traces toward the target.
 * A route present in the table can still be unreachable because its
 * gateway is down, so the results are reported separately. Validation
 * never mutates state and its failures never trigger a rollback.
 */
class Validator {
public:
    Validator(NetworkBackend& backend, LiveStateReader& reader, AuditLog& audit);

    /**
     * @brief Validate every resolved route
     * @param routes Resolved routes to check
     * @param options Probe configuration
     * @param cancel Optional token checked before each probe; remaining routes are reported NotProbed
     * @param intent Audit intent for the per-route events
     * @return Result per resolved route key
     * @throws OSCommandError if the live table cannot be read
     */
    std::map<RouteKey, ValidationResult> validate(const std::vector<ResolvedRoute>& routes,
                                                  const ValidatorOptions& options,
                                                  const CancellationToken* cancel = nullptr,
                                                  const std::string& intent = "validate");

private:
    NetworkBackend& backend_;
    LiveStateReader& reader_;
    AuditLog& audit_;
};

} // namespace routecompose
