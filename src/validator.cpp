#include "validator.hpp"
#include "address_utils.hpp"
#include "logger.hpp"
#include <algorithm>

namespace routecompose {

namespace {

const char* kComponent = "Validator";

} // namespace

Validator::Validator(NetworkBackend& backend, LiveStateReader& reader, AuditLog& audit)
    : backend_(backend), reader_(reader), audit_(audit) {
}

std::map<RouteKey, ValidationResult> Validator::validate(const std::vector<ResolvedRoute>& routes,
                                                         const ValidatorOptions& options,
                                                         const CancellationToken* cancel,
                                                         const std::string& intent) {
    std::map<RouteKey, ValidationResult> results;
    std::vector<LiveRouteEntry> live = reader_.read();

    // Probe and lookup results per target address, so one call serves every route toward it
    std::map<std::string, ProbeResult> probes;
    std::map<std::string, RouteLookup> lookups;
    bool cancelled = false;

    for (const auto& route : routes) {
        ValidationResult result;
        result.key = route.key;
        result.source_key = route.source_key;

        bool present = std::any_of(live.begin(), live.end(), [&](const LiveRouteEntry& entry) {
            return entry.key() == route.key && entry.interface_index == route.interface_index;
        });
        result.table_status = present ? TableStatus::Verified : TableStatus::Missing;

        Ipv4Prefix prefix;
        prefix.network = AddressUtils::parseAddress(route.key.destination).value_or(0);
        prefix.prefix_length = route.key.prefix_length;
        result.probe_target = AddressUtils::probeAddress(prefix, route.key.gateway, options.default_target);

        // The lookup must stay inside the prefix; the gateway fallback would test another route
        result.lookup_target = AddressUtils::hostAddress(prefix);
        if (result.lookup_target.empty() && !options.default_target.empty() &&
            result.probe_target == options.default_target) {
            result.lookup_target = options.default_target;
        }

        // A missing entry cannot be selected; another route sharing its gateway would read as a hit
        std::string lookup_note;
        if (present && !result.lookup_target.empty()) {
            auto cached = lookups.find(result.lookup_target);
            if (cached == lookups.end()) {
                cached = lookups.emplace(result.lookup_target, backend_.lookupRoute(result.lookup_target)).first;
            }
            const RouteLookup& lookup = cached->second;

            if (lookup.lookup_failed) {
                lookup_note = "route lookup failed: " + lookup.error;
            } else if (lookup.found && lookup.gateway == route.key.gateway &&
                       lookup.interface_name == route.interface_name) {
                result.route_hit = RouteHit::Hit;
                result.effective_gateway = lookup.gateway;
                result.effective_interface = lookup.interface_name;
            } else {
                result.route_hit = RouteHit::Shadowed;
                result.effective_gateway = lookup.gateway;
                result.effective_interface = lookup.interface_name;
                lookup_note = lookup.found
                    ? "traffic to " + result.lookup_target + " leaves via " +
                      (lookup.gateway.empty() ? std::string("on-link") : lookup.gateway) +
                      " dev " + lookup.interface_name
                    : "no route selected for " + result.lookup_target + ": " + lookup.error;
            }
        }

        if (!options.probe_enabled) {
            result.reachability = Reachability::NotProbed;
            result.detail = "probing disabled";
        } else if (cancelled || (cancel != nullptr && cancel->isCancelled())) {
            if (!cancelled) {
                Logger::info(kComponent, "Validation cancelled, remaining routes not probed");
            }
            cancelled = true;
            result.reachability = Reachability::NotProbed;
            result.detail = "cancelled";
        } else if (result.probe_target.empty()) {
            result.reachability = Reachability::NotProbed;
            result.detail = "no probe target for an on-link route without a usable host address";
        } else {
            auto cached = probes.find(result.probe_target);
            if (cached == probes.end()) {
                Logger::debug(kComponent, "Probing " + result.probe_target + " for " + route.key.toString());
                cached = probes.emplace(result.probe_target,
                                        backend_.probe(result.probe_target, options.probe)).first;
            }
            const ProbeResult& probe = cached->second;

            result.hops_answered = probe.hops_answered;
            if (probe.responded) {
                result.reachability = Reachability::Reachable;
                result.detail = probe.reached_destination ? "destination answered"
                                                          : "first hop " + probe.first_hop;
            } else if (!probe.error.empty()) {
                result.reachability = Reachability::NotProbed;
                result.detail = probe.error;
            } else {
                result.reachability = Reachability::Unreachable;
                result.detail = probe.timed_out ? "no response before the probe time limit"
                                                : "no hop answered within " +
                                                  std::to_string(options.probe.max_hops) + " hops";
            }
        }

        std::string status = validationStatusToString(result.status());
        Logger::info(kComponent, route.key.toString() + ": " + status + " (table " +
                     tableStatusToString(result.table_status) + ", lookup " +
                     routeHitToString(result.route_hit) + ", " +
                     reachabilityToString(result.reachability) + ")");
        if (result.route_hit == RouteHit::Shadowed && result.table_status == TableStatus::Verified) {
            Logger::warning(kComponent, route.key.toString() + " is in the table but not selected: " + lookup_note);
        }

        std::string outcome = status;
        if (!result.detail.empty()) {
            outcome += ": " + result.detail;
        }
        if (!lookup_note.empty()) {
            outcome += "; " + lookup_note;
        }
        audit_.record(intent, "validate " + route.key.toString(), outcome);

        results[route.key] = result;
    }

    return results;
}

} // namespace routecompose
