#include "diff_engine.hpp"
#include "live_state_reader.hpp"
#include <algorithm>
#include <map>
#include <set>
#include <utility>

namespace routecompose {

namespace {

const std::string kKernelProtocol = "kernel";

using PrefixKey = std::pair<std::string, int>;

PrefixKey prefixOf(const RouteKey& key) {
    return {key.destination, key.prefix_length};
}

PrefixKey prefixOf(const LiveRouteEntry& entry) {
    return {entry.destination, entry.prefix_length};
}

DiffOperation makeOperation(OperationType type,
                            const LiveRouteEntry& entry,
                            std::optional<RouteKey> desired_key,
                            std::string reason) {
    DiffOperation op;
    op.type = type;
    op.entry = entry;
    op.desired_key = std::move(desired_key);
    op.reason = std::move(reason);
    return op;
}

std::string describeChange(const LiveRouteEntry& before, const LiveRouteEntry& after) {
    std::vector<std::string> changes;
    if (before.metric != after.metric) {
        changes.push_back("metric " + std::to_string(before.metric) + " -> " + std::to_string(after.metric));
    }
    if (before.interface_index != after.interface_index) {
        changes.push_back("interface " + before.interface_name + " -> " + after.interface_name);
    }
    if (before.gateway != after.gateway) {
        changes.push_back("gateway " + (before.gateway.empty() ? std::string("on-link") : before.gateway) +
                          " -> " + after.gateway);
    }

    std::string text;
    for (const auto& change : changes) {
        if (!text.empty()) {
            text += ", ";
        }
        text += change;
    }
    return text.empty() ? "changed" : text;
}

} // namespace

std::string PlanRow::kindToString(Kind kind) {
    switch (kind) {
        case Kind::Add: return "ADD";
        case Kind::Delete: return "DELETE";
        case Kind::Modify: return "MODIFY";
    }
    return "UNKNOWN";
}

std::string PlanRow::describe() const {
    switch (kind) {
        case Kind::Add:
            return "+ " + after->toString();
        case Kind::Delete:
            return "- " + before->toString();
        case Kind::Modify:
            return "~ " + before->toString() + "  =>  " + after->toString() +
                   " (" + describeChange(*before, *after) + ")";
    }
    return "";
}

DiffEngine::DiffEngine(DiffOptions options)
    : options_(std::move(options)) {
}

DiffPlan DiffEngine::computeDiff(const std::vector<ResolvedRoute>& desired,
                                 const std::vector<LiveRouteEntry>& live) const {
    // Desired routes keyed by identity, first occurrence wins
    std::vector<const ResolvedRoute*> desired_order;
    std::set<RouteKey> desired_keys;
    std::map<PrefixKey, RouteKey> prefix_owner;
    for (const auto& route : desired) {
        if (!desired_keys.insert(route.key).second) {
            continue;
        }
        desired_order.push_back(&route);
        prefix_owner.emplace(prefixOf(route.key), route.key);
    }

    // Only live entries inside the managed key space take part
    std::vector<LiveRouteEntry> sorted_live = live;
    std::sort(sorted_live.begin(), sorted_live.end());

    std::map<RouteKey, std::vector<LiveRouteEntry>> live_by_key;
    std::vector<LiveRouteEntry> unclaimed;
    for (const auto& entry : sorted_live) {
        bool tagged = entry.protocol == options_.managed_protocol;
        bool claimed = entry.protocol != kKernelProtocol && prefix_owner.count(prefixOf(entry)) > 0;
        if (!tagged && !claimed) {
            continue; // foreign
        }
        if (desired_keys.count(entry.key())) {
            live_by_key[entry.key()].push_back(entry);
        } else {
            unclaimed.push_back(entry);
        }
    }

    std::vector<DiffOperation> adds;
    std::vector<DiffOperation> deletes;

    for (const ResolvedRoute* route : desired_order) {
        LiveRouteEntry target;
        target.destination = route->key.destination;
        target.prefix_length = route->key.prefix_length;
        target.gateway = route->key.gateway;
        target.interface_index = route->interface_index;
        target.interface_name = route->interface_name;
        target.metric = route->metric;
        target.protocol = options_.managed_protocol;

        const auto found = live_by_key.find(route->key);
        const std::vector<LiveRouteEntry> empty;
        const std::vector<LiveRouteEntry>& group = (found != live_by_key.end()) ? found->second : empty;

        bool in_place = std::find(group.begin(), group.end(), target) != group.end();
        if (in_place) {
            // Already correct; any other entry under the same key is surplus
            bool kept = false;
            for (const auto& entry : group) {
                if (entry == target && !kept) {
                    kept = true;
                    continue;
                }
                deletes.push_back(makeOperation(OperationType::Delete, entry, route->key,
                                                "duplicate of " + route->key.toString()));
            }
            continue;
        }

        std::string reason = group.empty() ? "new route"
                                           : describeChange(group.front(), target);
        adds.push_back(makeOperation(OperationType::Add, target, route->key, reason));
        for (const auto& entry : group) {
            deletes.push_back(makeOperation(OperationType::Delete, entry, route->key,
                                            "replaced: " + describeChange(entry, target)));
        }
    }

    for (const auto& entry : unclaimed) {
        auto owner = prefix_owner.find(prefixOf(entry));
        if (owner != prefix_owner.end()) {
            deletes.push_back(makeOperation(OperationType::Delete, entry, owner->second,
                                            "prefix reassigned to " + owner->second.toString()));
        } else {
            deletes.push_back(makeOperation(OperationType::Delete, entry, std::nullopt,
                                            "no longer in profile"));
        }
    }

    return finalize(std::move(adds), std::move(deletes), LiveStateReader::fingerprint(live));
}

DiffPlan DiffEngine::computeRestoreDiff(const std::vector<LiveRouteEntry>& target,
                                        const std::vector<LiveRouteEntry>& live) const {
    std::vector<LiveRouteEntry> wanted;
    for (const auto& entry : target) {
        if (entry.protocol != kKernelProtocol) {
            wanted.push_back(entry);
        }
    }
    std::sort(wanted.begin(), wanted.end());

    std::vector<LiveRouteEntry> pool;
    for (const auto& entry : live) {
        if (entry.protocol != kKernelProtocol) {
            pool.push_back(entry);
        }
    }
    std::sort(pool.begin(), pool.end());

    std::set<RouteKey> wanted_keys;
    for (const auto& entry : wanted) {
        wanted_keys.insert(entry.key());
    }

    std::vector<DiffOperation> adds;
    std::vector<DiffOperation> deletes;

    // Multiset matching: each live entry satisfies at most one wanted entry
    std::vector<bool> consumed(pool.size(), false);
    for (const auto& entry : wanted) {
        bool matched = false;
        for (std::size_t i = 0; i < pool.size(); ++i) {
            if (!consumed[i] && pool[i] == entry) {
                consumed[i] = true;
                matched = true;
                break;
            }
        }
        if (!matched) {
            LiveRouteEntry restored = entry;
            if (restored.protocol.empty()) {
                restored.protocol = options_.managed_protocol;
            }
            adds.push_back(makeOperation(OperationType::Add, restored, entry.key(), "restore"));
        }
    }

    for (std::size_t i = 0; i < pool.size(); ++i) {
        if (consumed[i]) {
            continue;
        }
        std::optional<RouteKey> desired_key;
        if (wanted_keys.count(pool[i].key())) {
            desired_key = pool[i].key();
        }
        deletes.push_back(makeOperation(OperationType::Delete, pool[i], desired_key,
                                        "not in snapshot"));
    }

    return finalize(std::move(adds), std::move(deletes), LiveStateReader::fingerprint(live));
}

DiffPlan DiffEngine::finalize(std::vector<DiffOperation> adds,
                              std::vector<DiffOperation> deletes,
                              uint64_t fingerprint) {
    // An Add and a Delete attached to the same desired route form a modify pair
    std::set<RouteKey> added_keys;
    std::set<RouteKey> deleted_keys;
    for (const auto& op : adds) {
        if (op.desired_key) added_keys.insert(*op.desired_key);
    }
    for (const auto& op : deletes) {
        if (op.desired_key) deleted_keys.insert(*op.desired_key);
    }
    for (auto& op : adds) {
        op.modify = op.desired_key && deleted_keys.count(*op.desired_key) > 0;
    }
    for (auto& op : deletes) {
        op.modify = op.desired_key && added_keys.count(*op.desired_key) > 0;
    }

    auto isDefault = [](const DiffOperation& op) { return op.entry.key().isDefault(); };

    DiffPlan plan;
    plan.source_fingerprint = fingerprint;
    plan.operations.reserve(adds.size() + deletes.size());

    // stable_partition keeps the computed order within each class
    std::stable_partition(adds.begin(), adds.end(), [&](const DiffOperation& op) { return !isDefault(op); });
    std::stable_partition(deletes.begin(), deletes.end(), [&](const DiffOperation& op) { return !isDefault(op); });

    plan.operations.insert(plan.operations.end(), adds.begin(), adds.end());
    plan.operations.insert(plan.operations.end(), deletes.begin(), deletes.end());
    return plan;
}

std::vector<PlanRow> DiffEngine::summarize(const DiffPlan& plan) {
    std::vector<PlanRow> rows;
    std::map<RouteKey, std::size_t> modify_rows;

    for (const auto& op : plan.operations) {
        if (op.modify && op.desired_key) {
            auto it = modify_rows.find(*op.desired_key);
            if (it != modify_rows.end()) {
                PlanRow& row = rows[it->second];
                if (op.type == OperationType::Add && !row.after) {
                    row.after = op.entry;
                    continue;
                }
                if (op.type == OperationType::Delete && !row.before) {
                    row.before = op.entry;
                    continue;
                }
            } else {
                PlanRow row;
                row.kind = PlanRow::Kind::Modify;
                row.desired_key = op.desired_key;
                if (op.type == OperationType::Add) {
                    row.after = op.entry;
                } else {
                    row.before = op.entry;
                }
                modify_rows[*op.desired_key] = rows.size();
                rows.push_back(row);
                continue;
            }
        }

        PlanRow row;
        row.desired_key = op.desired_key;
        if (op.type == OperationType::Add) {
            row.kind = PlanRow::Kind::Add;
            row.after = op.entry;
        } else {
            row.kind = PlanRow::Kind::Delete;
            row.before = op.entry;
        }
        rows.push_back(row);
    }

    // A modify row that never found its other half is a plain Add or Delete
    for (auto& row : rows) {
        if (row.kind == PlanRow::Kind::Modify && !(row.before && row.after)) {
            row.kind = row.after ? PlanRow::Kind::Add : PlanRow::Kind::Delete;
        }
    }
    return rows;
}

} // namespace routecompose
