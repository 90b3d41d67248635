/**
 * @file fake_network_backend.hpp
 * @brief In-memory NetworkBackend for unit tests
 * @author route-compose Development Team
 * @date 2026
 */

#pragma once

#include "address_utils.hpp"
#include "errors.hpp"
#include "network_backend.hpp"
#include <algorithm>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace routecompose {
namespace test {

/**
 * @class FakeNetworkBackend
 * @brief Route table, interfaces, DNS and probe answers held in memory
 *
 * Mutations behave like the kernel: adding an identical entry reports
 * AlreadyPresent, deleting a missing one reports AlreadyAbsent, and an
 * add through an unknown interface index is rejected. Failures can be
 * injected per mutation number or per destination.
 */
class FakeNetworkBackend : public NetworkBackend {
public:
    std::vector<LiveRouteEntry> routes;
    std::vector<InterfaceInfo> interface_list;
    std::map<std::string, std::vector<std::string>> dns;
    std::map<std::string, ProbeResult> probe_answers;
    bool privileged = true;
    bool list_fails = false;

    /// 1-based mutation number that fails, counted over adds and deletes
    std::optional<int> fail_at_mutation;
    /// Destination prefixes ("10.0.0.0/24") whose adds always fail
    std::set<std::string> fail_add_prefixes;
    MutationResult::Status failure_status = MutationResult::Status::Rejected;

    /// Every mutation attempt, as "add <entry>" or "delete <entry>"
    std::vector<std::string> mutation_log;
    std::vector<std::string> probed;
    std::vector<std::string> resolved;
    std::vector<std::string> looked_up;
    bool lookup_fails = false;
    int list_calls = 0;

    /// Called before each listRoutes; lets a test change the table between reads
    std::function<void(int)> before_list;

    void addInterface(const std::string& name, uint32_t index) {
        interface_list.push_back(InterfaceInfo{name, index});
    }

    std::string interfaceName(uint32_t index) const {
        for (const auto& info : interface_list) {
            if (info.index == index) {
                return info.name;
            }
        }
        return "";
    }

    LiveRouteEntry makeEntry(const std::string& destination, int prefix_length, const std::string& gateway,
                             uint32_t index, int metric, const std::string& protocol) const {
        LiveRouteEntry entry;
        entry.destination = destination;
        entry.prefix_length = prefix_length;
        entry.gateway = gateway;
        entry.interface_index = index;
        entry.interface_name = interfaceName(index);
        entry.metric = metric;
        entry.protocol = protocol;
        return entry;
    }

    void seed(const std::string& destination, int prefix_length, const std::string& gateway,
              uint32_t index, int metric, const std::string& protocol) {
        routes.push_back(makeEntry(destination, prefix_length, gateway, index, metric, protocol));
    }

    bool hasRoute(const std::string& destination, int prefix_length, const std::string& gateway,
                  uint32_t index, int metric) const {
        return std::any_of(routes.begin(), routes.end(), [&](const LiveRouteEntry& entry) {
            return entry.destination == destination && entry.prefix_length == prefix_length &&
                   entry.gateway == gateway && entry.interface_index == index && entry.metric == metric;
        });
    }

    std::vector<LiveRouteEntry> listRoutes() override {
        ++list_calls;
        if (before_list) {
            before_list(list_calls);
        }
        if (list_fails) {
            throw OSCommandError(OSCommandError::Kind::ExecutionFailed, "list", "table main", "injected failure");
        }
        return routes;
    }

    MutationResult addRoute(const LiveRouteEntry& entry, const std::string& protocol) override {
        mutation_log.push_back("add " + entry.toString());
        if (auto failure = injectedFailure(entry, true)) {
            return *failure;
        }
        if (interfaceName(entry.interface_index).empty()) {
            return MutationResult{MutationResult::Status::Rejected, "Cannot find device"};
        }
        if (find(entry) != routes.end()) {
            return MutationResult{MutationResult::Status::AlreadyPresent, "File exists"};
        }
        LiveRouteEntry added = entry;
        added.protocol = protocol;
        added.interface_name = interfaceName(entry.interface_index);
        routes.push_back(added);
        return MutationResult{};
    }

    MutationResult deleteRoute(const LiveRouteEntry& entry) override {
        mutation_log.push_back("delete " + entry.toString());
        if (auto failure = injectedFailure(entry, false)) {
            return *failure;
        }
        auto it = find(entry);
        if (it == routes.end()) {
            return MutationResult{MutationResult::Status::AlreadyAbsent, "No such process"};
        }
        routes.erase(it);
        return MutationResult{};
    }

    std::vector<InterfaceInfo> listInterfaces() override {
        return interface_list;
    }

    std::vector<std::string> resolveHost(const std::string& name) override {
        resolved.push_back(name);
        auto it = dns.find(name);
        if (it == dns.end() || it->second.empty()) {
            throw ResolutionError(ResolutionError::Kind::NameResolutionFailed, "cannot resolve " + name);
        }
        return it->second;
    }

    /// Longest prefix wins, then the lowest metric, as in the kernel's FIB
    RouteLookup lookupRoute(const std::string& address) override {
        looked_up.push_back(address);
        RouteLookup lookup;
        if (lookup_fails) {
            lookup.lookup_failed = true;
            lookup.error = "injected failure";
            return lookup;
        }

        Ipv4Prefix target = AddressUtils::parseCIDR(address);
        const LiveRouteEntry* best = nullptr;
        for (const auto& entry : routes) {
            if (!AddressUtils::subnetContains(AddressUtils::parseCIDR(entry.prefix()), target)) {
                continue;
            }
            if (best == nullptr || entry.prefix_length > best->prefix_length ||
                (entry.prefix_length == best->prefix_length && entry.metric < best->metric)) {
                best = &entry;
            }
        }

        if (best == nullptr) {
            lookup.error = "Network is unreachable";
            return lookup;
        }
        lookup.found = true;
        lookup.gateway = best->gateway;
        lookup.interface_name = interfaceName(best->interface_index);
        return lookup;
    }

    ProbeResult probe(const std::string& address, const ProbeOptions&) override {
        probed.push_back(address);
        auto it = probe_answers.find(address);
        if (it == probe_answers.end()) {
            return ProbeResult{};
        }
        return it->second;
    }

    bool hasMutationPrivilege() override {
        return privileged;
    }

    std::size_t addCount() const {
        return static_cast<std::size_t>(std::count_if(mutation_log.begin(), mutation_log.end(),
            [](const std::string& line) { return line.rfind("add ", 0) == 0; }));
    }

    std::size_t deleteCount() const {
        return mutation_log.size() - addCount();
    }

private:
    std::vector<LiveRouteEntry>::iterator find(const LiveRouteEntry& entry) {
        return std::find_if(routes.begin(), routes.end(), [&](const LiveRouteEntry& live) {
            return live.destination == entry.destination && live.prefix_length == entry.prefix_length &&
                   live.gateway == entry.gateway && live.interface_index == entry.interface_index &&
                   live.metric == entry.metric;
        });
    }

    std::optional<MutationResult> injectedFailure(const LiveRouteEntry& entry, bool is_add) {
        int number = static_cast<int>(mutation_log.size());
        bool fail = (fail_at_mutation && *fail_at_mutation == number) ||
                    (is_add && fail_add_prefixes.count(entry.prefix()) > 0);
        if (!fail) {
            return std::nullopt;
        }
        return MutationResult{failure_status, "injected failure"};
    }
};

} // namespace test
} // namespace routecompose
