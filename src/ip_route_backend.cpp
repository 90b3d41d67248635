#include "ip_route_backend.hpp"
#include "address_utils.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <linux/rtnetlink.h>
#include <net/if.h>
#include <set>
#include <sstream>
#include <unistd.h>

namespace routecompose {

namespace {

const char* kComponent = "IpRouteBackend";

// Route types that never carry a usable unicast next hop
const std::set<std::string> kSkippedRouteTypes = {
    "blackhole", "unreachable", "prohibit", "local", "broadcast",
    "throw", "multicast", "nat", "anycast"
};

// Keywords of `ip route show` output that are followed by a value
const std::set<std::string> kValuedKeywords = {
    "via", "dev", "proto", "metric", "src", "scope", "table", "mtu", "advmss",
    "expires", "pref", "realm", "realms", "weight", "initcwnd", "initrwnd",
    "rtt", "rttvar", "quickack", "congctl", "features", "hoplimit", "window",
    "ssthresh", "cwnd", "reordering", "fastopen_no_cookie", "nhid", "tos",
    "dsfield", "error", "mtu_lock"
};

std::vector<std::string> splitWhitespace(const std::string& line) {
    std::vector<std::string> tokens;
    std::istringstream stream(line);
    std::string token;
    while (stream >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

// Protocol numbers the engine reasons about by name. Everything else,
// including this tool's own tag, stays numeric.
const std::map<int, std::string> kProtocolNames = {
    {RTPROT_REDIRECT, "redirect"},
    {RTPROT_KERNEL, "kernel"},
    {RTPROT_BOOT, "boot"},
    {RTPROT_STATIC, "static"},
    {RTPROT_DHCP, "dhcp"},
};

OSCommandError::Kind toOsErrorKind(const CommandResult& result) {
    if (result.timedOut()) {
        return OSCommandError::Kind::Timeout;
    }
    if (result.notExecuted()) {
        return OSCommandError::Kind::ExecutionFailed;
    }
    if (contains(result.stderr_output, "Operation not permitted")) {
        return OSCommandError::Kind::PermissionDenied;
    }
    return OSCommandError::Kind::Rejected;
}

} // namespace

IpRouteBackend::IpRouteBackend(IpRouteBackendOptions options)
    : options_(std::move(options)) {
}

std::vector<LiveRouteEntry> IpRouteBackend::listRoutes() {
    // -N prints protocol numbers; names come from rt_protos and vary by host
    CommandResult result = CommandExecutor::execute(
        {"ip", "-N", "-4", "route", "show", "table", options_.table}, options_.command_timeout_ms);

    if (!result.isSuccess()) {
        throw OSCommandError(toOsErrorKind(result), "list", "table " + options_.table,
                             result.getErrorMessage());
    }

    std::map<std::string, uint32_t> index_by_name;
    for (const auto& iface : listInterfaces()) {
        index_by_name[iface.name] = iface.index;
    }

    auto entries = parseRouteListing(result.stdout_output, index_by_name);
    Logger::debug(kComponent, "Read " + std::to_string(entries.size()) + " routes from table " + options_.table);
    return entries;
}

std::string IpRouteBackend::deviceName(const LiveRouteEntry& entry) {
    // The ifIndex is authoritative; the name recorded earlier may belong
    // to another index by now
    char name_buffer[IF_NAMESIZE] = {0};
    if (entry.interface_index != 0) {
        if (if_indextoname(entry.interface_index, name_buffer) == nullptr) {
            return "";
        }
        return name_buffer;
    }

    // Listed under a device that did not map to an index at read time
    if (!entry.interface_name.empty() && if_nametoindex(entry.interface_name.c_str()) != 0) {
        return entry.interface_name;
    }
    return "";
}

std::vector<std::string> IpRouteBackend::routeArguments(const LiveRouteEntry& entry, const std::string& device) {
    std::vector<std::string> args = {entry.prefix()};
    if (!entry.gateway.empty()) {
        args.push_back("via");
        args.push_back(entry.gateway);
    }
    if (!device.empty()) {
        args.push_back("dev");
        args.push_back(device);
    }
    args.push_back("metric");
    args.push_back(std::to_string(entry.metric));
    return args;
}

MutationResult IpRouteBackend::addRoute(const LiveRouteEntry& entry, const std::string& protocol) {
    std::string device = deviceName(entry);
    if (device.empty()) {
        return {MutationResult::Status::Rejected,
                "no interface with index " + std::to_string(entry.interface_index)};
    }

    std::vector<std::string> args = {"ip", "-4", "route", "append"};
    std::vector<std::string> route_args = routeArguments(entry, device);
    args.insert(args.end(), route_args.begin(), route_args.end());
    args.insert(args.end(), {"proto", protocol, "table", options_.table});

    return classifyMutation(CommandExecutor::execute(args, options_.command_timeout_ms), true);
}

MutationResult IpRouteBackend::deleteRoute(const LiveRouteEntry& entry) {
    // Without a device the kernel matches on prefix, gateway and metric,
    // and reports "No such process" if the route went away with its device
    std::string device = deviceName(entry);
    if (device.empty()) {
        Logger::debug(kComponent, "No device for " + entry.toString() + ", deleting without dev");
    }

    std::vector<std::string> args = {"ip", "-4", "route", "del"};
    std::vector<std::string> route_args = routeArguments(entry, device);
    args.insert(args.end(), route_args.begin(), route_args.end());
    args.insert(args.end(), {"table", options_.table});

    return classifyMutation(CommandExecutor::execute(args, options_.command_timeout_ms), false);
}

std::vector<InterfaceInfo> IpRouteBackend::listInterfaces() {
    std::vector<InterfaceInfo> interfaces;

    struct if_nameindex* list = if_nameindex();
    if (list == nullptr) {
        Logger::error(kComponent, "if_nameindex() failed");
        return interfaces;
    }

    for (struct if_nameindex* item = list; item->if_index != 0 || item->if_name != nullptr; ++item) {
        InterfaceInfo info;
        info.name = item->if_name;
        info.index = item->if_index;
        interfaces.push_back(info);
    }
    if_freenameindex(list);

    return interfaces;
}

std::vector<std::string> IpRouteBackend::resolveHost(const std::string& name) {
    CommandResult result = CommandExecutor::execute({"getent", "ahostsv4", name}, options_.dns_timeout_ms);

    if (result.timedOut()) {
        throw ResolutionError(ResolutionError::Kind::NameResolutionFailed,
                              "DNS lookup for '" + name + "' timed out");
    }
    if (result.notExecuted()) {
        throw ResolutionError(ResolutionError::Kind::NameResolutionFailed,
                              "DNS lookup for '" + name + "' could not run: " + result.getErrorMessage());
    }
    if (!result.isSuccess()) {
        // getent exits with 2 when the name does not exist
        throw ResolutionError(ResolutionError::Kind::NameResolutionFailed,
                              "DNS lookup for '" + name + "' failed");
    }

    auto addresses = parseGetentOutput(result.stdout_output);
    if (addresses.empty()) {
        throw ResolutionError(ResolutionError::Kind::NameResolutionFailed,
                              "DNS lookup for '" + name + "' returned no IPv4 addresses");
    }
    return addresses;
}

RouteLookup IpRouteBackend::lookupRoute(const std::string& address) {
    CommandResult result = CommandExecutor::execute({"ip", "-4", "route", "get", address},
                                                    options_.command_timeout_ms);
    if (result.timedOut() || result.notExecuted()) {
        RouteLookup lookup;
        lookup.lookup_failed = true;
        lookup.error = result.getErrorMessage();
        return lookup;
    }
    if (!result.isSuccess()) {
        // "RTNETLINK answers: Network is unreachable" and the like
        RouteLookup lookup;
        lookup.error = result.getErrorMessage();
        return lookup;
    }
    return parseRouteGet(result.stdout_output);
}

ProbeResult IpRouteBackend::probe(const std::string& address, const ProbeOptions& options) {
    // traceroute takes the per-hop wait in seconds
    int hop_seconds = std::max(1, (options.hop_timeout_ms + 999) / 1000);

    CommandResult result = CommandExecutor::execute(
        {"traceroute", "-n", "-q", "1", "-w", std::to_string(hop_seconds),
         "-m", std::to_string(options.max_hops), address},
        options.overall_timeout_ms);

    if (result.notExecuted()) {
        ProbeResult probe_result;
        probe_result.error = "traceroute unavailable: " + result.getErrorMessage();
        return probe_result;
    }

    // A trace cut short by the overall limit still counts the hops it saw
    ProbeResult probe_result = parseTracerouteOutput(result.stdout_output, address);
    probe_result.timed_out = result.timedOut();
    if (!result.isSuccess() && !result.timedOut() && probe_result.hops_answered == 0) {
        probe_result.error = result.getErrorMessage();
    }
    return probe_result;
}

bool IpRouteBackend::hasMutationPrivilege() {
    return geteuid() == 0;
}

std::vector<LiveRouteEntry> IpRouteBackend::parseRouteListing(
    const std::string& output,
    const std::map<std::string, uint32_t>& index_by_name) {
    std::vector<LiveRouteEntry> entries;
    std::istringstream stream(output);
    std::string line;
    bool previous_kept = false;

    while (std::getline(stream, line)) {
        if (line.empty()) {
            continue;
        }

        // Indented lines are nexthops of a multipath route; drop the route
        if (std::isspace(static_cast<unsigned char>(line[0]))) {
            if (previous_kept && contains(line, "nexthop")) {
                entries.pop_back();
                previous_kept = false;
            }
            continue;
        }
        previous_kept = false;

        std::vector<std::string> tokens = splitWhitespace(line);
        if (tokens.empty()) {
            continue;
        }

        size_t pos = 0;
        if (tokens[pos] == "unicast") {
            ++pos;
        } else if (kSkippedRouteTypes.count(tokens[pos])) {
            continue;
        }
        if (pos >= tokens.size()) {
            continue;
        }

        LiveRouteEntry entry;
        entry.protocol = "boot";
        if (tokens[pos] == "default") {
            entry.destination = "0.0.0.0";
            entry.prefix_length = 0;
        } else {
            try {
                Ipv4Prefix prefix = AddressUtils::parseCIDR(tokens[pos]);
                entry.destination = prefix.address();
                entry.prefix_length = prefix.prefix_length;
            } catch (const std::invalid_argument&) {
                Logger::debug(kComponent, "Skipping unparsable route line: " + line);
                continue;
            }
        }
        ++pos;

        bool has_device = false;
        bool multipath = false;
        for (; pos < tokens.size(); ++pos) {
            const std::string& token = tokens[pos];
            if (token == "nexthop") {
                multipath = true;
                break;
            }
            if (!kValuedKeywords.count(token) || pos + 1 >= tokens.size()) {
                continue; // flag such as onlink, linkdown, dead
            }

            const std::string& value = tokens[pos + 1];
            if (token == "via") {
                // "via inet 1.2.3.4" names the family explicitly
                if (value == "inet" && pos + 2 < tokens.size()) {
                    ++pos;
                }
                entry.gateway = tokens[pos + 1];
            } else if (token == "dev") {
                entry.interface_name = value;
                has_device = true;
            } else if (token == "proto") {
                entry.protocol = protocolName(value);
            } else if (token == "metric") {
                try {
                    entry.metric = std::stoi(value);
                } catch (const std::exception&) {
                    entry.metric = 0;
                }
            }
            ++pos;
        }

        if (multipath || !has_device) {
            continue;
        }

        auto it = index_by_name.find(entry.interface_name);
        entry.interface_index = (it != index_by_name.end()) ? it->second : 0;

        entries.push_back(entry);
        previous_kept = true;
    }

    return entries;
}

std::string IpRouteBackend::protocolName(const std::string& value) {
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        return value;
    }
    try {
        auto it = kProtocolNames.find(std::stoi(value));
        if (it != kProtocolNames.end()) {
            return it->second;
        }
    } catch (const std::exception&) {
        // out of int range, keep the text
    }
    return value;
}

RouteLookup IpRouteBackend::parseRouteGet(const std::string& output) {
    RouteLookup lookup;
    std::istringstream stream(output);
    std::string line;
    if (!std::getline(stream, line)) {
        lookup.error = "no route returned";
        return lookup;
    }

    // "10.0.0.1 via 192.168.1.1 dev eth0 src 192.168.1.20 uid 0"
    std::vector<std::string> tokens = splitWhitespace(line);
    if (!tokens.empty() && kSkippedRouteTypes.count(tokens[0])) {
        lookup.error = tokens[0] + " route";
        return lookup;
    }

    for (std::size_t pos = 0; pos + 1 < tokens.size(); ++pos) {
        if (tokens[pos] == "via") {
            lookup.gateway = tokens[pos + 1] == "inet" && pos + 2 < tokens.size() ? tokens[pos + 2]
                                                                                   : tokens[pos + 1];
        } else if (tokens[pos] == "dev") {
            lookup.interface_name = tokens[pos + 1];
        }
    }

    lookup.found = !lookup.interface_name.empty();
    if (!lookup.found) {
        lookup.error = "no output device in: " + line;
    }
    return lookup;
}

MutationResult IpRouteBackend::classifyMutation(const CommandResult& result, bool is_add) {
    MutationResult mutation;
    if (result.isSuccess()) {
        mutation.status = MutationResult::Status::Ok;
        return mutation;
    }

    mutation.message = result.getErrorMessage();

    if (result.timedOut()) {
        mutation.status = MutationResult::Status::Timeout;
    } else if (result.notExecuted()) {
        mutation.status = MutationResult::Status::ExecutionFailed;
    } else if (is_add && contains(result.stderr_output, "File exists")) {
        mutation.status = MutationResult::Status::AlreadyPresent;
    } else if (!is_add && contains(result.stderr_output, "No such process")) {
        mutation.status = MutationResult::Status::AlreadyAbsent;
    } else if (contains(result.stderr_output, "Operation not permitted")) {
        mutation.status = MutationResult::Status::PermissionDenied;
    } else {
        mutation.status = MutationResult::Status::Rejected;
    }
    return mutation;
}

std::vector<std::string> IpRouteBackend::parseGetentOutput(const std::string& output) {
    // Each address appears once per socket type (STREAM, DGRAM, RAW)
    std::vector<std::string> addresses;
    std::istringstream stream(output);
    std::string line;

    while (std::getline(stream, line)) {
        std::vector<std::string> tokens = splitWhitespace(line);
        if (tokens.empty() || !AddressUtils::isValidAddress(tokens[0])) {
            continue;
        }
        if (std::find(addresses.begin(), addresses.end(), tokens[0]) == addresses.end()) {
            addresses.push_back(tokens[0]);
        }
    }
    return addresses;
}

ProbeResult IpRouteBackend::parseTracerouteOutput(const std::string& output, const std::string& target) {
    ProbeResult result;
    std::istringstream stream(output);
    std::string line;

    while (std::getline(stream, line)) {
        std::vector<std::string> tokens = splitWhitespace(line);
        // Hop lines start with the hop number: " 1  192.168.1.1  0.512 ms"
        if (tokens.size() < 2 ||
            tokens[0].find_first_not_of("0123456789") != std::string::npos) {
            continue;
        }

        const std::string& hop = tokens[1];
        if (!AddressUtils::isValidAddress(hop)) {
            continue; // "*" means no answer for this hop
        }

        ++result.hops_answered;
        if (result.first_hop.empty()) {
            result.first_hop = hop;
        }
        if (hop == target) {
            result.reached_destination = true;
        }
    }

    result.responded = result.hops_answered > 0;
    return result;
}

} // namespace routecompose
