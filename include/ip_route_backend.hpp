/**
 * @file ip_route_backend.hpp
 * @brief NetworkBackend implementation driving iproute2, getent and traceroute
 * @author route-compose Development Team
 * @date 2026
 *
 * Route-table operations map onto `ip -4 route` commands against one
 * routing table:
 * - list:   ip -N -4 route show table T
 * - add:    ip -4 route append DST/LEN via GW dev IF metric M proto P table T
 * - delete: ip -4 route del DST/LEN via GW dev IF metric M table T
 * - lookup: ip -4 route get ADDR
 *
 * `append` lets a replacement route coexist with the entry it replaces,
 * which is what makes the add-new-then-delete-old ordering possible.
 * Routes added by this backend carry a protocol tag so later sessions can
 * tell them apart from routes installed by the kernel, DHCP or the admin.
 *
 * The output parsers are public and static so they can be tested against
 * captured command output.
 */

#pragma once

#include "command_executor.hpp"
#include "network_backend.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace routecompose {

/**
 * @struct IpRouteBackendOptions
 * @brief Table selection and time limits for the iproute2 backend
 */
struct IpRouteBackendOptions {
    std::string table = "main";     ///< Routing table name or number
    int command_timeout_ms = 5000;  ///< Limit for each ip invocation
    int dns_timeout_ms = 3000;      ///< Limit for each getent lookup
};

/**
 * @class IpRouteBackend
 * @brief Production NetworkBackend for Linux
 */
class IpRouteBackend : public NetworkBackend {
public:
    explicit IpRouteBackend(IpRouteBackendOptions options = IpRouteBackendOptions());

    std::vector<LiveRouteEntry> listRoutes() override;
    MutationResult addRoute(const LiveRouteEntry& entry, const std::string& protocol) override;
    MutationResult deleteRoute(const LiveRouteEntry& entry) override;
    std::vector<InterfaceInfo> listInterfaces() override;
    std::vector<std::string> resolveHost(const std::string& name) override;
    RouteLookup lookupRoute(const std::string& address) override;
    ProbeResult probe(const std::string& address, const ProbeOptions& options) override;
    bool hasMutationPrivilege() override;

    /**
     * @brief Parse `ip -N -4 route show` output
     * @param output Command output
     * @param index_by_name Interface name to ifIndex mapping used to fill interface_index
     * @return Unicast single-path entries in output order
     *
     * Typed routes (blackhole, unreachable, local, ...) and multipath
     * routes are skipped. "default" is 0.0.0.0/0, a missing metric is 0
     * and a missing protocol is "boot", which ip omits when printing.
     * Protocol numbers are translated by protocolName().
     */
    static std::vector<LiveRouteEntry> parseRouteListing(
        const std::string& output,
        const std::map<std::string, uint32_t>& index_by_name);

    /**
     * @brief Name of a printed route protocol
     *
     * The kernel's own numbers (redirect, kernel, boot, static, dhcp) map
     * to their names. Any other value is returned unchanged, so a tag
     * compares equal to the configured number whatever rt_protos says.
     */
    static std::string protocolName(const std::string& value);

    /// Parse the first line of `ip -4 route get` output
    static RouteLookup parseRouteGet(const std::string& output);

    /**
     * @brief Device to name in a command for @p entry
     * @return The device currently holding the entry's ifIndex, or for an
     *         entry read with no index, its recorded name if that device
     *         exists; empty if neither is present
     */
    static std::string deviceName(const LiveRouteEntry& entry);

    /// Build the "DST/LEN [via GW] [dev IF] metric M" argument tail
    static std::vector<std::string> routeArguments(const LiveRouteEntry& entry, const std::string& device);

    /**
     * @brief Classify the outcome of an add or delete command
     * @param result Result of the ip invocation
     * @param is_add true for add, false for delete
     */
    static MutationResult classifyMutation(const CommandResult& result, bool is_add);

    /**
     * @brief Parse `getent ahostsv4` output into unique addresses, first-seen order
     */
    static std::vector<std::string> parseGetentOutput(const std::string& output);

    /**
     * @brief Parse `traceroute -n -q 1` output
     * @param output Command output, possibly truncated by a timeout
     * @param target Probed address, used to detect that the destination answered
     */
    static ProbeResult parseTracerouteOutput(const std::string& output, const std::string& target);

private:
    IpRouteBackendOptions options_;
};

} // namespace routecompose
