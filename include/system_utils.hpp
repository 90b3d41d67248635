/**
 * @file system_utils.hpp
 * @brief System utilities and requirement checks for route-compose
 * @author route-compose Development Team
 * @date 2026
 *
 * This file contains the SystemUtils class responsible for environment
 * checks: privileges and the availability of the external programs the
 * Linux backend drives (ip, traceroute, getent, timeout).
 */

#pragma once

#include <string>
#include <vector>

namespace routecompose {

/**
 * @class SystemUtils
 * @brief System utilities and validation helper class
 *
 * Route mutations require root (or CAP_NET_ADMIN) and the iproute2 "ip"
 * program. Reachability probes need traceroute and domain destinations
 * need getent; those two are optional and only produce warnings.
 */
class SystemUtils {
public:
    /**
     * @brief Check if the current process is running with root privileges
     * @return true if the effective user ID is 0
     */
    static bool isRunningAsRoot();

    /// True if the iproute2 "ip" program is on PATH
    static bool isIpAvailable();

    /// True if "traceroute" is on PATH
    static bool isTracerouteAvailable();

    /// True if "getent" is on PATH
    static bool isGetentAvailable();

    /**
     * @brief Get the name of the current system user
     * @return Username, or "unknown" if it cannot be resolved
     */
    static std::string getCurrentUser();

    /**
     * @brief Get the version line of the installed iproute2
     * @return Version text, "not available" or "unknown"
     */
    static std::string getIpVersion();

    /**
     * @brief Validate the requirements for mutating commands
     * @return Error messages, empty if every requirement is met
     *
     * Checks root privileges and the "ip" and "timeout" programs. Missing
     * optional programs are reported by optionalToolWarnings().
     */
    static std::vector<std::string> validateSystemRequirements();

    /// Warnings for missing optional programs (traceroute, getent)
    static std::vector<std::string> optionalToolWarnings();

    /**
     * @brief Print system information to stdout
     *
     * Displays the user context, privilege status, tool availability and
     * the working directory. Used by the "info" command.
     */
    static void printSystemInfo();
};

} // namespace routecompose
