/**
 * @file settings.hpp
 * @brief Tool-wide settings and their YAML loading
 * @author route-compose Development Team
 * @date 2026
 *
 * Settings are read from an optional YAML file. Every key is optional;
 * missing keys keep their defaults.
 *
 * @code
 * profiles_dir: /etc/route-compose/profiles
 * snapshot_dir: /var/lib/route-compose/snapshots
 * audit_log: /var/log/route-compose/audit.log
 * lock_file: /run/route-compose.lock
 * route_table: main
 * route_protocol: "250"
 * command_timeout_ms: 5000
 * dns_timeout_ms: 3000
 * snapshot_retention: 20
 * log_level: info
 * probe:
 *   enabled: true
 *   max_hops: 8
 *   hop_timeout_ms: 1000
 *   overall_timeout_ms: 15000
 *   default_target: ""
 * @endcode
 */

#pragma once

#include "logger.hpp"
#include <string>
#include <yaml-cpp/yaml.h>

namespace routecompose {

/// Settings file consulted when no -c option is given
constexpr const char* kDefaultSettingsPath = "/etc/route-compose/settings.yaml";

/**
 * @struct ProbeSettings
 * @brief Reachability probe bounds
 */
struct ProbeSettings {
    bool enabled = true;
    int max_hops = 8;
    int hop_timeout_ms = 1000;
    int overall_timeout_ms = 15000;
    std::string default_target;  ///< Probe address for default routes; empty probes the gateway
};

/**
 * @struct AppSettings
 * @brief Paths, OS binding parameters and defaults for a run
 */
struct AppSettings {
    std::string profiles_dir = "/etc/route-compose/profiles";
    std::string snapshot_dir = "/var/lib/route-compose/snapshots";
    std::string audit_log = "/var/log/route-compose/audit.log";
    std::string lock_file = "/run/route-compose.lock";
    std::string route_table = "main";
    std::string route_protocol = "250";  ///< Numeric protocol tag marking routes this tool owns (5..255)
    int command_timeout_ms = 5000;
    int dns_timeout_ms = 3000;
    int snapshot_retention = 20;         ///< Snapshots kept after each apply, 0 keeps all
    LogLevel log_level = LogLevel::Info;
    ProbeSettings probe;

    bool isValid() const;
    std::string getErrorMessage() const;
};

/**
 * @class SettingsParser
 * @brief Loads AppSettings from YAML
 */
class SettingsParser {
public:
    /**
     * @brief Load settings from a file
     * @param filename Settings file path
     * @param required If false, a missing file yields the defaults
     * @throws std::runtime_error if the file is unreadable, malformed or
     *         missing while required
     */
    static AppSettings loadFromFile(const std::string& filename, bool required);

    /// Load settings from YAML text
    static AppSettings loadFromString(const std::string& yaml_content);
};

} // namespace routecompose

namespace YAML {

template<>
struct convert<routecompose::ProbeSettings> {
    static Node encode(const routecompose::ProbeSettings& probe);
    static bool decode(const Node& node, routecompose::ProbeSettings& probe);
};

template<>
struct convert<routecompose::AppSettings> {
    static Node encode(const routecompose::AppSettings& settings);
    static bool decode(const Node& node, routecompose::AppSettings& settings);
};

} // namespace YAML
