#include "settings.hpp"
#include "address_utils.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <stdexcept>

namespace routecompose {

namespace {

// Numbers up to RTPROT_STATIC belong to the kernel, boot and admin routes
constexpr int kMaxReservedProtocol = 4;

} // namespace

bool AppSettings::isValid() const {
    return getErrorMessage().empty();
}

std::string AppSettings::getErrorMessage() const {
    if (profiles_dir.empty()) {
        return "profiles_dir must not be empty";
    }
    if (snapshot_dir.empty()) {
        return "snapshot_dir must not be empty";
    }
    if (route_table.empty()) {
        return "route_table must not be empty";
    }
    if (route_protocol.empty() ||
        !std::all_of(route_protocol.begin(), route_protocol.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; }) ||
        route_protocol.size() > 3 || std::stoi(route_protocol) <= kMaxReservedProtocol ||
        std::stoi(route_protocol) > 255) {
        return "route_protocol must be a protocol number between " +
               std::to_string(kMaxReservedProtocol + 1) + " and 255";
    }
    if (command_timeout_ms <= 0) {
        return "command_timeout_ms must be positive";
    }
    if (dns_timeout_ms <= 0) {
        return "dns_timeout_ms must be positive";
    }
    if (snapshot_retention < 0) {
        return "snapshot_retention must not be negative";
    }
    if (probe.max_hops < 1 || probe.max_hops > 64) {
        return "probe.max_hops must be between 1 and 64";
    }
    if (probe.hop_timeout_ms <= 0 || probe.overall_timeout_ms <= 0) {
        return "probe timeouts must be positive";
    }
    if (!probe.default_target.empty() && !AddressUtils::isValidAddress(probe.default_target)) {
        return "probe.default_target must be an IPv4 address";
    }
    return "";
}

AppSettings SettingsParser::loadFromFile(const std::string& filename, bool required) {
    std::error_code ec;
    if (!std::filesystem::exists(filename, ec)) {
        if (required) {
            throw std::runtime_error("Settings file not found: " + filename);
        }
        return AppSettings();
    }

    try {
        YAML::Node node = YAML::LoadFile(filename);
        if (node.IsNull()) {
            return AppSettings();
        }
        AppSettings settings = node.as<AppSettings>();
        if (!settings.isValid()) {
            throw std::runtime_error("Invalid settings: " + settings.getErrorMessage());
        }
        return settings;
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Settings parsing error in " + filename + ": " + std::string(e.what()));
    }
}

AppSettings SettingsParser::loadFromString(const std::string& yaml_content) {
    try {
        YAML::Node node = YAML::Load(yaml_content);
        if (node.IsNull()) {
            return AppSettings();
        }
        AppSettings settings = node.as<AppSettings>();
        if (!settings.isValid()) {
            throw std::runtime_error("Invalid settings: " + settings.getErrorMessage());
        }
        return settings;
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Settings parsing error: " + std::string(e.what()));
    }
}

} // namespace routecompose

// YAML conversion implementations
namespace YAML {

using namespace routecompose;

Node convert<ProbeSettings>::encode(const ProbeSettings& probe) {
    Node node;
    node["enabled"] = probe.enabled;
    node["max_hops"] = probe.max_hops;
    node["hop_timeout_ms"] = probe.hop_timeout_ms;
    node["overall_timeout_ms"] = probe.overall_timeout_ms;
    node["default_target"] = probe.default_target;
    return node;
}

bool convert<ProbeSettings>::decode(const Node& node, ProbeSettings& probe) {
    if (!node.IsMap()) return false;

    if (node["enabled"]) probe.enabled = node["enabled"].as<bool>();
    if (node["max_hops"]) probe.max_hops = node["max_hops"].as<int>();
    if (node["hop_timeout_ms"]) probe.hop_timeout_ms = node["hop_timeout_ms"].as<int>();
    if (node["overall_timeout_ms"]) probe.overall_timeout_ms = node["overall_timeout_ms"].as<int>();
    if (node["default_target"]) probe.default_target = node["default_target"].as<std::string>();
    return true;
}

Node convert<AppSettings>::encode(const AppSettings& settings) {
    std::string level = Logger::levelToString(settings.log_level);
    std::transform(level.begin(), level.end(), level.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    Node node;
    node["profiles_dir"] = settings.profiles_dir;
    node["snapshot_dir"] = settings.snapshot_dir;
    node["audit_log"] = settings.audit_log;
    node["lock_file"] = settings.lock_file;
    node["route_table"] = settings.route_table;
    node["route_protocol"] = settings.route_protocol;
    node["command_timeout_ms"] = settings.command_timeout_ms;
    node["dns_timeout_ms"] = settings.dns_timeout_ms;
    node["snapshot_retention"] = settings.snapshot_retention;
    node["log_level"] = level;
    node["probe"] = settings.probe;
    return node;
}

bool convert<AppSettings>::decode(const Node& node, AppSettings& settings) {
    if (!node.IsMap()) return false;

    if (node["profiles_dir"]) settings.profiles_dir = node["profiles_dir"].as<std::string>();
    if (node["snapshot_dir"]) settings.snapshot_dir = node["snapshot_dir"].as<std::string>();
    if (node["audit_log"]) settings.audit_log = node["audit_log"].as<std::string>();
    if (node["lock_file"]) settings.lock_file = node["lock_file"].as<std::string>();
    if (node["route_table"]) settings.route_table = node["route_table"].as<std::string>();
    if (node["route_protocol"]) settings.route_protocol = node["route_protocol"].as<std::string>();
    if (node["command_timeout_ms"]) settings.command_timeout_ms = node["command_timeout_ms"].as<int>();
    if (node["dns_timeout_ms"]) settings.dns_timeout_ms = node["dns_timeout_ms"].as<int>();
    if (node["snapshot_retention"]) settings.snapshot_retention = node["snapshot_retention"].as<int>();
    if (node["log_level"]) {
        try {
            settings.log_level = Logger::parseLevel(node["log_level"].as<std::string>());
        } catch (const std::invalid_argument&) {
            return false;
        }
    }
    if (node["probe"]) {
        if (!node["probe"].IsMap()) return false;
        settings.probe = node["probe"].as<ProbeSettings>();
    }
    return true;
}

} // namespace YAML
