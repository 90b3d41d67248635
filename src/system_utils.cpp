#include "system_utils.hpp"
#include "command_executor.hpp"
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <pwd.h>
#include <sys/types.h>
#include <unistd.h>

namespace routecompose {

bool SystemUtils::isRunningAsRoot() {
    // Effective user ID decides privilege, so sudo and setuid both count
    return geteuid() == 0;
}

bool SystemUtils::isIpAvailable() {
    return CommandExecutor::isCommandAvailable("ip");
}

bool SystemUtils::isTracerouteAvailable() {
    return CommandExecutor::isCommandAvailable("traceroute");
}

bool SystemUtils::isGetentAvailable() {
    return CommandExecutor::isCommandAvailable("getent");
}

std::string SystemUtils::getCurrentUser() {
    struct passwd* pw = getpwuid(geteuid());
    if (pw) {
        return std::string(pw->pw_name);
    }
    return "unknown";
}

std::string SystemUtils::getIpVersion() {
    if (!isIpAvailable()) {
        return "not available";
    }

    CommandResult result = CommandExecutor::execute({"ip", "-V"}, 2000);
    std::string version = result.stdout_output;
    if (!result.isSuccess() || version.empty()) {
        return "unknown";
    }

    while (!version.empty() && (version.back() == '\n' || version.back() == '\r')) {
        version.pop_back();
    }
    return version;
}

std::vector<std::string> SystemUtils::validateSystemRequirements() {
    std::vector<std::string> errors;

    // Route table mutations need CAP_NET_ADMIN, which in practice means root
    if (!isRunningAsRoot()) {
        errors.push_back("This application requires root privileges to modify the route table");
        errors.push_back("Debug: Current effective UID is " + std::to_string(geteuid()) +
                         " (root UID is 0)");
        errors.push_back("Debug: Try running with 'sudo' or as root user");
    }

    if (!isIpAvailable()) {
        errors.push_back("ip command not found in system PATH");
        errors.push_back("Debug: Install with 'apt install iproute2' (Ubuntu/Debian) or 'dnf install iproute' (Fedora/RHEL)");

        const char* path = std::getenv("PATH");
        if (path) {
            errors.push_back("Debug: Current PATH: " + std::string(path));
        }
    }

    // Every OS call is wrapped in coreutils timeout
    if (!CommandExecutor::isCommandAvailable("timeout")) {
        errors.push_back("timeout command not found in system PATH (coreutils)");
    }

    return errors;
}

std::vector<std::string> SystemUtils::optionalToolWarnings() {
    std::vector<std::string> warnings;
    if (!isTracerouteAvailable()) {
        warnings.push_back("traceroute not found; reachability probes will report NotProbed");
    }
    if (!isGetentAvailable()) {
        warnings.push_back("getent not found; domain destinations cannot be resolved");
    }
    return warnings;
}

void SystemUtils::printSystemInfo() {
    std::cout << "System Information:\n";
    std::cout << "==================\n";

    uid_t ruid = getuid();
    uid_t euid = geteuid();

    std::cout << "Real User ID: " << ruid;
    struct passwd* real_user = getpwuid(ruid);
    if (real_user != nullptr) {
        std::cout << " (" << real_user->pw_name << ")";
    }
    std::cout << "\n";

    std::cout << "Effective User ID: " << euid;
    struct passwd* eff_user = getpwuid(euid);
    if (eff_user != nullptr) {
        std::cout << " (" << eff_user->pw_name << ")";
    }
    std::cout << "\n";

    std::cout << "Running as root: " << (isRunningAsRoot() ? "Yes" : "No") << "\n";
    std::cout << "ip available: " << (isIpAvailable() ? "Yes" : "No") << "\n";
    std::cout << "ip version: " << getIpVersion() << "\n";
    std::cout << "traceroute available: " << (isTracerouteAvailable() ? "Yes" : "No") << "\n";
    std::cout << "getent available: " << (isGetentAvailable() ? "Yes" : "No") << "\n";

    try {
        std::filesystem::path cwd = std::filesystem::current_path();
        std::cout << "Working directory: " << cwd.string() << "\n";
    } catch (const std::filesystem::filesystem_error&) {
        // Current directory may have been removed underneath us
        std::cout << "Working directory: <unable to determine>\n";
    }

    const char* path = std::getenv("PATH");
    if (path) {
        std::cout << "PATH: " << path << "\n";
    }

    std::cout << "\n";
}

} // namespace routecompose
