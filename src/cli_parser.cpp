#include "cli_parser.hpp"
#include "route_types.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <getopt.h>
#include <iostream>
#include <map>
#include <stdexcept>

namespace routecompose {

namespace {

// Long-only options
constexpr int kNoValidateOption = 1000;

const std::map<std::string, CLIParser::Command>& commandTable() {
    static const std::map<std::string, CLIParser::Command> table = {
        {"preview", CLIParser::Command::Preview},
        {"apply", CLIParser::Command::Apply},
        {"validate", CLIParser::Command::Validate},
        {"rollback", CLIParser::Command::Rollback},
        {"snapshot", CLIParser::Command::Snapshot},
        {"snapshots", CLIParser::Command::Snapshots},
        {"prune", CLIParser::Command::Prune},
        {"drop", CLIParser::Command::Drop},
        {"profiles", CLIParser::Command::Profiles},
        {"show", CLIParser::Command::Show},
        {"import", CLIParser::Command::Import},
        {"export", CLIParser::Command::Export},
        {"routes", CLIParser::Command::Routes},
        {"interfaces", CLIParser::Command::Interfaces},
        {"history", CLIParser::Command::History},
        {"info", CLIParser::Command::Info},
    };
    return table;
}

bool isCount(const std::string& text) {
    return !text.empty() && text.size() <= 6 &&
           std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); });
}

} // namespace

CLIParser::Options CLIParser::parse(int argc, char* argv[]) {
    Options options;

    static struct option long_options[] = {
        {"settings",     required_argument, 0, 'c'},
        {"profiles-dir", required_argument, 0, 'p'},
        {"snapshot-dir", required_argument, 0, 's'},
        {"audit-log",    required_argument, 0, 'a'},
        {"expect",       required_argument, 0, 'e'},
        {"no-probe",     no_argument,       0, 'n'},
        {"no-validate",  no_argument,       0, kNoValidateOption},
        {"verbose",      no_argument,       0, 'v'},
        {"quiet",        no_argument,       0, 'q'},
        {"debug",        no_argument,       0, 'd'},
        {"license",      no_argument,       0, 'l'},
        {"help",         no_argument,       0, 'h'},
        {0, 0, 0, 0}
    };

    // Reset getopt state so parse() can run more than once per process
    optind = 0;

    int option_index = 0;
    int c;
    while ((c = getopt_long(argc, argv, "c:p:s:a:e:nvqdlh", long_options, &option_index)) != -1) {
        switch (c) {
            case 'c':
                options.settings_file = std::string(optarg);
                break;
            case 'p':
                options.profiles_dir = std::string(optarg);
                break;
            case 's':
                options.snapshot_dir = std::string(optarg);
                break;
            case 'a':
                options.audit_log = std::string(optarg);
                break;
            case 'e':
                try {
                    options.expected_fingerprint = parseFingerprint(optarg);
                } catch (const std::invalid_argument&) {
                    throw std::invalid_argument("--expect needs a 16-digit hexadecimal fingerprint, got '" +
                                                std::string(optarg) + "'");
                }
                break;
            case 'n':
                options.no_probe = true;
                break;
            case kNoValidateOption:
                options.no_validate = true;
                break;
            case 'v':
                options.verbose = true;
                break;
            case 'q':
                options.quiet = true;
                break;
            case 'd':
                options.debug = true;
                break;
            case 'l':
                options.show_license = true;
                break;
            case 'h':
                options.help = true;
                break;
            case '?':
                // getopt_long has already printed the offending option
                throw std::invalid_argument("Unknown option or missing option argument");
            default:
                throw std::invalid_argument("Invalid argument parsing");
        }
    }

    if (optind < argc) {
        options.command = parseCommand(argv[optind]);
        for (int i = optind + 1; i < argc; ++i) {
            options.arguments.push_back(argv[i]);
        }
    }

    if (!options.help) {
        validateOptions(options);
    }
    return options;
}

CLIParser::Command CLIParser::parseCommand(const std::string& word) {
    auto it = commandTable().find(word);
    if (it == commandTable().end()) {
        throw std::invalid_argument("Unknown command: " + word);
    }
    return it->second;
}

std::string CLIParser::commandToString(Command command) {
    for (const auto& entry : commandTable()) {
        if (entry.second == command) {
            return entry.first;
        }
    }
    return "none";
}

bool CLIParser::isMutating(Command command) {
    return command == Command::Apply || command == Command::Rollback;
}

void CLIParser::requireArgumentCount(const Options& options, std::size_t min, std::size_t max) {
    std::size_t count = options.arguments.size();
    if (count >= min && count <= max) {
        return;
    }

    std::string expected = (min == max) ? std::to_string(min)
                                        : std::to_string(min) + " to " + std::to_string(max);
    throw std::invalid_argument("'" + commandToString(options.command) + "' expects " + expected +
                                " argument(s), got " + std::to_string(count));
}

void CLIParser::validateOptions(const Options& options) {
    if (options.verbose && options.quiet) {
        throw std::invalid_argument("--verbose conflicts with --quiet");
    }

    if (options.show_license) {
        if (options.command != Command::None) {
            throw std::invalid_argument("--license conflicts with commands");
        }
        return;
    }

    if (options.command == Command::None) {
        throw std::invalid_argument("No command specified");
    }

    if (options.expected_fingerprint && options.command != Command::Apply) {
        throw std::invalid_argument("--expect is only valid with 'apply'");
    }
    if (options.no_validate && options.command != Command::Apply) {
        throw std::invalid_argument("--no-validate is only valid with 'apply'");
    }

    switch (options.command) {
        case Command::Preview:
        case Command::Apply:
        case Command::Validate:
        case Command::Show:
        case Command::Rollback:
        case Command::Drop:
            requireArgumentCount(options, 1, 1);
            break;
        case Command::Import:
        case Command::Export:
            requireArgumentCount(options, 2, 2);
            break;
        case Command::Prune:
        case Command::History:
            requireArgumentCount(options, 0, 1);
            if (!options.arguments.empty() && !isCount(options.arguments[0])) {
                throw std::invalid_argument("'" + commandToString(options.command) +
                                            "' expects a non-negative count, got '" +
                                            options.arguments[0] + "'");
            }
            break;
        default:
            requireArgumentCount(options, 0, 0);
            break;
    }
}

void CLIParser::printUsage(const std::string& program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS] COMMAND [ARGS]\n\n";
    std::cout << "Persistent IPv4 route profiles for the Linux routing table\n\n";
    std::cout << "Commands:\n";
    std::cout << "  preview PROFILE        Show the operations an apply would perform\n";
    std::cout << "  apply PROFILE          Reconcile the route table with a profile\n";
    std::cout << "  validate PROFILE       Check table presence and reachability of a profile\n";
    std::cout << "  rollback SNAPSHOT_ID   Restore the route table to a snapshot\n";
    std::cout << "  snapshot               Capture the current route table\n";
    std::cout << "  snapshots              List snapshots, newest first\n";
    std::cout << "  prune [KEEP]           Delete all but the KEEP newest snapshots\n";
    std::cout << "  drop SNAPSHOT_ID       Delete one snapshot\n";
    std::cout << "  profiles               List stored profiles\n";
    std::cout << "  show PROFILE           Print a profile\n";
    std::cout << "  import FILE NAME       Store a YAML or CSV file as profile NAME\n";
    std::cout << "  export NAME FILE       Write profile NAME as YAML or CSV\n";
    std::cout << "  routes                 Print the live route table\n";
    std::cout << "  interfaces             Print interfaces and their indices\n";
    std::cout << "  history [N]            Print the last N audit events (default 20)\n";
    std::cout << "  info                   Print system information\n\n";
    std::cout << "PROFILE is a stored profile name, or a file path when it contains '/'\n";
    std::cout << "or ends in .yaml, .yml or .csv.\n\n";
    std::cout << "Options:\n";
    std::cout << "  -c, --settings FILE       Settings file (default /etc/route-compose/settings.yaml)\n";
    std::cout << "  -p, --profiles-dir DIR    Profile store directory\n";
    std::cout << "  -s, --snapshot-dir DIR    Snapshot directory\n";
    std::cout << "  -a, --audit-log FILE      Audit log file\n";
    std::cout << "  -e, --expect FINGERPRINT  Apply only if the live table matches this preview\n";
    std::cout << "  -n, --no-probe            Skip reachability probes\n";
    std::cout << "      --no-validate         Skip validation after apply\n";
    std::cout << "  -v, --verbose             Debug logging\n";
    std::cout << "  -q, --quiet               Only log errors\n";
    std::cout << "  -d, --debug               Debug mode (bypass system validation)\n";
    std::cout << "  -l, --license             Print license information\n";
    std::cout << "  -h, --help                Show this help message\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << program_name << " preview office                  Show planned changes\n";
    std::cout << "  " << program_name << " apply office -e 3f2a...         Apply exactly the previewed plan\n";
    std::cout << "  " << program_name << " import routes.csv office        Import a CSV profile\n";
    std::cout << "  " << program_name << " rollback snap-20260101-120000-ab12\n";
}

void CLIParser::printLicense() {
    const std::vector<std::string> license_paths = {
        "LICENSE",
        "../LICENSE",
        "../../LICENSE",
        "/usr/share/doc/route-compose/LICENSE"
    };

    for (const auto& path : license_paths) {
        std::ifstream license_file(path);
        if (license_file.is_open()) {
            std::string line;
            while (std::getline(license_file, line)) {
                std::cout << line << '\n';
            }
            return;
        }
    }

    // Fallback for installations without a LICENSE file
    std::cout << "route-compose License\n";
    std::cout << "=====================\n\n";
    std::cout << "This software is provided under an open source license.\n";
    std::cout << "Please refer to the LICENSE file in the source distribution\n";
    std::cout << "for complete license terms and conditions.\n";
}

} // namespace routecompose
