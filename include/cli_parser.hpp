/**
 * @file cli_parser.hpp
 * @brief Command line interface parser for route-compose
 * @author route-compose Development Team
 * @date 2026
 *
 * This file contains the CLIParser class responsible for parsing command
 * line arguments with getopt_long, validating argument counts and option
 * combinations, and printing usage and license text.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace routecompose {

/**
 * @class CLIParser
 * @brief Command line argument parser and help system
 *
 * The command line has the form
 * @code
 * route-compose [OPTIONS] COMMAND [ARGS]
 * @endcode
 * Options may appear before or after the command. Every parse error is
 * raised as std::invalid_argument with a message suitable for the user.
 */
class CLIParser {
public:
    /**
     * @enum Command
     * @brief Top-level commands
     */
    enum class Command {
        None,
        Preview,     ///< preview PROFILE
        Apply,       ///< apply PROFILE
        Validate,    ///< validate PROFILE
        Rollback,    ///< rollback SNAPSHOT_ID
        Snapshot,    ///< snapshot
        Snapshots,   ///< snapshots
        Prune,       ///< prune [KEEP]
        Drop,        ///< drop SNAPSHOT_ID
        Profiles,    ///< profiles
        Show,        ///< show PROFILE
        Import,      ///< import FILE NAME
        Export,      ///< export NAME FILE
        Routes,      ///< routes
        Interfaces,  ///< interfaces
        History,     ///< history [N]
        Info         ///< info
    };

    /**
     * @struct Options
     * @brief Parsed command line
     */
    struct Options {
        Command command = Command::None;
        std::vector<std::string> arguments;          ///< Positional arguments after the command
        std::optional<std::string> settings_file;    ///< -c, --settings
        std::optional<std::string> profiles_dir;     ///< -p, --profiles-dir
        std::optional<std::string> snapshot_dir;     ///< -s, --snapshot-dir
        std::optional<std::string> audit_log;        ///< -a, --audit-log
        std::optional<uint64_t> expected_fingerprint; ///< -e, --expect
        bool no_probe = false;      ///< Skip reachability probes
        bool no_validate = false;   ///< Skip post-apply validation
        bool verbose = false;       ///< Debug logging
        bool quiet = false;         ///< Error-only logging
        bool debug = false;         ///< Bypass system requirement checks
        bool show_license = false;  ///< Display license information
        bool help = false;          ///< Display help information
    };

    /**
     * @brief Parse command line arguments
     * @param argc Argument count from main()
     * @param argv Argument vector from main()
     * @return Parsed and validated options
     * @throws std::invalid_argument for unknown options or commands, wrong
     *         argument counts and conflicting options
     */
    static Options parse(int argc, char* argv[]);

    /**
     * @brief Map a command word to its enum
     * @throws std::invalid_argument if the word is not a command
     */
    static Command parseCommand(const std::string& word);

    static std::string commandToString(Command command);

    /// True for commands that change the route table
    static bool isMutating(Command command);

    static void printUsage(const std::string& program_name);

    static void printLicense();

private:
    static void validateOptions(const Options& options);
    static void requireArgumentCount(const Options& options, std::size_t min, std::size_t max);
};

} // namespace routecompose
