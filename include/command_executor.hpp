/**
 * @file command_executor.hpp
 * @brief Bounded command execution for route-compose
 * @author route-compose Development Team
 * @date 2026
 *
 * This file contains the CommandExecutor class which runs system commands
 * (ip, getent, traceroute) with a hard time limit and captures their
 * standard output, standard error and exit code separately. Every OS
 * interaction of the production network backend goes through it.
 */

#pragma once

#include <string>
#include <vector>

namespace routecompose {

/**
 * @struct CommandResult
 * @brief Structure representing the result of a command execution
 *
 * Contains exit status, output streams and helper methods for result
 * analysis. Used by all CommandExecutor methods to provide detailed
 * execution feedback.
 */
struct CommandResult {
    bool success = false;           ///< Whether the command executed without errors
    int exit_code = -1;             ///< Process exit code (0 = success)
    bool spawned = false;           ///< Whether the shell could be started at all
    std::string stdout_output;      ///< Standard output from the command
    std::string stderr_output;      ///< Standard error output from the command
    std::string command;            ///< The actual command that was executed

    /**
     * @brief Check if the command executed successfully
     * @return true if exit code is 0 and success flag is true
     */
    bool isSuccess() const {
        return success && exit_code == 0;
    }

    /**
     * @brief Check whether the time limit killed the command
     *
     * The `timeout` wrapper exits with 124 when the limit expires and
     * 137 when it had to escalate to SIGKILL.
     */
    bool timedOut() const {
        return exit_code == 124 || exit_code == 137;
    }

    /**
     * @brief Check whether the command itself could not be run
     *
     * True when the shell could not be spawned or the program was not
     * found (126/127).
     */
    bool notExecuted() const {
        return !spawned || exit_code == 126 || exit_code == 127;
    }

    /**
     * @brief Get error message if command failed
     * @return Error message string or empty string if successful
     *
     * Prefers the command's own stderr text, which is what the OS
     * reported, over a generic exit-code description.
     */
    std::string getErrorMessage() const {
        if (isSuccess()) {
            return "";
        }
        if (timedOut()) {
            return "timed out";
        }
        if (!stderr_output.empty()) {
            return stderr_output;
        }
        return "exit code " + std::to_string(exit_code);
    }
};

/**
 * @class CommandExecutor
 * @brief Command executor with time limits and structured results
 *
 * All methods are static. Commands are given as argument vectors and
 * are escaped before being handed to the shell. When a time limit is
 * given the command is wrapped in coreutils `timeout`, so a hung `ip`
 * or `traceroute` can never block a session indefinitely.
 */
class CommandExecutor {
public:
    /**
     * @brief Execute a command with argument vector
     * @param args Command arguments (first is the command, rest are arguments)
     * @param timeout_ms Time limit in milliseconds, 0 for none
     * @return CommandResult with execution details
     *
     * An empty argument vector yields a failed, not-spawned result.
     */
    static CommandResult execute(const std::vector<std::string>& args, int timeout_ms = 0);

    /**
     * @brief Check whether a program is available in PATH
     * @param program Program name, e.g. "ip"
     */
    static bool isCommandAvailable(const std::string& program);

    /**
     * @brief Join and escape an argument vector into a shell command line
     * @param args Command arguments
     * @return Escaped command string
     */
    static std::string argsToCommand(const std::vector<std::string>& args);

    /**
     * @brief Escape shell argument for safe execution
     * @param arg Argument to escape
     * @return Argument unchanged if it has no shell metacharacters, otherwise single-quoted
     */
    static std::string escapeShellArg(const std::string& arg);

private:
    /**
     * @brief Run a prepared command line, capturing stdout and stderr separately
     * @param command Escaped command line
     * @return CommandResult with execution details
     */
    static CommandResult executeInternal(const std::string& command);
};

} // namespace routecompose
