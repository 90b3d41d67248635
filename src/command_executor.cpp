#include "command_executor.hpp"
#include "logger.hpp"
#include <array>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <sys/wait.h>
#include <unistd.h>

namespace routecompose {

namespace {

const char* kComponent = "CommandExecutor";

void trimTrailingNewlines(std::string& text) {
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
        text.pop_back();
    }
}

} // namespace

CommandResult CommandExecutor::execute(const std::vector<std::string>& args, int timeout_ms) {
    if (args.empty()) {
        CommandResult result;
        result.success = false;
        result.exit_code = -1;
        result.stderr_output = "No command specified";
        return result;
    }

    std::vector<std::string> full_args;
    if (timeout_ms > 0) {
        // -k escalates to SIGKILL if the command ignores SIGTERM
        std::ostringstream seconds;
        seconds << (timeout_ms / 1000) << "." << std::to_string(1000 + timeout_ms % 1000).substr(1);
        full_args = {"timeout", "-k", "1", seconds.str()};
    }
    full_args.insert(full_args.end(), args.begin(), args.end());

    return executeInternal(argsToCommand(full_args));
}

bool CommandExecutor::isCommandAvailable(const std::string& program) {
    // Check if the program is available in the system PATH
    CommandResult result = executeInternal("command -v " + escapeShellArg(program));
    return result.isSuccess();
}

CommandResult CommandExecutor::executeInternal(const std::string& command) {
    CommandResult result;
    result.command = command;

    Logger::debug(kComponent, "Executing command: " + command);

    // Each call gets its own stderr capture file: commands run concurrently
    // on background workers, so a per-process name would collide
    char stderr_path[] = "/tmp/route-compose-stderr-XXXXXX";
    int stderr_fd = mkstemp(stderr_path);
    if (stderr_fd < 0) {
        result.stderr_output = "Failed to create stderr capture file";
        Logger::error(kComponent, result.stderr_output + " for command: " + command);
        return result;
    }
    close(stderr_fd);

    std::string full_command = command + " 2>" + stderr_path;

    std::array<char, 4096> buffer;
    std::string stdout_result;

    FILE* raw_pipe = popen(full_command.c_str(), "r");
    if (!raw_pipe) {
        unlink(stderr_path);
        result.stderr_output = "Failed to execute command";
        Logger::error(kComponent, "Failed to create pipe for command: " + command);
        return result;
    }
    result.spawned = true;

    // Read stdout
    while (fgets(buffer.data(), buffer.size(), raw_pipe) != nullptr) {
        stdout_result += buffer.data();
    }

    // pclose() returns the wait status of the shell
    int status = pclose(raw_pipe);
    if (status == -1) {
        result.exit_code = -1;
    } else if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }

    // Read stderr from the capture file
    {
        std::ifstream stderr_file(stderr_path);
        std::ostringstream stderr_content;
        stderr_content << stderr_file.rdbuf();
        result.stderr_output = stderr_content.str();
    }
    unlink(stderr_path);

    result.stdout_output = stdout_result;
    result.success = (result.exit_code == 0);

    trimTrailingNewlines(result.stdout_output);
    trimTrailingNewlines(result.stderr_output);

    if (result.success) {
        Logger::debug(kComponent, "Command completed successfully");
        if (!result.stdout_output.empty()) {
            Logger::debug(kComponent, "Stdout: " + result.stdout_output);
        }
    } else {
        // Failures are classified by callers; several are benign
        // ("File exists" on add), so they are logged at debug level here
        Logger::debug(kComponent, "Command failed with exit code: " + std::to_string(result.exit_code));
        if (!result.stderr_output.empty()) {
            Logger::debug(kComponent, "Stderr: " + result.stderr_output);
        }
    }

    return result;
}

std::string CommandExecutor::argsToCommand(const std::vector<std::string>& args) {
    if (args.empty()) {
        return "";
    }

    std::ostringstream command;
    for (size_t i = 0; i < args.size(); ++i) {
        if (i > 0) {
            command << " ";
        }
        command << escapeShellArg(args[i]);
    }

    return command.str();
}

std::string CommandExecutor::escapeShellArg(const std::string& arg) {
    if (arg.empty()) {
        return "''";
    }

    // If argument contains no special characters, return as-is
    if (arg.find_first_of(" \t\n\r\"'\\$`|&;<>(){}[]?*~#!") == std::string::npos) {
        return arg;
    }

    // Escape argument with single quotes
    std::string escaped = "'";
    for (char c : arg) {
        if (c == '\'') {
            escaped += "'\"'\"'";  // End quote, escaped single quote, start quote
        } else {
            escaped += c;
        }
    }
    escaped += "'";

    return escaped;
}

} // namespace routecompose
