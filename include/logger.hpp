/**
 * @file logger.hpp
 * @brief Leveled logging for route-compose
 * @author route-compose Development Team
 * @date 2026
 *
 * Timestamped, leveled logging shared by every component. Error and
 * warning messages go to stderr, informational and debug messages to
 * stdout. Output is serialized because user commands run on background
 * workers.
 */

#pragma once

#include <string>

namespace routecompose {

/**
 * @enum LogLevel
 * @brief Logging levels
 *
 * Controls the verbosity of logging output:
 * - None: No logging output
 * - Error: Only error messages
 * - Warning: Errors and warnings
 * - Info: Errors, warnings, and informational messages
 * - Debug: All messages including detailed execution information
 */
enum class LogLevel {
    None,    ///< No logging
    Error,   ///< Error messages only
    Warning, ///< Error and warning messages
    Info,    ///< Informational messages and above
    Debug    ///< All messages including debug information
};

/**
 * @class Logger
 * @brief Process-wide leveled logger
 *
 * All methods are static. Each line has the form
 * `[YYYY-MM-DD HH:MM:SS.mmm] [LEVEL] Component: message`.
 */
class Logger {
public:
    /**
     * @brief Set the global logging level
     * @param level Messages above this level are discarded
     */
    static void setLevel(LogLevel level);

    /**
     * @brief Get the current logging level
     * @return Current global logging level
     */
    static LogLevel getLevel();

    /**
     * @brief Log a message at the specified level
     * @param level Log level for the message
     * @param component Name of the emitting component
     * @param message Message content
     */
    static void log(LogLevel level, const std::string& component, const std::string& message);

    static void error(const std::string& component, const std::string& message) {
        log(LogLevel::Error, component, message);
    }
    static void warning(const std::string& component, const std::string& message) {
        log(LogLevel::Warning, component, message);
    }
    static void info(const std::string& component, const std::string& message) {
        log(LogLevel::Info, component, message);
    }
    static void debug(const std::string& component, const std::string& message) {
        log(LogLevel::Debug, component, message);
    }

    /**
     * @brief Convert LogLevel enum to string representation
     * @param level LogLevel enum value
     * @return Upper-case level name
     */
    static std::string levelToString(LogLevel level);

    /**
     * @brief Parse a level name ("error", "warning", "info", "debug", "none")
     * @param name Level name, case-insensitive
     * @return Parsed level
     * @throws std::invalid_argument if the name is unknown
     */
    static LogLevel parseLevel(const std::string& name);
};

} // namespace routecompose
