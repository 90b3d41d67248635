#include "logger.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>

namespace routecompose {

namespace {

std::atomic<LogLevel> current_level{LogLevel::Info};
std::mutex output_mutex;

} // namespace

void Logger::setLevel(LogLevel level) {
    current_level.store(level);
}

LogLevel Logger::getLevel() {
    return current_level.load();
}

void Logger::log(LogLevel level, const std::string& component, const std::string& message) {
    if (level == LogLevel::None || level > current_level.load()) {
        return;
    }

    // Get current timestamp with millisecond precision
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm local_tm{};
    localtime_r(&time_t, &local_tm);

    std::ostringstream timestamp;
    timestamp << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
    timestamp << '.' << std::setfill('0') << std::setw(3) << ms.count();

    std::string level_str;
    std::ostream* output_stream = &std::cout;

    switch (level) {
        case LogLevel::Error:
            level_str = "ERROR";
            output_stream = &std::cerr;
            break;
        case LogLevel::Warning:
            level_str = "WARN ";
            output_stream = &std::cerr;
            break;
        case LogLevel::Info:
            level_str = "INFO ";
            break;
        case LogLevel::Debug:
            level_str = "DEBUG";
            break;
        case LogLevel::None:
            return;
    }

    std::lock_guard<std::mutex> lock(output_mutex);
    *output_stream << "[" << timestamp.str() << "] [" << level_str << "] " << component << ": "
                   << message << std::endl;
}

std::string Logger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Error:
            return "ERROR";
        case LogLevel::Warning:
            return "WARNING";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::None:
            return "NONE";
        default:
            return "UNKNOWN";
    }
}

LogLevel Logger::parseLevel(const std::string& name) {
    std::string value = name;
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (value == "none") return LogLevel::None;
    if (value == "error") return LogLevel::Error;
    if (value == "warning" || value == "warn") return LogLevel::Warning;
    if (value == "info") return LogLevel::Info;
    if (value == "debug") return LogLevel::Debug;

    throw std::invalid_argument("Unknown log level: " + name);
}

} // namespace routecompose
