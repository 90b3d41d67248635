#include "audit_log.hpp"
#include "logger.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace routecompose {

namespace {

const char* kComponent = "AuditLog";

// One event per line: embedded line breaks would split a record
std::string singleLine(std::string text) {
    for (auto& c : text) {
        if (c == '\n' || c == '\r') {
            c = ' ';
        }
    }
    return text;
}

} // namespace

AuditLog::AuditLog(std::string path)
    : path_(std::move(path)) {
}

void AuditLog::record(const std::string& intent, const std::string& operation, const std::string& outcome) {
    AuditEvent event;
    event.timestamp = currentTimestamp();
    event.intent = intent;
    event.operation = operation;
    event.outcome = outcome;
    append(event);
}

void AuditLog::append(const AuditEvent& event) {
    if (path_.empty()) {
        return;
    }

    std::string line = formatEvent(event);

    std::lock_guard<std::mutex> lock(mutex_);
    try {
        std::filesystem::path parent = std::filesystem::path(path_).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent);
        }

        std::ofstream file(path_, std::ios::app);
        if (!file.is_open()) {
            Logger::error(kComponent, "Unable to open audit log for writing: " + path_);
            return;
        }
        file << line << '\n';
        file.flush();
        if (!file) {
            Logger::error(kComponent, "Failed to write audit event to " + path_);
        }
    } catch (const std::filesystem::filesystem_error& e) {
        Logger::error(kComponent, "Failed to prepare audit log " + path_ + ": " + e.what());
    }
}

std::vector<AuditEvent> AuditLog::readAll() const {
    std::vector<AuditEvent> events;
    if (path_.empty()) {
        return events;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    std::ifstream file(path_);
    if (!file.is_open()) {
        return events;
    }

    std::string line;
    std::size_t line_number = 0;
    while (std::getline(file, line)) {
        ++line_number;
        if (line.empty()) {
            continue;
        }
        try {
            events.push_back(parseEvent(line));
        } catch (const std::runtime_error& e) {
            Logger::warning(kComponent, path_ + ":" + std::to_string(line_number) + ": " + e.what());
        }
    }
    return events;
}

std::vector<AuditEvent> AuditLog::tail(std::size_t count) const {
    std::vector<AuditEvent> events = readAll();
    if (events.size() > count) {
        events.erase(events.begin(), events.end() - static_cast<std::ptrdiff_t>(count));
    }
    return events;
}

std::string AuditLog::formatEvent(const AuditEvent& event) {
    YAML::Emitter out;
    out << YAML::Flow << YAML::BeginMap;
    out << YAML::Key << "timestamp" << YAML::Value << singleLine(event.timestamp);
    out << YAML::Key << "intent" << YAML::Value << singleLine(event.intent);
    out << YAML::Key << "operation" << YAML::Value << singleLine(event.operation);
    out << YAML::Key << "outcome" << YAML::Value << singleLine(event.outcome);
    out << YAML::EndMap;
    return out.c_str();
}

AuditEvent AuditLog::parseEvent(const std::string& line) {
    try {
        YAML::Node node = YAML::Load(line);
        if (!node.IsMap() || !node["timestamp"] || !node["operation"] || !node["outcome"]) {
            throw std::runtime_error("not an audit event");
        }

        AuditEvent event;
        event.timestamp = node["timestamp"].as<std::string>();
        event.intent = node["intent"] ? node["intent"].as<std::string>() : "";
        event.operation = node["operation"].as<std::string>();
        event.outcome = node["outcome"].as<std::string>();
        return event;
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("YAML parsing error: " + std::string(e.what()));
    }
}

} // namespace routecompose
