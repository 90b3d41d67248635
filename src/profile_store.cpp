#include "profile_store.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <map>
#include <regex>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace routecompose {

namespace {

const char* kComponent = "ProfileStore";

const std::vector<std::string> kCsvColumns = {
    "destination", "gateway", "interface", "metric", "group", "enabled", "description"
};

std::string trim(const std::string& value) {
    auto begin = value.find_first_not_of(" \t\r");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = value.find_last_not_of(" \t\r");
    return value.substr(begin, end - begin + 1);
}

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string readFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Unable to open file for reading: " + path);
    }
    std::ostringstream content;
    content << file.rdbuf();
    return content.str();
}

void writeFile(const std::string& path, const std::string& content) {
    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        throw std::runtime_error("Unable to open file for writing: " + path);
    }
    file << content;
    if (!file) {
        throw std::runtime_error("Failed to write file: " + path);
    }
}

Profile parseYaml(const std::string& content, const std::string& fallback_name) {
    Profile profile;
    try {
        YAML::Node node = YAML::Load(content);
        profile = node.as<Profile>();
    } catch (const YAML::Exception& e) {
        throw ValidationError("YAML parsing error: " + std::string(e.what()));
    }

    if (profile.name.empty()) {
        profile.name = fallback_name;
    }
    if (!profile.isValid()) {
        throw ValidationError("Invalid profile '" + profile.name + "': " + profile.getErrorMessage());
    }
    return profile;
}

} // namespace

ProfileStore::ProfileStore(std::string directory)
    : directory_(std::move(directory)) {
}

std::vector<std::string> ProfileStore::list() const {
    std::vector<std::string> names;

    std::error_code ec;
    if (!fs::is_directory(directory_, ec)) {
        return names;
    }

    for (const auto& entry : fs::directory_iterator(directory_, ec)) {
        if (!entry.is_regular_file() || entry.path().extension() != ".yaml") {
            continue;
        }
        std::string name = entry.path().stem().string();
        if (isValidName(name)) {
            names.push_back(name);
        }
    }
    if (ec) {
        Logger::warning(kComponent, "Failed to list " + directory_ + ": " + ec.message());
    }

    std::sort(names.begin(), names.end());
    return names;
}

Profile ProfileStore::load(const std::string& name) const {
    if (!isValidName(name)) {
        throw std::runtime_error("Invalid profile name: '" + name + "'");
    }
    if (!exists(name)) {
        throw std::runtime_error("Profile not found: " + name);
    }
    Logger::debug(kComponent, "Loading profile " + name + " from " + pathFor(name));
    return parseYaml(readFile(pathFor(name)), name);
}

void ProfileStore::save(const Profile& profile) const {
    if (!isValidName(profile.name)) {
        throw ValidationError("Invalid profile name: '" + profile.name + "'");
    }
    if (!profile.isValid()) {
        throw ValidationError("Invalid profile '" + profile.name + "': " + profile.getErrorMessage());
    }

    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        throw std::runtime_error("Unable to create profiles directory " + directory_ + ": " + ec.message());
    }

    saveFile(profile, pathFor(profile.name));
    Logger::info(kComponent, "Saved profile " + profile.name + " (" +
                 std::to_string(profile.routes.size()) + " routes)");
}

bool ProfileStore::remove(const std::string& name) const {
    if (!isValidName(name)) {
        return false;
    }
    std::error_code ec;
    bool removed = fs::remove(pathFor(name), ec);
    if (ec) {
        throw std::runtime_error("Unable to remove profile " + name + ": " + ec.message());
    }
    return removed;
}

bool ProfileStore::exists(const std::string& name) const {
    std::error_code ec;
    return isValidName(name) && fs::is_regular_file(pathFor(name), ec);
}

std::string ProfileStore::pathFor(const std::string& name) const {
    return (fs::path(directory_) / (name + ".yaml")).string();
}

Profile ProfileStore::importFile(const std::string& path, const std::string& name) const {
    Profile profile = loadFile(path);
    profile.name = name;
    save(profile);
    return profile;
}

void ProfileStore::exportTo(const std::string& name, const std::string& path) const {
    saveFile(load(name), path);
    Logger::info(kComponent, "Exported profile " + name + " to " + path);
}

Profile ProfileStore::loadFile(const std::string& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw std::runtime_error("Profile file not found: " + path);
    }

    std::string stem = fs::path(path).stem().string();
    std::string content = readFile(path);
    if (isCsvPath(path)) {
        return importCsv(content, stem);
    }
    return parseYaml(content, stem);
}

void ProfileStore::saveFile(const Profile& profile, const std::string& path) {
    if (isCsvPath(path)) {
        writeFile(path, exportCsv(profile));
        return;
    }

    YAML::Emitter out;
    out << YAML::convert<Profile>::encode(profile);
    if (!out.good()) {
        throw std::runtime_error("YAML emitter error: " + out.GetLastError());
    }
    writeFile(path, std::string(out.c_str()) + "\n");
}

Profile ProfileStore::loadFromString(const std::string& yaml_content) {
    return parseYaml(yaml_content, "");
}

Profile ProfileStore::importCsv(const std::string& content, const std::string& name) {
    Profile profile;
    profile.name = name;

    std::size_t pos = 0;
    std::size_t newlines = 0;
    std::map<std::string, std::size_t> columns;
    std::size_t header_size = 0;

    while (pos < content.size()) {
        bool ok = true;
        std::size_t start = pos;
        std::vector<std::string> fields = splitCsvRecord(content, pos, ok);
        std::size_t line = newlines + 1;
        newlines += static_cast<std::size_t>(std::count(content.begin() + start, content.begin() + pos, '\n'));
        if (!ok) {
            throw ValidationError("CSV line " + std::to_string(line) + ": unterminated quoted field");
        }
        if (fields.size() == 1 && trim(fields[0]).empty()) {
            continue;
        }

        if (columns.empty()) {
            for (std::size_t i = 0; i < fields.size(); ++i) {
                std::string column = toLower(trim(fields[i]));
                if (std::find(kCsvColumns.begin(), kCsvColumns.end(), column) == kCsvColumns.end()) {
                    throw ValidationError("CSV header: unknown column '" + column + "'");
                }
                if (!columns.emplace(column, i).second) {
                    throw ValidationError("CSV header: duplicate column '" + column + "'");
                }
            }
            for (const char* required : {"destination", "gateway", "interface"}) {
                if (columns.find(required) == columns.end()) {
                    throw ValidationError(std::string("CSV header: missing column '") + required + "'");
                }
            }
            header_size = fields.size();
            continue;
        }

        if (fields.size() != header_size) {
            throw ValidationError("CSV line " + std::to_string(line) + ": expected " +
                                  std::to_string(header_size) + " fields, found " +
                                  std::to_string(fields.size()));
        }

        auto field = [&](const std::string& column) -> std::string {
            auto it = columns.find(column);
            return it == columns.end() ? std::string() : trim(fields[it->second]);
        };

        RouteSpec spec;
        spec.destination = field("destination");
        spec.gateway = field("gateway");
        spec.interface_name = field("interface");
        spec.group = field("group");
        spec.description = field("description");

        std::string metric = field("metric");
        if (!metric.empty()) {
            if (!std::all_of(metric.begin(), metric.end(), [](unsigned char c) { return std::isdigit(c); }) ||
                metric.size() > 4) {
                throw ValidationError("CSV line " + std::to_string(line) + ": metric '" + metric +
                                      "' is not a number");
            }
            spec.metric = std::stoi(metric);
        }

        std::string enabled = field("enabled");
        if (!enabled.empty() && !parseBool(enabled, spec.enabled)) {
            throw ValidationError("CSV line " + std::to_string(line) + ": enabled '" + enabled +
                                  "' is not a boolean");
        }

        profile.routes.push_back(spec);
    }

    if (columns.empty()) {
        throw ValidationError("CSV content has no header row");
    }
    if (!profile.isValid()) {
        throw ValidationError("Invalid profile '" + name + "': " + profile.getErrorMessage());
    }
    return profile;
}

std::string ProfileStore::exportCsv(const Profile& profile) {
    std::ostringstream out;
    for (std::size_t i = 0; i < kCsvColumns.size(); ++i) {
        out << (i ? "," : "") << kCsvColumns[i];
    }
    out << "\n";

    for (const auto& spec : profile.routes) {
        out << quoteCsvField(spec.destination) << ","
            << quoteCsvField(spec.gateway) << ","
            << quoteCsvField(spec.interface_name) << ","
            << spec.metric << ","
            << quoteCsvField(spec.group) << ","
            << (spec.enabled ? "true" : "false") << ","
            << quoteCsvField(spec.description) << "\n";
    }
    return out.str();
}

bool ProfileStore::isValidName(const std::string& name) {
    static const std::regex pattern("^[A-Za-z0-9_][A-Za-z0-9._-]{0,63}$");
    return std::regex_match(name, pattern);
}

bool ProfileStore::looksLikePath(const std::string& argument) {
    auto endsWith = [&](const std::string& suffix) {
        return argument.size() >= suffix.size() &&
               argument.compare(argument.size() - suffix.size(), suffix.size(), suffix) == 0;
    };
    return argument.find('/') != std::string::npos ||
           endsWith(".yaml") || endsWith(".yml") || endsWith(".csv");
}

bool ProfileStore::isCsvPath(const std::string& path) {
    return toLower(fs::path(path).extension().string()) == ".csv";
}

std::vector<std::string> ProfileStore::splitCsvRecord(const std::string& content, std::size_t& pos, bool& ok) {
    std::vector<std::string> fields;
    std::string current;
    bool quoted = false;
    ok = true;

    while (pos < content.size()) {
        char c = content[pos++];
        if (quoted) {
            if (c == '"') {
                if (pos < content.size() && content[pos] == '"') {
                    current += '"';
                    ++pos;
                } else {
                    quoted = false;
                }
            } else {
                current += c;
            }
            continue;
        }

        if (c == '"') {
            quoted = true;
        } else if (c == ',') {
            fields.push_back(current);
            current.clear();
        } else if (c == '\n') {
            break;
        } else if (c != '\r') {
            current += c;
        }
    }

    if (quoted) {
        ok = false;
    }
    fields.push_back(current);
    return fields;
}

std::string ProfileStore::quoteCsvField(const std::string& field) {
    if (field.find_first_of(",\"\n\r") == std::string::npos) {
        return field;
    }
    std::string quoted = "\"";
    for (char c : field) {
        if (c == '"') {
            quoted += '"';
        }
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

bool ProfileStore::parseBool(const std::string& text, bool& value) {
    std::string lower = toLower(text);
    if (lower == "true" || lower == "1" || lower == "yes") {
        value = true;
        return true;
    }
    if (lower == "false" || lower == "0" || lower == "no") {
        value = false;
        return true;
    }
    return false;
}

} // namespace routecompose
