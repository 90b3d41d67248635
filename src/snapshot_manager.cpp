#include "snapshot_manager.hpp"
#include "address_utils.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <algorithm>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <map>
#include <mutex>
#include <random>
#include <regex>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace routecompose {

namespace {

const char* kComponent = "SnapshotManager";
const char* kSnapshotExtension = ".yaml";

} // namespace

SnapshotManager::SnapshotManager(std::string directory,
                                 std::string table,
                                 NetworkBackend& backend,
                                 LiveStateReader& reader,
                                 const DiffEngine& engine,
                                 Applier& applier,
                                 AuditLog& audit)
    : directory_(std::move(directory)),
      table_(std::move(table)),
      backend_(backend),
      reader_(reader),
      engine_(engine),
      applier_(applier),
      audit_(audit) {
}

std::string SnapshotManager::generateId() {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm utc_tm{};
    gmtime_r(&now, &utc_tm);

    static std::mt19937 generator{std::random_device{}()};
    static std::mutex generator_mutex;
    unsigned int suffix = 0;
    {
        std::lock_guard<std::mutex> lock(generator_mutex);
        suffix = std::uniform_int_distribution<unsigned int>(0, 0xFFFF)(generator);
    }

    std::ostringstream id;
    id << "snap-" << std::put_time(&utc_tm, "%Y%m%d-%H%M%S") << "-"
       << std::hex << std::setw(4) << std::setfill('0') << suffix;
    return id.str();
}

bool SnapshotManager::isValidId(const std::string& id) {
    static const std::regex id_regex("^snap-[0-9]{8}-[0-9]{6}-[0-9a-f]{4}$");
    return std::regex_match(id, id_regex);
}

std::string SnapshotManager::pathFor(const std::string& id) const {
    return (fs::path(directory_) / (id + kSnapshotExtension)).string();
}

void SnapshotManager::write(const Snapshot& snapshot) const {
    YAML::Node root;
    root["format_version"] = kSnapshotFormatVersion;
    root["id"] = snapshot.id();
    root["timestamp"] = snapshot.timestamp();
    root["table"] = snapshot.table();

    YAML::Node entries(YAML::NodeType::Sequence);
    for (const auto& entry : snapshot.entries()) {
        entries.push_back(entry);
    }
    root["entries"] = entries;

    try {
        fs::create_directories(directory_);

        // Write under a temporary name first so a crash never leaves a
        // truncated file under a valid snapshot identifier
        std::string final_path = pathFor(snapshot.id());
        std::string temp_path = final_path + ".tmp";
        {
            std::ofstream file(temp_path);
            if (!file.is_open()) {
                throw std::runtime_error("Unable to open file for writing: " + temp_path);
            }
            file << root << '\n';
            if (!file) {
                throw std::runtime_error("Failed to write " + temp_path);
            }
        }
        fs::rename(temp_path, final_path);
    } catch (const fs::filesystem_error& e) {
        throw std::runtime_error("Snapshot saving error: " + std::string(e.what()));
    }
}

Snapshot SnapshotManager::capture() {
    std::vector<LiveRouteEntry> entries = reader_.read();

    std::string id = generateId();
    for (int attempt = 0; attempt < 16 && fs::exists(pathFor(id)); ++attempt) {
        id = generateId();
    }

    Snapshot snapshot(id, currentTimestamp(), table_, std::move(entries));
    write(snapshot);

    Logger::info(kComponent, "Captured snapshot " + id + " (" +
                 std::to_string(snapshot.entries().size()) + " routes)");
    audit_.record("snapshot", "capture " + id,
                  "ok: " + std::to_string(snapshot.entries().size()) + " routes");
    return snapshot;
}

Snapshot SnapshotManager::load(const std::string& id) const {
    if (!isValidId(id)) {
        throw RollbackError(RollbackError::Kind::SnapshotNotFound, id, "not a snapshot identifier");
    }

    std::string path = pathFor(id);
    if (!fs::exists(path)) {
        throw RollbackError(RollbackError::Kind::SnapshotNotFound, id, "no such snapshot in " + directory_);
    }

    try {
        YAML::Node root = YAML::LoadFile(path);
        if (!root.IsMap()) {
            throw RollbackError(RollbackError::Kind::SnapshotCorrupt, id, "not a YAML map");
        }
        if (!root["format_version"] || root["format_version"].as<int>() != kSnapshotFormatVersion) {
            throw RollbackError(RollbackError::Kind::SnapshotCorrupt, id, "unsupported format_version");
        }
        if (!root["id"] || root["id"].as<std::string>() != id) {
            throw RollbackError(RollbackError::Kind::SnapshotCorrupt, id, "identifier does not match file name");
        }
        if (!root["timestamp"] || !root["entries"] || !root["entries"].IsSequence()) {
            throw RollbackError(RollbackError::Kind::SnapshotCorrupt, id, "missing timestamp or entries");
        }

        std::string table = root["table"] ? root["table"].as<std::string>() : table_;
        return Snapshot(id,
                        root["timestamp"].as<std::string>(),
                        table,
                        root["entries"].as<std::vector<LiveRouteEntry>>());
    } catch (const YAML::Exception& e) {
        throw RollbackError(RollbackError::Kind::SnapshotCorrupt, id, "YAML parsing error: " + std::string(e.what()));
    }
}

std::vector<SnapshotInfo> SnapshotManager::list() const {
    std::vector<SnapshotInfo> infos;

    std::error_code ec;
    if (!fs::is_directory(directory_, ec)) {
        return infos;
    }

    for (const auto& item : fs::directory_iterator(directory_, ec)) {
        if (!item.is_regular_file() || item.path().extension() != kSnapshotExtension) {
            continue;
        }
        std::string id = item.path().stem().string();
        if (!isValidId(id)) {
            continue;
        }

        try {
            Snapshot snapshot = load(id);
            SnapshotInfo info;
            info.id = snapshot.id();
            info.timestamp = snapshot.timestamp();
            info.table = snapshot.table();
            info.entry_count = snapshot.entries().size();
            infos.push_back(info);
        } catch (const RollbackError& e) {
            Logger::warning(kComponent, e.what());
        }
    }

    std::sort(infos.begin(), infos.end(), [](const SnapshotInfo& a, const SnapshotInfo& b) {
        if (a.timestamp != b.timestamp) {
            return a.timestamp > b.timestamp;
        }
        return a.id > b.id;
    });
    return infos;
}

void SnapshotManager::remove(const std::string& id) {
    if (!isValidId(id) || !fs::exists(pathFor(id))) {
        throw RollbackError(RollbackError::Kind::SnapshotNotFound, id, "no such snapshot in " + directory_);
    }

    std::error_code ec;
    if (!fs::remove(pathFor(id), ec) || ec) {
        throw std::runtime_error("Failed to remove snapshot " + id + ": " + ec.message());
    }
    Logger::info(kComponent, "Removed snapshot " + id);
    audit_.record("drop " + id, "remove " + id, "ok");
}

std::vector<std::string> SnapshotManager::prune(std::size_t keep, const std::string& protect_id) {
    std::vector<std::string> removed;
    std::vector<SnapshotInfo> infos = list();

    // The protected snapshot occupies one of the kept slots
    bool protect_present = std::any_of(infos.begin(), infos.end(),
                                       [&](const SnapshotInfo& info) { return info.id == protect_id; });
    std::size_t quota = (protect_present && keep > 0) ? keep - 1 : keep;

    std::size_t kept = 0;
    for (const auto& info : infos) {
        if (protect_present && info.id == protect_id) {
            continue;
        }
        if (kept < quota) {
            ++kept;
            continue;
        }

        std::error_code ec;
        if (fs::remove(pathFor(info.id), ec)) {
            removed.push_back(info.id);
        } else {
            Logger::warning(kComponent, "Failed to prune snapshot " + info.id + ": " + ec.message());
        }
    }

    if (!removed.empty()) {
        Logger::info(kComponent, "Pruned " + std::to_string(removed.size()) + " snapshot(s)");
        audit_.record("prune", "prune keep " + std::to_string(keep),
                      "removed " + std::to_string(removed.size()));
    }
    return removed;
}

std::vector<LiveRouteEntry> SnapshotManager::remapInterfaces(const std::vector<LiveRouteEntry>& entries,
                                                             const std::vector<InterfaceInfo>& interfaces,
                                                             std::vector<std::string>& remapped) {
    std::map<std::string, uint32_t> index_by_name;
    for (const auto& iface : interfaces) {
        index_by_name[iface.name] = iface.index;
    }

    std::vector<LiveRouteEntry> result;
    result.reserve(entries.size());
    for (LiveRouteEntry entry : entries) {
        auto it = index_by_name.find(entry.interface_name);
        if (it != index_by_name.end() && it->second != entry.interface_index) {
            std::string note = entry.interface_name + ": " + std::to_string(entry.interface_index) +
                               " -> " + std::to_string(it->second);
            if (std::find(remapped.begin(), remapped.end(), note) == remapped.end()) {
                remapped.push_back(note);
            }
            entry.interface_index = it->second;
        }
        result.push_back(entry);
    }
    return result;
}

RestoreReport SnapshotManager::restore(const std::string& id,
                                       const MutationLock::Guard& guard,
                                       const std::string& intent) {
    Snapshot snapshot = load(id);
    if (snapshot.table() != table_) {
        Logger::warning(kComponent, "Snapshot " + id + " was taken from table " + snapshot.table() +
                        ", restoring into table " + table_);
    }

    RestoreReport report;
    report.snapshot_id = id;

    try {
        std::vector<LiveRouteEntry> target =
            remapInterfaces(snapshot.entries(), backend_.listInterfaces(), report.remapped);
        for (const auto& note : report.remapped) {
            Logger::info(kComponent, "Interface index changed since capture: " + note);
        }

        report.plan = engine_.computeRestoreDiff(target, reader_.read());
    } catch (const OSCommandError& e) {
        audit_.record(intent, "restore " + id, std::string("failed: ") + e.what());
        throw RollbackError(RollbackError::Kind::RestoreFailed, id, e.what());
    }

    if (report.plan.empty()) {
        Logger::info(kComponent, "Live table already matches snapshot " + id);
        audit_.record(intent, "restore " + id, "ok: no changes");
        return report;
    }

    ExecutionOutcome outcome = applier_.execute(report.plan, guard, intent);
    report.results = outcome.results;
    if (!outcome.succeeded()) {
        audit_.record(intent, "restore " + id, std::string("failed: ") + outcome.failure->what());
        throw RollbackError(RollbackError::Kind::RestoreFailed, id, outcome.failure->what());
    }

    Logger::info(kComponent, "Restored snapshot " + id + " (" +
                 std::to_string(report.results.size()) + " operation(s))");
    audit_.record(intent, "restore " + id, "ok: " + std::to_string(report.results.size()) + " operation(s)");
    return report;
}

} // namespace routecompose

// YAML conversion implementations
namespace YAML {

using namespace routecompose;

Node convert<LiveRouteEntry>::encode(const LiveRouteEntry& entry) {
    Node node;
    node["destination"] = entry.prefix();
    if (!entry.gateway.empty()) {
        node["gateway"] = entry.gateway;
    }
    node["interface"] = entry.interface_name;
    node["interface_index"] = entry.interface_index;
    node["metric"] = entry.metric;
    node["protocol"] = entry.protocol;
    return node;
}

bool convert<LiveRouteEntry>::decode(const Node& node, LiveRouteEntry& entry) {
    if (!node.IsMap() || !node["destination"] || !node["interface_index"]) return false;

    try {
        Ipv4Prefix prefix = AddressUtils::parseCIDR(node["destination"].as<std::string>());
        entry.destination = prefix.address();
        entry.prefix_length = prefix.prefix_length;
    } catch (const std::invalid_argument&) {
        return false;
    }

    if (node["gateway"]) {
        entry.gateway = node["gateway"].as<std::string>();
        if (!AddressUtils::isValidAddress(entry.gateway)) return false;
    }
    if (node["interface"]) {
        entry.interface_name = node["interface"].as<std::string>();
    }
    entry.interface_index = node["interface_index"].as<uint32_t>();
    entry.metric = node["metric"] ? node["metric"].as<int>() : 0;
    entry.protocol = node["protocol"] ? node["protocol"].as<std::string>() : "";
    return true;
}

} // namespace YAML
