/**
 * @file snapshot_manager.hpp
 * @brief Capture, storage and restore of route-table snapshots
 * @author route-compose Development Team
 * @date 2026
 *
 * A snapshot is taken before every apply and written to
 * `<snapshot_dir>/<id>.yaml`:
 * @code
 * format_version: 1
 * id: snap-20261018-091244-3fa1
 * timestamp: 2026-10-18T09:12:44.120Z
 * table: main
 * entries:
 *   - destination: 0.0.0.0/0
 *     gateway: 192.168.1.1
 *     interface: eth0
 *     interface_index: 2
 *     metric: 100
 *     protocol: dhcp
 * @endcode
 *
 * Interface names are stored next to the indices so that a snapshot
 * taken before a reboot can still be restored after it: the name is
 * re-resolved to the interface's current index at restore time.
 */

#pragma once

#include "applier.hpp"
#include "audit_log.hpp"
#include "diff_engine.hpp"
#include "live_state_reader.hpp"
#include "mutation_lock.hpp"
#include "network_backend.hpp"
#include "route_types.hpp"
#include <cstddef>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace routecompose {

/// Version written to and required from snapshot files
constexpr int kSnapshotFormatVersion = 1;

/**
 * @struct SnapshotInfo
 * @brief Listing entry for a stored snapshot
 */
struct SnapshotInfo {
    std::string id;
    std::string timestamp;
    std::string table;
    std::size_t entry_count = 0;
};

/**
 * @class SnapshotManager
 * @brief Owns the snapshot directory and the restore path
 */
class SnapshotManager {
public:
    SnapshotManager(std::string directory,
                    std::string table,
                    NetworkBackend& backend,
                    LiveStateReader& reader,
                    const DiffEngine& engine,
                    Applier& applier,
                    AuditLog& audit);

    /**
     * @brief Read the live table and persist it as a new snapshot
     * @return The stored snapshot
     * @throws OSCommandError if the table cannot be read
     * @throws std::runtime_error if the snapshot cannot be written
     */
    Snapshot capture();

    /**
     * @brief Load a stored snapshot
     * @throws RollbackError{SnapshotNotFound} for unknown or malformed identifiers
     * @throws RollbackError{SnapshotCorrupt} if the file exists but cannot be read
     */
    Snapshot load(const std::string& id) const;

    /// Stored snapshots, newest first; unreadable files are skipped with a warning
    std::vector<SnapshotInfo> list() const;

    /**
     * @brief Delete a stored snapshot
     * @throws RollbackError{SnapshotNotFound} if it does not exist
     */
    void remove(const std::string& id);

    /**
     * @brief Keep only the @p keep newest snapshots
     * @param keep Number of snapshots to retain
     * @param protect_id Snapshot never deleted, e.g. the one just captured
     * @return Identifiers of the deleted snapshots
     */
    std::vector<std::string> prune(std::size_t keep, const std::string& protect_id = "");

    /**
     * @brief Bring the live table back to a stored snapshot
     * @param id Snapshot identifier
     * @param guard Proof that the caller holds the mutation lock
     * @param intent Audit intent
     * @return Report of the restore plan and its execution
     * @throws RollbackError on unknown or corrupt snapshots and on any OS failure during restore
     */
    RestoreReport restore(const std::string& id,
                          const MutationLock::Guard& guard,
                          const std::string& intent);

    /**
     * @brief Re-resolve recorded interface names to current indices
     * @param entries Snapshot entries
     * @param interfaces Interfaces present now
     * @param remapped Receives "name: old -> new" for every changed index
     *
     * An entry whose interface name no longer exists keeps its recorded index.
     */
    static std::vector<LiveRouteEntry> remapInterfaces(const std::vector<LiveRouteEntry>& entries,
                                                       const std::vector<InterfaceInfo>& interfaces,
                                                       std::vector<std::string>& remapped);

    /// New identifier of the form snap-YYYYMMDD-HHMMSS-xxxx
    static std::string generateId();

    /// True if @p id has the identifier format, which also rules out path components
    static bool isValidId(const std::string& id);

    const std::string& directory() const { return directory_; }

private:
    std::string pathFor(const std::string& id) const;
    void write(const Snapshot& snapshot) const;

    std::string directory_;
    std::string table_;
    NetworkBackend& backend_;
    LiveStateReader& reader_;
    const DiffEngine& engine_;
    Applier& applier_;
    AuditLog& audit_;
};

} // namespace routecompose

namespace YAML {

/**
 * @brief YAML conversion for LiveRouteEntry
 *
 * The destination is stored in CIDR form; the interface name is stored
 * under "interface" and the index under "interface_index".
 */
template<>
struct convert<routecompose::LiveRouteEntry> {
    static Node encode(const routecompose::LiveRouteEntry& entry);
    static bool decode(const Node& node, routecompose::LiveRouteEntry& entry);
};

} // namespace YAML
