#include "fake_network_backend.hpp"
#include "snapshot_manager.hpp"
#include "temp_dir.hpp"
#include <algorithm>
#include <gtest/gtest.h>

using namespace routecompose;
using routecompose::test::FakeNetworkBackend;
using routecompose::test::TempDir;

namespace {

std::string snapshotFile(const std::string& id, const std::string& timestamp) {
    return "format_version: 1\n"
           "id: " + id + "\n"
           "timestamp: \"" + timestamp + "\"\n"
           "table: main\n"
           "entries:\n"
           "  - destination: 10.0.0.0/24\n"
           "    gateway: 192.168.1.1\n"
           "    interface: eth0\n"
           "    interface_index: 2\n"
           "    metric: 5\n"
           "    protocol: \"250\"\n";
}

class SnapshotManagerTest : public ::testing::Test {
protected:
    SnapshotManagerTest()
        : audit(dir.file("audit.log")),
          lock(""),
          reader(backend),
          applier(backend, reader, audit, "250"),
          snapshots(dir.file("snapshots"), "main", backend, reader, engine, applier, audit) {
        backend.addInterface("eth0", 2);
        backend.addInterface("wlan0", 3);
        backend.seed("0.0.0.0", 0, "192.168.1.1", 2, 100, "dhcp");
        backend.seed("192.168.1.0", 24, "", 2, 100, "kernel");
        backend.seed("10.0.0.0", 24, "192.168.1.1", 2, 5, "250");
    }

    void writeSnapshot(const std::string& id, const std::string& timestamp) {
        std::filesystem::create_directories(snapshots.directory());
        std::ofstream(snapshots.directory() + "/" + id + ".yaml") << snapshotFile(id, timestamp);
    }

    TempDir dir;
    FakeNetworkBackend backend;
    AuditLog audit;
    MutationLock lock;
    LiveStateReader reader;
    DiffEngine engine;
    Applier applier;
    SnapshotManager snapshots;
};

} // namespace

TEST_F(SnapshotManagerTest, CaptureThenLoadReturnsSameEntries) {
    Snapshot captured = snapshots.capture();
    EXPECT_TRUE(SnapshotManager::isValidId(captured.id()));
    EXPECT_EQ(captured.table(), "main");

    Snapshot loaded = snapshots.load(captured.id());
    EXPECT_EQ(loaded.id(), captured.id());
    EXPECT_EQ(loaded.timestamp(), captured.timestamp());
    EXPECT_EQ(loaded.entries(), captured.entries());
    ASSERT_EQ(loaded.entries().size(), 3u);

    // Protocol and interface name survive the file format
    for (std::size_t i = 0; i < loaded.entries().size(); ++i) {
        EXPECT_EQ(loaded.entries()[i].protocol, captured.entries()[i].protocol);
        EXPECT_EQ(loaded.entries()[i].interface_name, "eth0");
    }
}

TEST_F(SnapshotManagerTest, IdentifierFormat) {
    EXPECT_TRUE(SnapshotManager::isValidId("snap-20260101-120000-0a1f"));
    EXPECT_FALSE(SnapshotManager::isValidId("snap-20260101-120000-0A1F"));
    EXPECT_FALSE(SnapshotManager::isValidId("../snap-20260101-120000-0a1f"));
    EXPECT_FALSE(SnapshotManager::isValidId("snap-2026-120000-0a1f"));
    EXPECT_TRUE(SnapshotManager::isValidId(SnapshotManager::generateId()));
}

TEST_F(SnapshotManagerTest, UnknownSnapshotIsNotFound) {
    try {
        snapshots.load("snap-20260101-120000-0000");
        FAIL() << "expected RollbackError";
    } catch (const RollbackError& e) {
        EXPECT_EQ(e.kind(), RollbackError::Kind::SnapshotNotFound);
    }
    EXPECT_THROW(snapshots.load("../../etc/passwd"), RollbackError);
}

TEST_F(SnapshotManagerTest, UnreadableSnapshotIsCorrupt) {
    const std::string garbage = "snap-20260101-120000-0001";
    const std::string no_entries = "snap-20260101-120000-0002";
    std::filesystem::create_directories(snapshots.directory());
    std::ofstream(snapshots.directory() + "/" + garbage + ".yaml") << "{ this is: [not closed\n";
    std::ofstream(snapshots.directory() + "/" + no_entries + ".yaml")
        << "format_version: 1\nid: " << no_entries << "\ntimestamp: \"2026-01-01T12:00:00.000Z\"\n";

    for (const auto& id : {garbage, no_entries}) {
        try {
            snapshots.load(id);
            FAIL() << "expected RollbackError for " << id;
        } catch (const RollbackError& e) {
            EXPECT_EQ(e.kind(), RollbackError::Kind::SnapshotCorrupt) << id;
        }
    }

    // Unreadable files do not break listing
    writeSnapshot("snap-20260101-120000-0003", "2026-01-01T12:00:00.000Z");
    std::vector<SnapshotInfo> infos = snapshots.list();
    ASSERT_EQ(infos.size(), 1u);
    EXPECT_EQ(infos[0].id, "snap-20260101-120000-0003");
    EXPECT_EQ(infos[0].entry_count, 1u);
}

TEST_F(SnapshotManagerTest, ListIsNewestFirstAndPruneKeepsNewest) {
    writeSnapshot("snap-20260101-100000-aaaa", "2026-01-01T10:00:00.000Z");
    writeSnapshot("snap-20260101-120000-bbbb", "2026-01-01T12:00:00.000Z");
    writeSnapshot("snap-20260101-110000-cccc", "2026-01-01T11:00:00.000Z");
    writeSnapshot("snap-20260101-090000-dddd", "2026-01-01T09:00:00.000Z");

    std::vector<SnapshotInfo> infos = snapshots.list();
    ASSERT_EQ(infos.size(), 4u);
    EXPECT_EQ(infos[0].id, "snap-20260101-120000-bbbb");
    EXPECT_EQ(infos[1].id, "snap-20260101-110000-cccc");
    EXPECT_EQ(infos[2].id, "snap-20260101-100000-aaaa");
    EXPECT_EQ(infos[3].id, "snap-20260101-090000-dddd");

    // The protected snapshot survives even though it is the oldest
    std::vector<std::string> removed = snapshots.prune(2, "snap-20260101-090000-dddd");
    ASSERT_EQ(removed.size(), 2u);
    EXPECT_EQ(removed[0], "snap-20260101-110000-cccc");
    EXPECT_EQ(removed[1], "snap-20260101-100000-aaaa");

    infos = snapshots.list();
    ASSERT_EQ(infos.size(), 2u);
    EXPECT_EQ(infos[0].id, "snap-20260101-120000-bbbb");
    EXPECT_EQ(infos[1].id, "snap-20260101-090000-dddd");
}

TEST_F(SnapshotManagerTest, RemoveDeletesOneSnapshot) {
    Snapshot captured = snapshots.capture();
    snapshots.remove(captured.id());
    EXPECT_TRUE(snapshots.list().empty());
    EXPECT_THROW(snapshots.remove(captured.id()), RollbackError);
}

TEST_F(SnapshotManagerTest, RemapFollowsInterfaceNames) {
    std::vector<LiveRouteEntry> entries = {backend.makeEntry("10.0.0.0", 24, "192.168.1.1", 2, 5, "250"),
                                           backend.makeEntry("10.1.0.0", 24, "192.168.1.1", 2, 5, "250")};
    std::vector<std::string> remapped;
    std::vector<LiveRouteEntry> result =
        SnapshotManager::remapInterfaces(entries, {InterfaceInfo{"eth0", 7}}, remapped);

    ASSERT_EQ(result.size(), 2u);
    EXPECT_EQ(result[0].interface_index, 7u);
    EXPECT_EQ(result[1].interface_index, 7u);
    ASSERT_EQ(remapped.size(), 1u);
    EXPECT_EQ(remapped[0], "eth0: 2 -> 7");

    // Interfaces that disappeared keep their recorded index
    remapped.clear();
    result = SnapshotManager::remapInterfaces(entries, {InterfaceInfo{"wlan0", 3}}, remapped);
    EXPECT_EQ(result[0].interface_index, 2u);
    EXPECT_TRUE(remapped.empty());
}

TEST_F(SnapshotManagerTest, RestoreBringsTableBackToCapture) {
    Snapshot captured = snapshots.capture();
    std::vector<LiveRouteEntry> before = reader.read();

    // Drift: lose the default route, change a metric, gain a route and a kernel route
    backend.routes.erase(backend.routes.begin());
    backend.routes.back().metric = 1;
    backend.seed("172.16.0.0", 12, "192.168.1.1", 3, 5, "250");
    backend.seed("192.168.9.0", 24, "", 3, 100, "kernel");

    auto guard = lock.acquire();
    RestoreReport report = snapshots.restore(captured.id(), guard, "rollback " + captured.id());
    EXPECT_FALSE(report.plan.empty());

    std::vector<LiveRouteEntry> after = reader.read();
    std::vector<LiveRouteEntry> expected = before;
    expected.push_back(backend.makeEntry("192.168.9.0", 24, "", 3, 100, "kernel"));
    std::sort(expected.begin(), expected.end());
    EXPECT_EQ(after, expected);

    // The default route comes back with its original protocol
    auto it = std::find_if(backend.routes.begin(), backend.routes.end(),
                           [](const LiveRouteEntry& entry) { return entry.prefix_length == 0; });
    ASSERT_NE(it, backend.routes.end());
    EXPECT_EQ(it->protocol, "dhcp");
}

TEST_F(SnapshotManagerTest, RestoreOfMatchingTableDoesNothing) {
    Snapshot captured = snapshots.capture();
    auto guard = lock.acquire();
    RestoreReport report = snapshots.restore(captured.id(), guard, "rollback");
    EXPECT_TRUE(report.plan.empty());
    EXPECT_TRUE(report.results.empty());
    EXPECT_TRUE(backend.mutation_log.empty());
}
