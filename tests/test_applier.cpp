#include "applier.hpp"
#include "diff_engine.hpp"
#include "fake_network_backend.hpp"
#include "snapshot_manager.hpp"
#include "temp_dir.hpp"
#include <gtest/gtest.h>

using namespace routecompose;
using routecompose::test::FakeNetworkBackend;
using routecompose::test::TempDir;

namespace {

class ApplierTest : public ::testing::Test {
protected:
    ApplierTest()
        : audit(dir.file("audit.log")),
          lock(dir.file("mutation.lock")),
          reader(backend),
          applier(backend, reader, audit, "250"),
          snapshots(dir.file("snapshots"), "main", backend, reader, engine, applier, audit) {
        backend.addInterface("eth0", 2);
    }

    ResolvedRoute route(const std::string& destination, int prefix_length, int metric = 5) {
        ResolvedRoute resolved;
        resolved.key.destination = destination;
        resolved.key.prefix_length = prefix_length;
        resolved.key.gateway = "192.168.1.1";
        resolved.interface_index = 2;
        resolved.interface_name = "eth0";
        resolved.metric = metric;
        resolved.source_key = resolved.key;
        return resolved;
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

TEST_F(ApplierTest, AppliesWholePlan) {
    backend.seed("172.16.0.0", 16, "192.168.1.1", 2, 5, "250");
    DiffPlan plan = engine.computeDiff({route("10.0.0.0", 24), route("10.1.0.0", 24)}, reader.read());

    auto guard = lock.acquire();
    Snapshot snapshot = snapshots.capture();
    ApplyReport report = applier.apply(plan, guard, snapshot.id(), snapshots, "apply test");

    EXPECT_TRUE(report.succeeded());
    EXPECT_FALSE(report.rollback.has_value());
    EXPECT_EQ(report.results.size(), 3u);
    EXPECT_TRUE(backend.hasRoute("10.0.0.0", 24, "192.168.1.1", 2, 5));
    EXPECT_TRUE(backend.hasRoute("10.1.0.0", 24, "192.168.1.1", 2, 5));
    EXPECT_FALSE(backend.hasRoute("172.16.0.0", 16, "192.168.1.1", 2, 5));
    for (const auto& entry : backend.routes) {
        EXPECT_EQ(entry.protocol, "250");
    }
}

TEST_F(ApplierTest, FailureMidPlanRestoresPreApplyTable) {
    backend.seed("172.16.0.0", 16, "192.168.1.1", 2, 5, "250");
    std::vector<LiveRouteEntry> before = reader.read();
    DiffPlan plan = engine.computeDiff({route("10.0.0.0", 24), route("10.1.0.0", 24)}, before);
    ASSERT_EQ(plan.size(), 3u);

    backend.fail_at_mutation = 2;
    auto guard = lock.acquire();
    Snapshot snapshot = snapshots.capture();
    ApplyReport report = applier.apply(plan, guard, snapshot.id(), snapshots, "apply test");

    EXPECT_FALSE(report.succeeded());
    ASSERT_EQ(report.results.size(), 2u);
    EXPECT_EQ(report.results[0].status, MutationResult::Status::Ok);
    EXPECT_EQ(report.results[1].status, MutationResult::Status::Rejected);
    ASSERT_TRUE(report.failure.has_value());
    EXPECT_EQ(report.failure->kind(), OSCommandError::Kind::Rejected);
    EXPECT_EQ(report.failure->operation(), "add");
    ASSERT_TRUE(report.failed_index.has_value());
    EXPECT_EQ(*report.failed_index, 1u);

    ASSERT_TRUE(report.rolledBack());
    EXPECT_FALSE(report.rollback_error.has_value());
    EXPECT_EQ(report.rollback->snapshot_id, snapshot.id());
    EXPECT_EQ(reader.read(), before);
}

TEST_F(ApplierTest, TimedOutMutationRollsBack) {
    backend.seed("172.16.0.0", 16, "192.168.1.1", 2, 5, "250");
    std::vector<LiveRouteEntry> before = reader.read();
    DiffPlan plan = engine.computeDiff({route("10.0.0.0", 24), route("10.1.0.0", 24)}, before);

    backend.fail_at_mutation = 2;
    backend.failure_status = MutationResult::Status::Timeout;
    auto guard = lock.acquire();
    Snapshot snapshot = snapshots.capture();
    ApplyReport report = applier.apply(plan, guard, snapshot.id(), snapshots, "apply test");

    EXPECT_FALSE(report.succeeded());
    ASSERT_TRUE(report.failure.has_value());
    EXPECT_EQ(report.failure->kind(), OSCommandError::Kind::Timeout);
    ASSERT_TRUE(report.failed_index.has_value());
    EXPECT_EQ(*report.failed_index, 1u);

    ASSERT_TRUE(report.rolledBack());
    EXPECT_EQ(report.rollback->snapshot_id, snapshot.id());
    EXPECT_EQ(reader.read(), before);
}

TEST_F(ApplierTest, RollbackFailureIsReported) {
    DiffPlan plan = engine.computeDiff({route("10.0.0.0", 24), route("10.1.0.0", 24)}, reader.read());

    // Reads: plan, capture, freshness check; the restore read fails
    backend.before_list = [this](int call) {
        if (call >= 4) {
            backend.list_fails = true;
        }
    };
    backend.fail_at_mutation = 2;

    auto guard = lock.acquire();
    Snapshot snapshot = snapshots.capture();
    ApplyReport report = applier.apply(plan, guard, snapshot.id(), snapshots, "apply test");

    EXPECT_FALSE(report.succeeded());
    EXPECT_FALSE(report.rollback.has_value());
    ASSERT_TRUE(report.rollback_error.has_value());
    EXPECT_EQ(report.rollback_error->kind(), RollbackError::Kind::RestoreFailed);
    EXPECT_EQ(report.rollback_error->snapshotId(), snapshot.id());
}

TEST_F(ApplierTest, ChangedTableMakesPlanStale) {
    DiffPlan plan = engine.computeDiff({route("10.0.0.0", 24)}, reader.read());
    backend.seed("192.168.77.0", 24, "192.168.1.9", 2, 20, "static");

    auto guard = lock.acquire();
    Snapshot snapshot = snapshots.capture();
    try {
        applier.apply(plan, guard, snapshot.id(), snapshots, "apply test");
        FAIL() << "expected ApplyError";
    } catch (const ApplyError& e) {
        EXPECT_EQ(e.kind(), ApplyError::Kind::StaleState);
    }
    EXPECT_TRUE(backend.mutation_log.empty());
}

TEST_F(ApplierTest, AlreadyPresentAndAlreadyAbsentCountAsDone) {
    backend.seed("10.0.0.0", 24, "192.168.1.1", 2, 5, "250");

    DiffPlan plan;
    DiffOperation add;
    add.type = OperationType::Add;
    add.entry = backend.makeEntry("10.0.0.0", 24, "192.168.1.1", 2, 5, "250");
    DiffOperation del;
    del.type = OperationType::Delete;
    del.entry = backend.makeEntry("10.9.0.0", 24, "192.168.1.1", 2, 5, "250");
    plan.operations = {add, del};

    auto guard = lock.acquire();
    ExecutionOutcome outcome = applier.execute(plan, guard, "apply test");

    EXPECT_TRUE(outcome.succeeded());
    ASSERT_EQ(outcome.results.size(), 2u);
    EXPECT_EQ(outcome.results[0].status, MutationResult::Status::AlreadyPresent);
    EXPECT_EQ(outcome.results[1].status, MutationResult::Status::AlreadyAbsent);
    EXPECT_TRUE(outcome.results[0].succeeded());

    std::vector<AuditEvent> events = audit.readAll();
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].intent, "apply test");
    EXPECT_EQ(events[0].outcome.rfind("already-present", 0), 0u);
}

TEST_F(ApplierTest, RefusesToMutateWithoutLock) {
    DiffPlan plan = engine.computeDiff({route("10.0.0.0", 24)}, reader.read());

    auto guard = lock.acquire();
    auto moved = std::move(guard);
    EXPECT_THROW(applier.execute(plan, guard, "apply test"), std::logic_error);
    EXPECT_TRUE(backend.mutation_log.empty());
    EXPECT_TRUE(moved.owns());
}
