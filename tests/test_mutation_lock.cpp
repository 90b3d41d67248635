#include "errors.hpp"
#include "mutation_lock.hpp"
#include "temp_dir.hpp"
#include <future>
#include <gtest/gtest.h>

using namespace routecompose;
using routecompose::test::TempDir;

namespace {

ApplyError::Kind acquireFailure(MutationLock& lock) {
    try {
        auto guard = lock.acquire();
    } catch (const ApplyError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "lock was acquired";
    return ApplyError::Kind::LockUnavailable;
}

} // namespace

TEST(MutationLockTest, SecondProcessWideHolderIsBusy) {
    TempDir dir;
    MutationLock first(dir.file("route-compose.lock"));
    MutationLock second(dir.file("route-compose.lock"));

    auto guard = first.acquire();
    EXPECT_TRUE(guard.owns());
    EXPECT_EQ(acquireFailure(second), ApplyError::Kind::Busy);

    guard.release();
    EXPECT_FALSE(guard.owns());
    EXPECT_TRUE(second.acquire().owns());
}

TEST(MutationLockTest, SecondThreadIsBusy) {
    TempDir dir;
    MutationLock lock(dir.file("route-compose.lock"));
    auto guard = lock.acquire();

    auto other = std::async(std::launch::async, [&lock]() { return acquireFailure(lock); });
    EXPECT_EQ(other.get(), ApplyError::Kind::Busy);
}

TEST(MutationLockTest, GuardReleasesOnScopeExitAndMove) {
    TempDir dir;
    MutationLock lock(dir.file("route-compose.lock"));
    {
        auto guard = lock.acquire();
        MutationLock::Guard moved = std::move(guard);
        EXPECT_FALSE(guard.owns());
        EXPECT_TRUE(moved.owns());
    }
    EXPECT_TRUE(lock.acquire().owns());
}

TEST(MutationLockTest, UnopenableLockFileIsReported) {
    TempDir dir;
    MutationLock lock(dir.file("missing-dir/route-compose.lock"));
    EXPECT_EQ(acquireFailure(lock), ApplyError::Kind::LockUnavailable);
    // The failed attempt must not leave the in-process lock held
    EXPECT_EQ(acquireFailure(lock), ApplyError::Kind::LockUnavailable);
}
