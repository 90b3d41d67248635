/**
 * @file mutation_lock.hpp
 * @brief Single-flight lock for route-table mutation sessions
 * @author route-compose Development Team
 * @date 2026
 */

#pragma once

#include <mutex>
#include <string>

namespace routecompose {

/**
 * @class MutationLock
 * @brief Allows at most one apply or rollback session system-wide
 *
 * Combines an in-process mutex with a non-blocking flock(2) on a lock
 * file so that concurrent sessions in other processes are refused too.
 * Acquisition never waits: a held lock fails fast with ApplyError{Busy}.
 * An empty lock-file path restricts the lock to this process.
 */
class MutationLock {
public:
    /**
     * @class Guard
     * @brief Move-only proof that the caller holds the lock
     *
     * Operations that mutate the route table take a Guard parameter,
     * so they cannot be called without holding the lock.
     */
    class Guard {
    public:
        Guard(Guard&& other) noexcept;
        Guard& operator=(Guard&& other) noexcept;
        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;
        ~Guard();

        /// True until released or moved from
        bool owns() const { return lock_ != nullptr; }

        /// Release early; the destructor does nothing afterwards
        void release();

    private:
        friend class MutationLock;
        Guard(MutationLock* lock, int fd);

        MutationLock* lock_;
        int fd_;
    };

    explicit MutationLock(std::string lock_file);

    MutationLock(const MutationLock&) = delete;
    MutationLock& operator=(const MutationLock&) = delete;

    /**
     * @brief Acquire the lock without waiting
     * @return Guard holding the lock
     * @throws ApplyError{Busy} if another session holds it
     * @throws ApplyError{LockUnavailable} if the lock file cannot be opened or locked
     */
    Guard acquire();

    const std::string& lockFile() const { return lock_file_; }

private:
    std::mutex mutex_;
    std::string lock_file_;
};

} // namespace routecompose
