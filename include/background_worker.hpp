/**
 * @file background_worker.hpp
 * @brief Off-thread execution of user commands with cooperative cancellation
 * @author route-compose Development Team
 * @date 2026
 */

#pragma once

#include <atomic>
#include <future>
#include <mutex>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace routecompose {

/**
 * @class CancellationToken
 * @brief Flag polled by cancellable work between steps
 *
 * Only non-mutating phases (validation probes) honor it. Plan execution
 * ignores it once the first mutation has been issued.
 */
class CancellationToken {
public:
    void cancel() { cancelled_.store(true); }
    bool isCancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

/**
 * @class BackgroundWorker
 * @brief Runs each submitted task on its own thread and hands back a future
 *
 * Blocking OS calls never run on the calling thread. Exceptions thrown by
 * a task are delivered through its future. The destructor joins every
 * thread that was started.
 */
class BackgroundWorker {
public:
    BackgroundWorker() = default;
    BackgroundWorker(const BackgroundWorker&) = delete;
    BackgroundWorker& operator=(const BackgroundWorker&) = delete;

    ~BackgroundWorker() {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& thread : threads_) {
            if (thread.joinable()) {
                thread.join();
            }
        }
    }

    template<typename Function>
    std::future<typename std::invoke_result<Function>::type> submit(Function&& function) {
        using Result = typename std::invoke_result<Function>::type;

        std::packaged_task<Result()> task(std::forward<Function>(function));
        std::future<Result> future = task.get_future();

        std::lock_guard<std::mutex> lock(mutex_);
        threads_.emplace_back(std::move(task));
        return future;
    }

private:
    std::mutex mutex_;
    std::vector<std::thread> threads_;
};

} // namespace routecompose
