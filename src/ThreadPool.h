/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

/**
 * @file ThreadPool.h
 * @brief Fixed-size thread pool used to load several binaries at once
 *
 * Each submitted task runs one complete, independent load-and-parse; tasks
 * share no state. Results and exceptions travel back through std::future.
 *
 * Key Features:
 * - Configurable thread count with CPU core detection
 * - Future-based task submission with result retrieval
 * - Queue is drained before the workers exit
 * - Atomic counters for verbose output
 *
 * @author elfscope Development Team
 * @date 2025
 */

/**
 * @brief Performance metrics for thread pool monitoring
 */
struct ThreadPoolMetrics {
    std::atomic<uint64_t> tasks_submitted{0};
    std::atomic<uint64_t> tasks_completed{0};
    std::atomic<uint64_t> total_execution_time_us{0};

    /**
     * @brief Get average task execution time
     * @return Average execution time in microseconds
     */
    double getAverageExecutionTime() const {
        uint64_t completed = tasks_completed.load();
        if (completed == 0)
            return 0.0;
        return static_cast<double>(total_execution_time_us.load()) / completed;
    }
};

/**
 * @brief Thread pool with a single shared task queue
 *
 * ## Usage Example:
 * ```cpp
 * ThreadPool pool(4);
 * auto future = pool.submit([](int x) { return x * 2; }, 21);
 * int result = future.get(); // result = 42
 * ```
 */
class ThreadPool {
private:
    std::vector<std::thread> workers_;         ///< Worker threads
    std::queue<std::function<void()>> tasks_;  ///< Main task queue
    mutable std::mutex queue_mutex_;           ///< Main queue mutex
    std::condition_variable condition_;        ///< Condition variable for workers
    bool stop_;                                ///< Stop flag, guarded by queue_mutex_

    ThreadPoolMetrics metrics_;
    size_t thread_count_;

    void worker();

public:
    /**
     * @brief Construct thread pool with specified thread count
     * @param num_threads Number of worker threads (0 = auto-detect CPU cores)
     */
    explicit ThreadPool(size_t num_threads = 0);

    /**
     * @brief Destructor - runs the remaining queue, then joins all threads
     */
    ~ThreadPool();

    /**
     * @brief Run the remaining queue and join the workers
     *
     * Safe to call more than once. Afterwards the metrics are final and
     * submit() throws.
     */
    void shutdown();

    /**
     * @brief Submit a task for execution and return future for result
     * @throws std::runtime_error if the pool is shutting down
     */
    template<class F, class... Args>
    auto submit(F&& f, Args&&... args) -> std::future<typename std::invoke_result_t<F, Args...>>;

    const ThreadPoolMetrics& getMetrics() const { return metrics_; }

    size_t getThreadCount() const { return thread_count_; }

    size_t getPendingTasks() const {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        return tasks_.size();
    }

    // Non-copyable, non-movable
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;
};

template<class F, class... Args>
auto ThreadPool::submit(F&& f, Args&&... args)
    -> std::future<typename std::invoke_result_t<F, Args...>> {
    using return_type = typename std::invoke_result_t<F, Args...>;

    // packaged_task stores any exception in the future
    auto task = std::make_shared<std::packaged_task<return_type()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...));
    std::future<return_type> result = task->get_future();

    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        if (stop_) {
            throw std::runtime_error("ThreadPool is stopping - cannot submit new tasks");
        }
        tasks_.emplace([task]() { (*task)(); });
        metrics_.tasks_submitted.fetch_add(1);
    }
    condition_.notify_one();
    return result;
}
