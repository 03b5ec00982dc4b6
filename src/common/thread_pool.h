#pragma once

/// @file thread_pool.h
/// @brief Bounded worker pool for fire-and-forget background work

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

#include <absl/status/status.h>

namespace aegis {

/// @brief Fixed set of workers draining a bounded FIFO queue
///
/// Execute() never blocks: when the queue is full the task is rejected
/// with ResourceExhausted and counted in DroppedTasks(). Tasks that throw
/// are logged and do not take down the worker.
class ThreadPool {
public:
    /// @param num_threads Worker count (0 = hardware concurrency)
    /// @param max_queue_size Pending task limit (0 = unbounded)
    explicit ThreadPool(size_t num_threads = 1, size_t max_queue_size = 0);

    /// @brief Runs every queued task, then joins the workers
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    /// @brief Queue a task
    /// @return ResourceExhausted when the queue is full,
    ///         FailedPrecondition after Shutdown()
    absl::Status Execute(std::function<void()> task);

    size_t Size() const { return workers_.size(); }

    /// @brief Queued plus running tasks
    size_t PendingTasks() const;

    /// @brief Tasks rejected because the queue was full
    uint64_t DroppedTasks() const { return dropped_.load(std::memory_order_relaxed); }

    /// @brief Block until the queue is empty and no task is running
    void Wait();

    /// @brief Stop accepting tasks, finish the queued ones and join
    void Shutdown();

    bool IsStopped() const { return stop_.load(std::memory_order_acquire); }

private:
    void WorkerLoop();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    const size_t max_queue_size_;

    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::condition_variable completion_condition_;

    std::atomic<bool> stop_{false};
    size_t active_tasks_ = 0;  // guarded by mutex_
    std::atomic<uint64_t> dropped_{0};
};

}  // namespace aegis
