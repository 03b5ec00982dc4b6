/// @file thread_pool.cpp
/// @brief Bounded worker pool implementation

#include "thread_pool.h"

#include <exception>

#include "logging.h"

namespace aegis {

ThreadPool::ThreadPool(size_t num_threads, size_t max_queue_size)
    : max_queue_size_(max_queue_size) {
    if (num_threads == 0) {
        num_threads = std::thread::hardware_concurrency();
        if (num_threads == 0) {
            num_threads = 1;
        }
    }

    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back(&ThreadPool::WorkerLoop, this);
    }
}

ThreadPool::~ThreadPool() {
    Shutdown();
}

absl::Status ThreadPool::Execute(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_.load(std::memory_order_acquire)) {
            return absl::FailedPreconditionError("Thread pool is stopped");
        }
        if (max_queue_size_ > 0 && tasks_.size() >= max_queue_size_) {
            dropped_.fetch_add(1, std::memory_order_relaxed);
            return absl::ResourceExhaustedError("Thread pool queue is full");
        }
        tasks_.push(std::move(task));
    }

    condition_.notify_one();
    return absl::OkStatus();
}

void ThreadPool::WorkerLoop() {
    while (true) {
        std::function<void()> task;

        {
            std::unique_lock<std::mutex> lock(mutex_);
            condition_.wait(lock, [this] {
                return stop_.load(std::memory_order_acquire) || !tasks_.empty();
            });

            if (tasks_.empty()) {
                return;  // stopped and drained
            }

            task = std::move(tasks_.front());
            tasks_.pop();
            ++active_tasks_;
        }

        try {
            task();
        } catch (const std::exception& e) {
            AEGIS_LOG_ERROR("Background task failed: {}", e.what());
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            --active_tasks_;
        }
        completion_condition_.notify_all();
    }
}

size_t ThreadPool::PendingTasks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size() + active_tasks_;
}

void ThreadPool::Wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    completion_condition_.wait(lock, [this] {
        return tasks_.empty() && active_tasks_ == 0;
    });
}

void ThreadPool::Shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_.store(true, std::memory_order_release);
    }
    condition_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

}  // namespace aegis
