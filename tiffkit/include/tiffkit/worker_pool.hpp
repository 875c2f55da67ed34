#pragma once

/**
 * @file worker_pool.hpp
 * @brief Fixed set of persistent threads running index-range jobs
 *
 * A job is an index range [0, count) split into contiguous task ranges.
 * The calling thread runs the first range itself; the others are queued to
 * the pool threads. run() returns only once every task of the job has
 * finished, so tasks may capture references to the caller's stack.
 *
 * The first error reported by a task is kept and returned. Once an error is
 * seen, tasks that have not started yet are skipped and running tasks can
 * observe the stop flag to end early.
 */

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>
#include "logging.hpp"
#include "types/result.hpp"

namespace tiffkit {

class WorkerPool {
public:
    /// Work on the index range [begin, end); `stop` becomes true after another task failed
    using RangeTask = std::function<Result<void>(std::size_t begin, std::size_t end, const std::atomic<bool>& stop)>;

    /// @brief Start the pool
    /// @param threads Total threads taking part in a job, the calling thread included.
    ///        0 uses the hardware concurrency.
    explicit WorkerPool(unsigned threads);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /// Threads taking part in a job, the calling thread included
    [[nodiscard]] std::size_t concurrency() const noexcept { return threads_.size() + 1; }

    /// @brief Run `task` over [0, count) and wait for completion
    /// @return Ok() if every range succeeded, otherwise the first error reported
    [[nodiscard]] Result<void> run(std::size_t count, const RangeTask& task) noexcept;

private:
    /// @brief Per-job state shared between calling thread and worker threads
    struct JobState {
        std::mutex mutex;                        // Protects tasks_remaining and first_error
        std::condition_variable cv;              // Signals calling thread
        std::size_t tasks_remaining{0};
        std::atomic<bool> error_occurred{false}; // Fast path: check without lock
        Result<void> first_error = Ok();
    };

    using WorkerTask = std::function<void()>;

    std::vector<std::thread> threads_;
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<WorkerTask> pending_tasks_;
    bool stop_threads_ = false;

    void worker_loop();

    static void run_range(const RangeTask& task, std::size_t begin, std::size_t end,
                          const std::shared_ptr<JobState>& job) noexcept;
};

inline WorkerPool::WorkerPool(unsigned threads) {
    if (threads == 0) {
        threads = std::thread::hardware_concurrency();
        if (threads == 0) threads = 1;
    }
    // The calling thread is one of the workers of each job
    for (unsigned i = 1; i < threads; ++i) {
        threads_.emplace_back(&WorkerPool::worker_loop, this);
    }
}

inline WorkerPool::~WorkerPool() {
    {
        std::lock_guard lock(queue_mutex_);
        stop_threads_ = true;
    }
    queue_cv_.notify_all();

    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
}

inline void WorkerPool::worker_loop() {
    while (true) {
        WorkerTask task;
        {
            std::unique_lock lock(queue_mutex_);
            queue_cv_.wait(lock, [this] {
                return stop_threads_ || !pending_tasks_.empty();
            });

            // Exit if shutdown requested and no work remains
            if (stop_threads_ && pending_tasks_.empty()) return;

            task = std::move(pending_tasks_.front());
            pending_tasks_.pop_front();
        }

        if (task) {
            task();
        }
    }
}

inline void WorkerPool::run_range(const RangeTask& task, std::size_t begin, std::size_t end,
                                  const std::shared_ptr<JobState>& job) noexcept {
    // RAII helper to ensure counter is always decremented
    struct TaskGuard {
        const std::shared_ptr<JobState>& state;
        ~TaskGuard() {
            {
                std::lock_guard lock(state->mutex);
                state->tasks_remaining--;
            }
            state->cv.notify_all();
        }
    } guard{job};

    if (job->error_occurred.load(std::memory_order_acquire)) {
        return;
    }

    auto result = task(begin, end, job->error_occurred);
    if (result.is_error()) {
        std::lock_guard lock(job->mutex);
        if (!job->error_occurred.load(std::memory_order_relaxed)) {
            job->first_error = result;
            job->error_occurred.store(true, std::memory_order_release);
        }
    }
}

inline Result<void> WorkerPool::run(std::size_t count, const RangeTask& task) noexcept {
    if (count == 0) {
        return Ok();
    }

    const std::size_t per_task = (count + concurrency() - 1) / concurrency();
    const std::size_t total_tasks = (count + per_task - 1) / per_task;

    std::shared_ptr<JobState> job;
    try {
        job = std::make_shared<JobState>();
    } catch (const std::bad_alloc&) {
        return Err(Error::Code::MemoryError, "Failed to allocate worker job");
    }
    job->tasks_remaining = total_tasks;

    auto range_end = [&](std::size_t t) { return std::min(count, (t + 1) * per_task); };

    std::size_t queued = 1;
    if (total_tasks > 1) {
        try {
            std::lock_guard lock(queue_mutex_);
            for (; queued < total_tasks; ++queued) {
                const std::size_t begin = queued * per_task;
                const std::size_t end = range_end(queued);
                // `task` is captured by reference: run() waits for every task below
                pending_tasks_.push_back([&task, begin, end, job]() {
                    WorkerPool::run_range(task, begin, end, job);
                });
            }
        } catch (const std::bad_alloc&) {
            logger()->warn("Could not queue {} of {} worker tasks, running them on the calling thread",
                           total_tasks - queued, total_tasks);
        }
        queue_cv_.notify_all();
    }

    // First range, and any range that could not be queued, run on the calling thread
    for (std::size_t t = 0; t < total_tasks; t = (t == 0 ? queued : t + 1)) {
        run_range(task, t * per_task, range_end(t), job);
    }

    std::unique_lock lock(job->mutex);
    job->cv.wait(lock, [&] { return job->tasks_remaining == 0; });

    if (job->error_occurred.load(std::memory_order_acquire)) {
        logger()->error("Worker failed: {}", job->first_error.error().message);
        return job->first_error;
    }
    return Ok();
}

} // namespace tiffkit
