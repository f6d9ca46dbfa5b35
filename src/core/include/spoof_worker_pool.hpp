#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace spoof {

/**
 * @brief Fixed set of worker threads draining a bounded job queue
 *
 * Connection handlers run here so a slow peer never blocks the accept loop.
 * post() refuses work once the queue is full or the pool is stopping; the
 * caller decides what to do with the rejected job.
 */
class WorkerPool {
public:
    using Job = std::function<void()>;

    static constexpr size_t DEFAULT_QUEUE_LIMIT = 1024;

    explicit WorkerPool(size_t num_workers,
                        size_t queue_limit = DEFAULT_QUEUE_LIMIT);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /// Queue a job. False if stopping or the queue is full.
    bool post(Job job);

    /// Runs queued jobs to completion, then joins the workers. Idempotent.
    void shutdown();

    size_t pending_jobs() const noexcept;
    size_t active_workers() const noexcept;
    size_t total_workers() const noexcept;
    bool is_running() const noexcept;

private:
    void run();

    std::vector<std::thread>  workers_;
    std::queue<Job>           jobs_;
    size_t                    queue_limit_;
    mutable std::mutex        queue_mutex_;
    std::condition_variable   condition_;
    std::atomic<bool>         stop_{false};
    std::atomic<size_t>       active_{0};
};

} // namespace spoof
