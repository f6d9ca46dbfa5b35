#include "../include/spoof_worker_pool.hpp"
#include "../include/spoof_logger.hpp"

#include <exception>

namespace spoof {

WorkerPool::WorkerPool(size_t num_workers, size_t queue_limit)
    : queue_limit_(queue_limit == 0 ? 1 : queue_limit)
{
    if (num_workers == 0) {
        num_workers = 1;
    }

    workers_.reserve(num_workers);
    for (size_t i = 0; i < num_workers; ++i) {
        workers_.emplace_back([this] { run(); });
    }
}

WorkerPool::~WorkerPool() {
    shutdown();
}

bool WorkerPool::post(Job job) {
    if (!job) return false;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stop_ || jobs_.size() >= queue_limit_) {
            return false;
        }
        jobs_.push(std::move(job));
    }
    condition_.notify_one();
    return true;
}

void WorkerPool::run() {
    while (true) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            condition_.wait(lock, [this] {
                return stop_ || !jobs_.empty();
            });
            if (stop_ && jobs_.empty()) {
                return;
            }
            job = std::move(jobs_.front());
            jobs_.pop();
        }
        ++active_;
        try {
            job();
        } catch (const std::exception& e) {
            SPOOF_LOG_ERROR("pool", std::string("job failed: ") + e.what());
        }
        --active_;
    }
}

void WorkerPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stop_) return;
        stop_ = true;
    }
    condition_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

size_t WorkerPool::pending_jobs() const noexcept {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return jobs_.size();
}

size_t WorkerPool::active_workers() const noexcept {
    return active_.load();
}

size_t WorkerPool::total_workers() const noexcept {
    return workers_.size();
}

bool WorkerPool::is_running() const noexcept {
    return !stop_.load();
}

} // namespace spoof
