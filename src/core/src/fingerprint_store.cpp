/**
 * @file fingerprint_store.cpp
 * @brief FingerprintStore implementation
 *
 * Threading model:
 *   - map_mu (shared_mutex) guards entries. lookup()/stats() share it,
 *     record()/sweep() own it exclusively.
 *   - The sweeper sleeps on cv/cv_mu, never while holding map_mu, so
 *     stop() wakes it immediately.
 */

#include "../include/spoof_fingerprint_store.hpp"
#include "../include/spoof_logger.hpp"
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <shared_mutex>
#include <thread>
#include <unordered_map>

namespace spoof {

struct FingerprintStore::Impl {
    struct Entry {
        JA4Fingerprint fingerprint;
        Clock::time_point captured;
    };

    std::chrono::milliseconds ttl;

    mutable std::shared_mutex map_mu;
    std::unordered_map<std::string, Entry> entries;

    std::atomic<uint64_t> records{0};
    mutable std::atomic<uint64_t> hits{0};
    mutable std::atomic<uint64_t> misses{0};
    std::atomic<uint64_t> expirations{0};

    std::atomic<bool> running{false};
    std::thread sweeper;
    std::mutex cv_mu;
    std::condition_variable cv;

    explicit Impl(std::chrono::milliseconds t) : ttl(t) {}

    bool expired(const Entry& e, Clock::time_point now) const {
        return now - e.captured > ttl;
    }

    size_t sweep_locked(Clock::time_point now) {
        size_t removed = 0;
        for (auto it = entries.begin(); it != entries.end();) {
            if (expired(it->second, now)) {
                it = entries.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        expirations += removed;
        return removed;
    }

    std::chrono::milliseconds interval() const {
        auto half = ttl / 2;
        return half.count() > 0 ? half : std::chrono::milliseconds(1);
    }

    void sweep_loop() {
        std::unique_lock<std::mutex> lock(cv_mu);
        while (running.load()) {
            cv.wait_for(lock, interval(), [this] { return !running.load(); });
            if (!running.load()) break;

            lock.unlock();
            size_t removed;
            {
                std::unique_lock<std::shared_mutex> wl(map_mu);
                removed = sweep_locked(Clock::now());
            }
            if (removed > 0) {
                SPOOF_LOG_DEBUG("store", "swept " + std::to_string(removed) +
                                " expired fingerprint(s)");
            }
            lock.lock();
        }
    }
};

FingerprintStore::FingerprintStore(std::chrono::milliseconds ttl)
    : impl_(std::make_unique<Impl>(ttl)) {}

FingerprintStore::~FingerprintStore() {
    stop();
}

void FingerprintStore::record(const std::string& remote_address,
                              const JA4Fingerprint& fp) {
    std::unique_lock<std::shared_mutex> lock(impl_->map_mu);
    impl_->entries[remote_address] = Impl::Entry{fp, Clock::now()};
    ++impl_->records;
}

std::optional<JA4Fingerprint> FingerprintStore::lookup(
    const std::string& remote_address) const
{
    std::shared_lock<std::shared_mutex> lock(impl_->map_mu);
    auto it = impl_->entries.find(remote_address);
    if (it == impl_->entries.end() || impl_->expired(it->second, Clock::now())) {
        ++impl_->misses;
        return std::nullopt;
    }
    ++impl_->hits;
    return it->second.fingerprint;
}

size_t FingerprintStore::sweep() {
    std::unique_lock<std::shared_mutex> lock(impl_->map_mu);
    return impl_->sweep_locked(Clock::now());
}

void FingerprintStore::start() {
    std::lock_guard<std::mutex> lock(impl_->cv_mu);
    if (impl_->running.load()) return;
    impl_->running = true;
    impl_->sweeper = std::thread(&Impl::sweep_loop, impl_.get());
}

void FingerprintStore::stop() {
    {
        std::lock_guard<std::mutex> lock(impl_->cv_mu);
        impl_->running = false;
    }
    impl_->cv.notify_all();
    if (impl_->sweeper.joinable()) impl_->sweeper.join();
}

bool FingerprintStore::is_running() const {
    return impl_->running.load();
}

std::chrono::milliseconds FingerprintStore::ttl() const {
    return impl_->ttl;
}

FingerprintStoreStats FingerprintStore::stats() const {
    FingerprintStoreStats s;
    std::shared_lock<std::shared_mutex> lock(impl_->map_mu);
    auto now = Clock::now();
    s.entries = impl_->entries.size();
    for (const auto& kv : impl_->entries) {
        auto age = std::chrono::duration_cast<std::chrono::milliseconds>(
            now - kv.second.captured);
        if (age > s.oldest_age) s.oldest_age = age;
    }
    s.records = impl_->records.load();
    s.hits = impl_->hits.load();
    s.misses = impl_->misses.load();
    s.expirations = impl_->expirations.load();
    return s;
}

std::string format_remote_address(const std::string& ip, uint16_t port) {
    if (ip.find(':') != std::string::npos) {
        return "[" + ip + "]:" + std::to_string(port);
    }
    return ip + ":" + std::to_string(port);
}

} // namespace spoof
