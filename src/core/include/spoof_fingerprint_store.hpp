#ifndef SPOOF_FINGERPRINT_STORE_HPP
#define SPOOF_FINGERPRINT_STORE_HPP

/**
 * @file spoof_fingerprint_store.hpp
 * @brief TTL store joining handshake-time fingerprints to request-time logging
 */

#include "spoof_ja4.hpp"
#include <string>
#include <memory>
#include <optional>
#include <chrono>

namespace spoof {

struct FingerprintStoreStats {
    size_t entries = 0;
    std::chrono::milliseconds oldest_age{0};
    uint64_t records = 0;
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t expirations = 0;
};

/**
 * @brief Remote-address keyed fingerprint cache with periodic sweep
 *
 * The capture path calls record() once per fingerprinted connection; the
 * request-logging path calls lookup() with the same "ip:port" key. Entries
 * older than the TTL are invisible to lookup() and are removed by sweep(),
 * which start() runs every TTL/2 on a background thread.
 *
 * Lookups take a shared lock and never block each other; record() and
 * sweep() take the lock exclusively.
 *
 * A reused ip:port inside the TTL window can return the previous
 * connection's fingerprint.
 */
class FingerprintStore {
public:
    using Clock = std::chrono::steady_clock;

    static constexpr std::chrono::seconds DEFAULT_TTL{300};

    explicit FingerprintStore(std::chrono::milliseconds ttl = DEFAULT_TTL);
    ~FingerprintStore();

    FingerprintStore(const FingerprintStore&) = delete;
    FingerprintStore& operator=(const FingerprintStore&) = delete;

    /**
     * @brief Store `fp` under `remote_address`, replacing any previous entry
     */
    void record(const std::string& remote_address, const JA4Fingerprint& fp);

    /**
     * @brief Fingerprint for `remote_address` if present and younger than TTL
     */
    std::optional<JA4Fingerprint> lookup(const std::string& remote_address) const;

    /**
     * @brief Remove entries older than TTL
     * @return Number of entries removed
     */
    size_t sweep();

    /// Launch the background sweep (interval TTL/2). Idempotent.
    void start();

    /// Cancel and join the background sweep. Idempotent.
    void stop();

    bool is_running() const;

    std::chrono::milliseconds ttl() const;
    FingerprintStoreStats stats() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * @brief "ip:port", IPv6 addresses bracketed as "[addr]:port"
 */
std::string format_remote_address(const std::string& ip, uint16_t port);

} // namespace spoof

#endif // SPOOF_FINGERPRINT_STORE_HPP
