/**
 * @file test_fingerprint_store.cpp
 * @brief Unit tests for the TTL fingerprint store
 */

#include <gtest/gtest.h>
#include "spoof_fingerprint_store.hpp"

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace spoof;
using namespace std::chrono_literals;

class FingerprintStoreTest : public ::testing::Test {
protected:
    JA4Fingerprint make_fp(const std::string& raw) {
        JA4Fingerprint fp;
        fp.raw = raw;
        fp.part_a = raw.substr(0, raw.find('_'));
        return fp;
    }
};

// Test 1: Basic record and lookup
TEST_F(FingerprintStoreTest, RecordLookup) {
    FingerprintStore store;
    store.record("192.0.2.1:50000", make_fp("t13d020200_62ed6f6ca7ad_b9a491fefe05"));

    auto fp = store.lookup("192.0.2.1:50000");
    ASSERT_TRUE(fp.has_value());
    EXPECT_EQ(fp->raw, "t13d020200_62ed6f6ca7ad_b9a491fefe05");
    EXPECT_EQ(fp->part_a, "t13d020200");
}

// Test 2: Unknown key is a silent miss
TEST_F(FingerprintStoreTest, LookupMiss) {
    FingerprintStore store;
    EXPECT_FALSE(store.lookup("192.0.2.1:1").has_value());
    EXPECT_EQ(store.stats().misses, 1u);
}

// Test 3: Entries older than the TTL are invisible
TEST_F(FingerprintStoreTest, ExpiresAfterTtl) {
    FingerprintStore store(50ms);
    store.record("198.51.100.7:443", make_fp("a"));
    EXPECT_TRUE(store.lookup("198.51.100.7:443").has_value());

    std::this_thread::sleep_for(120ms);
    EXPECT_FALSE(store.lookup("198.51.100.7:443").has_value());
}

// Test 4: Recording again replaces the entry and refreshes its age
TEST_F(FingerprintStoreTest, OverwriteReplaces) {
    FingerprintStore store(200ms);
    store.record("203.0.113.5:1000", make_fp("first"));
    std::this_thread::sleep_for(120ms);
    store.record("203.0.113.5:1000", make_fp("second"));
    std::this_thread::sleep_for(120ms);

    auto fp = store.lookup("203.0.113.5:1000");
    ASSERT_TRUE(fp.has_value());
    EXPECT_EQ(fp->raw, "second");
    EXPECT_EQ(store.stats().entries, 1u);
}

// Test 5: sweep() removes only expired entries
TEST_F(FingerprintStoreTest, SweepRemovesExpired) {
    FingerprintStore store(50ms);
    store.record("10.0.0.1:1", make_fp("old1"));
    store.record("10.0.0.2:2", make_fp("old2"));
    std::this_thread::sleep_for(120ms);
    store.record("10.0.0.3:3", make_fp("fresh"));

    EXPECT_EQ(store.sweep(), 2u);
    auto s = store.stats();
    EXPECT_EQ(s.entries, 1u);
    EXPECT_EQ(s.expirations, 2u);
    EXPECT_TRUE(store.lookup("10.0.0.3:3").has_value());
    EXPECT_EQ(store.sweep(), 0u);
}

// Test 6: Background sweep drains expired entries
TEST_F(FingerprintStoreTest, BackgroundSweep) {
    FingerprintStore store(40ms);
    store.start();
    EXPECT_TRUE(store.is_running());

    store.record("10.1.1.1:9", make_fp("gone"));
    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (store.stats().entries != 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(10ms);
    }
    EXPECT_EQ(store.stats().entries, 0u);

    store.stop();
    EXPECT_FALSE(store.is_running());
}

// Test 7: start/stop are idempotent and stop is prompt
TEST_F(FingerprintStoreTest, StartStopIdempotent) {
    FingerprintStore store(std::chrono::hours(1));
    store.stop();
    store.start();
    store.start();

    auto t0 = std::chrono::steady_clock::now();
    store.stop();
    store.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - t0, 1s);
    EXPECT_FALSE(store.is_running());
}

// Test 8: Concurrent writers and readers
TEST_F(FingerprintStoreTest, ConcurrentAccess) {
    FingerprintStore store(10s);
    store.start();

    constexpr int kThreads = 8;
    constexpr int kPerThread = 500;
    std::atomic<int> found{0};
    std::vector<std::thread> threads;

    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < kPerThread; ++i) {
                std::string key = "10." + std::to_string(t) + ".0.1:" + std::to_string(i);
                store.record(key, make_fp(key));
                auto fp = store.lookup(key);
                if (fp && fp->raw == key) ++found;
                store.lookup("10.255.255.255:" + std::to_string(i));
            }
        });
    }
    for (auto& th : threads) th.join();
    store.stop();

    EXPECT_EQ(found.load(), kThreads * kPerThread);
    auto s = store.stats();
    EXPECT_EQ(s.entries, static_cast<size_t>(kThreads * kPerThread));
    EXPECT_EQ(s.records, static_cast<uint64_t>(kThreads * kPerThread));
    EXPECT_EQ(s.hits, static_cast<uint64_t>(kThreads * kPerThread));
    EXPECT_EQ(s.misses, static_cast<uint64_t>(kThreads * kPerThread));
}

// Test 9: Stats report the oldest entry age
TEST_F(FingerprintStoreTest, StatsOldestAge) {
    FingerprintStore store;
    EXPECT_EQ(store.stats().entries, 0u);
    EXPECT_EQ(store.stats().oldest_age.count(), 0);

    store.record("10.0.0.1:1", make_fp("x"));
    std::this_thread::sleep_for(30ms);
    store.record("10.0.0.2:2", make_fp("y"));

    auto s = store.stats();
    EXPECT_EQ(s.entries, 2u);
    EXPECT_GE(s.oldest_age, 30ms);
    EXPECT_EQ(store.ttl(), std::chrono::milliseconds(FingerprintStore::DEFAULT_TTL));
}

// Test 10: Remote address keys
TEST(RemoteAddressTest, Formatting) {
    EXPECT_EQ(format_remote_address("192.0.2.10", 51234), "192.0.2.10:51234");
    EXPECT_EQ(format_remote_address("2001:db8::1", 443), "[2001:db8::1]:443");
    EXPECT_EQ(format_remote_address("::ffff:192.0.2.1", 80), "[::ffff:192.0.2.1]:80");
}
