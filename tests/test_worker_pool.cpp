/**
 * @file test_worker_pool.cpp
 * @brief Tests for the connection worker pool
 */

#include <gtest/gtest.h>
#include "spoof_worker_pool.hpp"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace spoof;
using namespace std::chrono_literals;

// Test 1: Every posted job runs before shutdown returns
TEST(WorkerPoolTest, RunsAllJobs) {
    std::atomic<int> count{0};
    {
        WorkerPool pool(4);
        EXPECT_EQ(pool.total_workers(), 4u);
        for (int i = 0; i < 100; ++i) {
            ASSERT_TRUE(pool.post([&count] { ++count; }));
        }
        pool.shutdown();
    }
    EXPECT_EQ(count.load(), 100);
}

// Test 2: Full queue rejects new jobs
TEST(WorkerPoolTest, RejectsWhenFull) {
    std::atomic<bool> release{false};
    WorkerPool pool(1, 2);

    ASSERT_TRUE(pool.post([&release] { while (!release) std::this_thread::sleep_for(1ms); }));
    while (pool.active_workers() == 0) std::this_thread::sleep_for(1ms);

    EXPECT_TRUE(pool.post([] {}));
    EXPECT_TRUE(pool.post([] {}));
    EXPECT_FALSE(pool.post([] {}));
    EXPECT_EQ(pool.pending_jobs(), 2u);

    release = true;
    pool.shutdown();
    EXPECT_EQ(pool.pending_jobs(), 0u);
}

// Test 3: No work accepted after shutdown
TEST(WorkerPoolTest, RejectsAfterShutdown) {
    WorkerPool pool(2);
    EXPECT_TRUE(pool.is_running());
    pool.shutdown();
    pool.shutdown();
    EXPECT_FALSE(pool.is_running());
    EXPECT_FALSE(pool.post([] {}));
    EXPECT_FALSE(pool.post(nullptr));
}

// Test 4: A throwing job does not take its worker down
TEST(WorkerPoolTest, SurvivesThrowingJob) {
    std::atomic<int> count{0};
    WorkerPool pool(1);
    ASSERT_TRUE(pool.post([] { throw std::runtime_error("boom"); }));
    ASSERT_TRUE(pool.post([&count] { ++count; }));
    pool.shutdown();
    EXPECT_EQ(count.load(), 1);
}

// Test 5: Zero workers still gets one
TEST(WorkerPoolTest, AtLeastOneWorker) {
    WorkerPool pool(0);
    EXPECT_EQ(pool.total_workers(), 1u);
}
