#include <gtest/gtest.h>
#include "execution_pool.h"
#include <atomic>
#include <thread>
#include <vector>

namespace gradebox {
namespace {

class ExecutionPoolTest : public ::testing::Test {
protected:
    void SetUp() override {
        ExecutionPool::Config config;
        config.max_concurrent = 2;
        config.max_queue = 1;
        config.queue_wait = std::chrono::seconds(1);

        pool = std::make_unique<ExecutionPool>(config);
    }

    std::unique_ptr<ExecutionPool> pool;
};

TEST_F(ExecutionPoolTest, AcquiresUpToCapacity) {
    EXPECT_EQ(pool->acquire(), ExecutionPool::AcquireResult::ACQUIRED);
    EXPECT_EQ(pool->acquire(), ExecutionPool::AcquireResult::ACQUIRED);

    auto stats = pool->stats();
    EXPECT_EQ(stats.capacity, 2);
    EXPECT_EQ(stats.active, 2);
    EXPECT_EQ(stats.queued, 0);

    pool->release();
    pool->release();
    EXPECT_EQ(pool->stats().active, 0);
    EXPECT_EQ(pool->stats().completed, 2);
}

TEST_F(ExecutionPoolTest, WaitsForReleasedSlot) {
    // Given: A full pool
    ASSERT_EQ(pool->acquire(), ExecutionPool::AcquireResult::ACQUIRED);
    ASSERT_EQ(pool->acquire(), ExecutionPool::AcquireResult::ACQUIRED);

    // When: A slot frees up while a third request waits
    std::thread releaser([this]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        pool->release();
    });
    auto result = pool->acquire();
    releaser.join();

    // Then: The waiter gets it
    EXPECT_EQ(result, ExecutionPool::AcquireResult::ACQUIRED);
    EXPECT_EQ(pool->stats().active, 2);
}

TEST_F(ExecutionPoolTest, QueueWaitExpires) {
    ASSERT_EQ(pool->acquire(), ExecutionPool::AcquireResult::ACQUIRED);
    ASSERT_EQ(pool->acquire(), ExecutionPool::AcquireResult::ACQUIRED);

    auto start = std::chrono::steady_clock::now();
    auto result = pool->acquire();
    auto waited = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(result, ExecutionPool::AcquireResult::TIMED_OUT);
    EXPECT_GE(waited, std::chrono::milliseconds(900));
    EXPECT_LT(waited, std::chrono::seconds(3));
    EXPECT_EQ(pool->stats().rejected, 1);
    EXPECT_EQ(pool->stats().queued, 0);
}

TEST_F(ExecutionPoolTest, FullQueueFailsFast) {
    // Given: Both slots busy and the single queue place taken
    ASSERT_EQ(pool->acquire(), ExecutionPool::AcquireResult::ACQUIRED);
    ASSERT_EQ(pool->acquire(), ExecutionPool::AcquireResult::ACQUIRED);

    std::atomic<bool> waiter_done(false);
    std::thread waiter([this, &waiter_done]() {
        pool->acquire();
        waiter_done = true;
    });
    while (pool->stats().queued == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    // When: Another request arrives
    auto start = std::chrono::steady_clock::now();
    auto result = pool->acquire();

    // Then: It is rejected without waiting
    EXPECT_EQ(result, ExecutionPool::AcquireResult::QUEUE_FULL);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(200));

    waiter.join();
    EXPECT_TRUE(waiter_done);
}

TEST_F(ExecutionPoolTest, CancelledWhileQueued) {
    ASSERT_EQ(pool->acquire(), ExecutionPool::AcquireResult::ACQUIRED);
    ASSERT_EQ(pool->acquire(), ExecutionPool::AcquireResult::ACQUIRED);

    CancellationToken cancel;
    std::thread canceller([&cancel]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        cancel.cancel("client disconnected");
    });
    auto result = pool->acquire(&cancel);
    canceller.join();

    EXPECT_EQ(result, ExecutionPool::AcquireResult::CANCELLED);
    EXPECT_EQ(pool->stats().active, 2);
}

TEST_F(ExecutionPoolTest, AlreadyCancelledNeverTakesASlot) {
    CancellationToken cancel;
    cancel.cancel("client disconnected");

    EXPECT_EQ(pool->acquire(&cancel), ExecutionPool::AcquireResult::CANCELLED);
    EXPECT_EQ(pool->stats().active, 0);
}

TEST_F(ExecutionPoolTest, LeaseReleasesOnScopeExit) {
    {
        ASSERT_EQ(pool->acquire(), ExecutionPool::AcquireResult::ACQUIRED);
        ExecutionPool::Lease lease(pool.get());
        EXPECT_TRUE(lease.valid());
        EXPECT_EQ(pool->stats().active, 1);

        ExecutionPool::Lease moved(std::move(lease));
        EXPECT_FALSE(lease.valid());
        EXPECT_EQ(pool->stats().active, 1);
    }
    EXPECT_EQ(pool->stats().active, 0);
}

TEST_F(ExecutionPoolTest, NeverExceedsCapacityUnderContention) {
    ExecutionPool::Config config;
    config.max_concurrent = 3;
    config.max_queue = 64;
    config.queue_wait = std::chrono::seconds(10);
    ExecutionPool contended(config);

    std::atomic<int> running(0);
    std::atomic<int> peak(0);
    std::vector<std::thread> threads;
    for (int i = 0; i < 12; ++i) {
        threads.emplace_back([&]() {
            ASSERT_EQ(contended.acquire(), ExecutionPool::AcquireResult::ACQUIRED);
            ExecutionPool::Lease lease(&contended);
            int now = ++running;
            int seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now)) {}
            std::this_thread::sleep_for(std::chrono::milliseconds(30));
            --running;
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_LE(peak.load(), 3);
    EXPECT_EQ(contended.stats().completed, 12);
}

} // namespace
} // namespace gradebox
