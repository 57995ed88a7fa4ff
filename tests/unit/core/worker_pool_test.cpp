#include <gtest/gtest.h>
#include <assetsync/core/worker_pool.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace assetsync;

TEST(WorkerPoolTest, RunsEveryTask) {
    WorkerPool pool(4);
    std::atomic<int> sum{0};
    for (int i = 1; i <= 100; ++i)
        pool.enqueue([&sum, i] { sum += i; });
    pool.waitIdle();
    EXPECT_EQ(sum.load(), 5050);
    EXPECT_EQ(pool.getQueueSize(), 0u);
}

TEST(WorkerPoolTest, ThreadCountBoundsConcurrency) {
    WorkerPool pool(3);
    std::atomic<int> active{0};
    std::atomic<int> peak{0};
    for (int i = 0; i < 30; ++i) {
        pool.enqueue([&] {
            int now = ++active;
            int p = peak.load();
            while (now > p && !peak.compare_exchange_weak(p, now)) {
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
            --active;
        });
    }
    pool.waitIdle();
    EXPECT_LE(peak.load(), 3);
    EXPECT_EQ(pool.size(), 3u);
}

TEST(WorkerPoolTest, ThrowingTaskDoesNotKillWorker) {
    WorkerPool pool(1);
    std::atomic<bool> ran{false};
    pool.enqueue([] { throw std::runtime_error("task failure"); });
    pool.enqueue([&] { ran = true; });
    pool.waitIdle();
    EXPECT_TRUE(ran.load());
}

TEST(WorkerPoolTest, NonStandardExceptionDoesNotKillWorker) {
    WorkerPool pool(1);
    std::atomic<bool> ran{false};
    pool.enqueue([] { throw 42; });
    pool.enqueue([&] { ran = true; });
    pool.waitIdle();
    EXPECT_TRUE(ran.load());
}

TEST(WorkerPoolTest, ZeroThreadsMeansOne) {
    WorkerPool pool(0);
    EXPECT_EQ(pool.size(), 1u);
}

TEST(WorkerPoolTest, SequentialBatchesReuseThePool) {
    WorkerPool pool(2);
    std::atomic<int> count{0};
    for (int batch = 0; batch < 5; ++batch) {
        for (int i = 0; i < 10; ++i)
            pool.enqueue([&] { ++count; });
        pool.waitIdle();
        EXPECT_EQ(count.load(), (batch + 1) * 10);
    }
}
