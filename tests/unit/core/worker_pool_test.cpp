#include <gtest/gtest.h>
#include <codegraph/concurrency/worker_pool.h>

#include <atomic>

using codegraph::concurrency::WorkerPool;

TEST(WorkerPoolTest, JoinDrainsQueuedWork) {
    std::atomic<int> done{0};
    WorkerPool pool(3);
    EXPECT_EQ(pool.threads(), 3u);
    for (int i = 0; i < 100; ++i) {
        pool.post([&done] { done.fetch_add(1, std::memory_order_relaxed); });
    }
    pool.join();
    EXPECT_EQ(done.load(), 100);

    // Idempotent
    pool.join();
}

TEST(WorkerPoolTest, ZeroThreadsMeansOne) {
    WorkerPool pool(0);
    EXPECT_EQ(pool.threads(), 1u);
    std::atomic<bool> ran{false};
    pool.post([&ran] { ran = true; });
    pool.join();
    EXPECT_TRUE(ran.load());
}
