#include <gtest/gtest.h>
#include "common/ThreadSafeQueue.hpp"
#include "common/WorkerPool.hpp"
#include <algorithm>
#include <thread>

using namespace axe_fleet::common;

TEST(ThreadSafeQueueTest, ShutdownDrainsRemainingItems)
{
    ThreadSafeQueue<int> q;
    q.Push(1);
    q.Push(2);
    q.Shutdown();

    EXPECT_FALSE(q.Push(3));
    EXPECT_EQ(q.Pop(), std::optional<int>(1));
    EXPECT_EQ(q.Pop(), std::optional<int>(2));
    EXPECT_EQ(q.Pop(), std::nullopt);
}

TEST(ThreadSafeQueueTest, PopForTimesOutWhenEmpty)
{
    ThreadSafeQueue<int> q;
    EXPECT_EQ(q.PopFor(std::chrono::milliseconds(20)), std::nullopt);
}

TEST(WorkerPoolTest, WaitBlocksUntilEveryJobRan)
{
    WorkerPool pool(3);
    pool.Start();

    std::atomic<int> done{0};
    for (int i = 0; i < 20; ++i)
        pool.Submit([&done]()
                    { ++done; });

    pool.Wait();
    EXPECT_EQ(done.load(), 20);
    pool.Stop();
}

TEST(WorkerPoolTest, ThrowingJobDoesNotStopTheWorker)
{
    WorkerPool pool(1);
    pool.Start();

    std::atomic<bool> ran{false};
    pool.Submit([]()
                { throw std::runtime_error("boom"); });
    pool.Submit([&ran]()
                { ran = true; });

    pool.Wait();
    EXPECT_TRUE(ran);
}

TEST(ForEachBoundedTest, NeverExceedsParallelismLimit)
{
    std::atomic<int> in_flight{0};
    std::atomic<int> peak{0};

    ForEachBounded(12, 3, [&](std::size_t)
                   {
        const int now = ++in_flight;
        int seen = peak.load();
        while (now > seen && !peak.compare_exchange_weak(seen, now))
        {
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        --in_flight; });

    EXPECT_LE(peak.load(), 3);
    EXPECT_GE(peak.load(), 1);
}

TEST(ForEachBoundedTest, CancelledItemsGoToSkipped)
{
    std::atomic<bool> cancel{false};
    std::vector<int> state(6, 0);
    std::mutex m;

    ForEachBounded(
        state.size(), 1,
        [&](std::size_t i)
        {
            std::lock_guard<std::mutex> lock(m);
            state[i] = 1;
            if (i == 1)
                cancel = true;
        },
        [&](std::size_t i)
        {
            std::lock_guard<std::mutex> lock(m);
            state[i] = 2;
        },
        &cancel);

    EXPECT_EQ(state[0], 1);
    EXPECT_EQ(state[1], 1);
    for (std::size_t i = 2; i < state.size(); ++i)
        EXPECT_EQ(state[i], 2);
}
