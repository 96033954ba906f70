#include <gtest/gtest.h>

#include "progress.hpp"
#include "thread_pool.hpp"

#include <atomic>
#include <stdexcept>
#include <string>

TEST(ThreadPoolTest, RunsEveryJob) {
    ThreadPool pool(4);
    EXPECT_EQ(pool.workerCount(), 4u);

    std::atomic<int> counter{0};
    for (int i = 0; i < 100; ++i) {
        pool.submit([&counter] { ++counter; });
    }
    pool.wait();
    EXPECT_EQ(counter.load(), 100);
}

TEST(ThreadPoolTest, ZeroMeansDefaultSize) {
    ThreadPool pool(0);
    EXPECT_EQ(pool.workerCount(), ThreadPool::defaultSize());
    EXPECT_GE(ThreadPool::defaultSize(), 1u);
}

TEST(ThreadPoolTest, EscapingExceptionDoesNotKillWorker) {
    ThreadPool pool(1);
    std::atomic<int> counter{0};
    pool.submit([] { throw std::runtime_error("job failed"); });
    pool.submit([&counter] { ++counter; });
    pool.wait();
    EXPECT_EQ(counter.load(), 1);
}

TEST(ThreadPoolTest, WaitOnIdlePoolReturns) {
    ThreadPool pool(2);
    pool.wait();
    pool.stop();
    SUCCEED();
}

TEST(ProgressTrackerTest, CallbacksAreSerializedAndMonotonic) {
    std::atomic<int> inFlight{0};
    std::atomic<bool> overlapped{false};
    std::atomic<bool> wentBackwards{false};
    std::size_t last = 0;

    ProgressTracker tracker(200, [&](const TaskProgress &progress) {
        if (inFlight.fetch_add(1) != 0) {
            overlapped = true;
        }
        if (progress.processed < last) {
            wentBackwards = true;
        }
        last = progress.processed;
        inFlight.fetch_sub(1);
    });

    {
        ThreadPool pool(8);
        for (int i = 0; i < 200; ++i) {
            pool.submit([&tracker, i] { tracker.advance(std::to_string(i)); });
        }
        pool.wait();
    }

    EXPECT_FALSE(overlapped.load());
    EXPECT_FALSE(wentBackwards.load());
    EXPECT_EQ(tracker.snapshot().processed, 200u);
    EXPECT_EQ(tracker.snapshot().total, 200u);
}
