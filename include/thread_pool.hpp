#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

/**
 * Fixed-size pool of worker threads draining a FIFO job queue.
 * Jobs are expected to capture their own errors; anything that escapes is logged.
 */
class ThreadPool
{
public:
    using Job = std::function<void()>;

    explicit ThreadPool(unsigned int nThreads);
    ~ThreadPool();

    ThreadPool(const ThreadPool &) = delete;
    ThreadPool &operator=(const ThreadPool &) = delete;

    void submit(Job job);

    /**
     * Block until the queue is empty and no job is running.
     */
    void wait();

    /**
     * Drop queued jobs, finish running ones and join all workers.
     */
    void stop();

    unsigned int workerCount() const { return static_cast<unsigned int>(threads_.size()); }

    /**
     * Pool size to use when the configuration says 0: hardware concurrency, at least 1.
     */
    static unsigned int defaultSize();

private:
    void worker();

    std::vector<std::thread> threads_;
    std::queue<Job> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idleCv_;
    std::size_t active_ = 0;
    std::atomic<bool> stopFlag_{false};
};
