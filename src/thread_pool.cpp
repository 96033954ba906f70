#include "thread_pool.hpp"
#include "logging.hpp"

#include <exception>

ThreadPool::ThreadPool(unsigned int nThreads)
{
    if (nThreads == 0)
    {
        nThreads = defaultSize();
    }
    threads_.reserve(nThreads);
    for (unsigned int i = 0; i < nThreads; ++i)
    {
        threads_.emplace_back([this] { worker(); });
    }
}

ThreadPool::~ThreadPool()
{
    stop();
}

void ThreadPool::submit(Job job)
{
    {
        std::scoped_lock lock(mutex_);
        queue_.push(std::move(job));
    }
    cv_.notify_one();
}

void ThreadPool::wait()
{
    std::unique_lock lock(mutex_);
    idleCv_.wait(lock, [this] { return queue_.empty() && active_ == 0; });
}

void ThreadPool::stop()
{
    {
        std::scoped_lock lock(mutex_);
        std::queue<Job> empty;
        std::swap(queue_, empty);
        stopFlag_.store(true);
    }
    cv_.notify_all();

    for (auto &t : threads_)
    {
        if (t.joinable())
        {
            t.join();
        }
    }
    threads_.clear();
    idleCv_.notify_all();
}

unsigned int ThreadPool::defaultSize()
{
    const auto hardware = std::thread::hardware_concurrency();
    return hardware == 0 ? 1u : hardware;
}

void ThreadPool::worker()
{
    while (true)
    {
        Job job;
        {
            std::unique_lock lock(mutex_);
            cv_.wait(lock, [this] { return stopFlag_.load() || !queue_.empty(); });

            if (stopFlag_.load() && queue_.empty())
            {
                break;
            }

            job = std::move(queue_.front());
            queue_.pop();
            ++active_;
        }

        try
        {
            job();
        }
        catch (const std::exception &e)
        {
            LogRegistry::tasks()->error("[ThreadPool] Job failed: {}", e.what());
        }

        {
            std::scoped_lock lock(mutex_);
            --active_;
            if (queue_.empty() && active_ == 0)
            {
                idleCv_.notify_all();
            }
        }
    }
}
