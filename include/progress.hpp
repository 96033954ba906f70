#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

/**
 * Snapshot of a running task, for display only.
 */
struct TaskProgress
{
    std::size_t processed = 0;
    std::size_t total = 0;
    std::string currentPath;
};

/**
 * Invoked from worker threads with (processed, total, current path).
 * Calls are serialized under the tracker's lock, so the callback must be quick
 * and must not call back into the task: every worker waits while it runs.
 */
using ProgressCallback = std::function<void(const TaskProgress &)>;

/**
 * Shared cancellation flag. Copies refer to the same flag.
 * Workers poll it between files, never in the middle of one.
 */
class CancellationToken
{
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { flag_->store(true); }
    bool isCancelled() const { return flag_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

/**
 * Thread-safe progress counter.
 *
 * The counter and the callback share one lock, so callers observe processed
 * counts in non-decreasing order even when files finish out of order.
 */
class ProgressTracker
{
public:
    ProgressTracker(std::size_t total, ProgressCallback callback)
        : callback_(std::move(callback))
    {
        snapshot_.total = total;
    }

    /**
     * Count one item as processed and notify the callback.
     */
    void advance(const std::string &path)
    {
        std::scoped_lock lock(mutex_);
        ++snapshot_.processed;
        snapshot_.currentPath = path;
        if (callback_)
        {
            callback_(snapshot_);
        }
    }

    TaskProgress snapshot() const
    {
        std::scoped_lock lock(mutex_);
        return snapshot_;
    }

private:
    mutable std::mutex mutex_;
    TaskProgress snapshot_;
    ProgressCallback callback_;
};
