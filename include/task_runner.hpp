#pragma once

#include "comparator.hpp"
#include "errors.hpp"
#include "generator.hpp"
#include "progress.hpp"
#include "verifier.hpp"

#include <atomic>
#include <chrono>
#include <exception>
#include <filesystem>
#include <future>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

enum class TaskState
{
    Running,
    Succeeded,
    Failed,
    Cancelled
};

/**
 * Caller's side of a submitted task.
 *
 * Resolves to exactly one of: the task's result, a ChecksumError describing
 * why it failed, or a ChecksumError of kind Cancelled. Copies share the task;
 * dropping the last copy waits for the worker to finish.
 */
template <typename Result>
class TaskHandle
{
public:
    struct Shared
    {
        CancellationToken token;
        std::atomic<TaskState> state{TaskState::Running};
        mutable std::mutex progressMutex;
        TaskProgress lastProgress;
    };

    TaskHandle(std::shared_future<Result> future, std::shared_ptr<Shared> shared)
        : future_(std::move(future)), shared_(std::move(shared))
    {
    }

    /**
     * Request cooperative cancellation. Workers stop between files.
     */
    void cancel() { shared_->token.cancel(); }

    bool isDone() const
    {
        return future_.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    }

    void wait() const { future_.wait(); }

    bool waitFor(std::chrono::milliseconds timeout) const
    {
        return future_.wait_for(timeout) == std::future_status::ready;
    }

    /**
     * Block for the result.
     * @throws ChecksumError if the task failed or was cancelled
     */
    Result get() const { return future_.get(); }

    TaskState state() const { return shared_->state.load(); }

    /**
     * Last progress event delivered to the caller.
     */
    TaskProgress progress() const
    {
        std::scoped_lock lock(shared_->progressMutex);
        return shared_->lastProgress;
    }

private:
    std::shared_future<Result> future_;
    std::shared_ptr<Shared> shared_;
};

/**
 * Runs engine tasks off the caller's thread.
 *
 * Holds no state of its own: every submission carries its own options and
 * gets its own worker thread, which in turn drives the task's worker pool.
 */
class TaskRunner
{
public:
    static TaskHandle<GenerationResult> submitGenerate(std::vector<std::filesystem::path> inputs,
                                                       ChecksumAlgorithm algorithm,
                                                       GenerationOptions options,
                                                       ProgressCallback progress = {});

    static TaskHandle<VerificationResult> submitVerify(Manifest manifest,
                                                       VerificationOptions options,
                                                       ProgressCallback progress = {});

    static TaskHandle<VerificationResult> submitVerifyFile(std::filesystem::path manifestFile,
                                                           ParseOptions parseOptions,
                                                           VerificationOptions options,
                                                           ProgressCallback progress = {});

    static TaskHandle<ComparisonResult> submitCompare(std::filesystem::path pathA,
                                                      std::filesystem::path pathB,
                                                      ComparisonOptions options,
                                                      ProgressCallback progress = {});

    /**
     * Run work(progress, token) asynchronously.
     * Filesystem exceptions escaping the work are reported as IOError.
     */
    template <typename Result, typename Work>
    static TaskHandle<Result> submit(Work work, ProgressCallback progress)
    {
        auto shared = std::make_shared<typename TaskHandle<Result>::Shared>();

        ProgressCallback relay = [shared, progress = std::move(progress)](const TaskProgress &step) {
            {
                std::scoped_lock lock(shared->progressMutex);
                shared->lastProgress = step;
            }
            if (progress)
            {
                progress(step);
            }
        };

        auto future = std::async(std::launch::async, [shared, relay = std::move(relay), work = std::move(work)]() -> Result {
            try
            {
                Result result = work(relay, shared->token);
                shared->state.store(TaskState::Succeeded);
                return result;
            }
            catch (const ChecksumError &e)
            {
                shared->state.store(e.kind() == ChecksumError::Kind::Cancelled ? TaskState::Cancelled
                                                                                : TaskState::Failed);
                throw;
            }
            catch (const std::filesystem::filesystem_error &e)
            {
                shared->state.store(TaskState::Failed);
                throw ChecksumError(ChecksumError::Kind::IOError, e.path1().string(), e.code().message(), "task");
            }
            catch (...)
            {
                shared->state.store(TaskState::Failed);
                throw;
            }
        });

        return TaskHandle<Result>(future.share(), shared);
    }
};
