#include "progress_printer.hpp"

#include <cstdio>
#include <utility>
#include <unistd.h>

#include <fmt/core.h>

ProgressPrinter::ProgressPrinter(std::string label)
    : label_(std::move(label)),
      startTime_(std::chrono::steady_clock::now()),
      lastProgressTime_(startTime_),
      lastPrintedTime_(startTime_)
{
    // Detect if stdout is a terminal to decide how we render the progress bar
    isTerminalOutput_ = ::isatty(fileno(stdout));
}

void ProgressPrinter::update(const TaskProgress &progress)
{
    std::scoped_lock lock(mutex_);

    auto now = std::chrono::steady_clock::now();
    auto timeSinceStart = std::chrono::duration_cast<std::chrono::milliseconds>(now - startTime_).count();
    bool isComplete = (progress.total > 0 && progress.processed >= progress.total);

    if (isTerminalOutput_)
    {
        auto timeSinceLastUpdate = std::chrono::duration_cast<std::chrono::milliseconds>(now - lastProgressTime_).count();

        if (!isComplete)
        {
            // Don't show progress in the first 500ms (prevents flashing for instant tasks)
            if (timeSinceStart < 500)
            {
                return;
            }

            // Update at most 5 times per second (200ms interval)
            if (timeSinceLastUpdate < 200)
            {
                return;
            }
        }

        lastProgressTime_ = now;
    }
    else
    {
        auto timeSinceLastPrint = std::chrono::duration_cast<std::chrono::milliseconds>(now - lastPrintedTime_).count();

        // For non-terminal output (e.g., piped to file), print less frequently
        if (!isComplete && timeSinceLastPrint < 1000)
        {
            return;
        }
    }

    if (progress.total == 0)
    {
        return;
    }

    double percentage = (static_cast<double>(progress.processed) / progress.total) * 100.0;

    // Avoid over-printing in non-terminal environments
    if (!isTerminalOutput_ && !isComplete)
    {
        if (lastPrintedPercentage_ >= 0.0 && percentage < lastPrintedPercentage_ + 1.0)
        {
            return;
        }
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - startTime_).count();
    double rate = (elapsed > 0) ? static_cast<double>(progress.processed) / elapsed : 0.0;
    long eta = (rate > 0) ? static_cast<long>((progress.total - progress.processed) / rate) : 0;

    if (isTerminalOutput_)
    {
        fmt::print("\r{} {} {:.1f}% | {}/{} files | ETA: {}\033[K",
                   label_,
                   renderBar(percentage),
                   percentage,
                   progress.processed,
                   progress.total,
                   formatDuration(eta));
        std::fflush(stdout);
    }
    else
    {
        fmt::print("{} {:.1f}% | {}/{} files | {}\n",
                   label_,
                   percentage,
                   progress.processed,
                   progress.total,
                   progress.currentPath);
    }

    lastPrintedTime_ = now;
    lastPrintedPercentage_ = percentage;
    printedAnything_ = true;
}

void ProgressPrinter::finish()
{
    std::scoped_lock lock(mutex_);
    if (isTerminalOutput_ && printedAnything_)
    {
        // Print newline after progress bar
        fmt::print("\n");
        std::fflush(stdout);
    }
}

std::string ProgressPrinter::formatDuration(long seconds) const
{
    if (seconds < 60)
    {
        return fmt::format("{}s", seconds);
    }
    if (seconds < 3600)
    {
        return fmt::format("{}m {}s", seconds / 60, seconds % 60);
    }
    return fmt::format("{}h {}m", seconds / 3600, (seconds % 3600) / 60);
}

std::string ProgressPrinter::renderBar(double percentage) const
{
    // Progress bar (40 characters wide)
    constexpr int barWidth = 40;
    int filled = static_cast<int>((percentage / 100.0) * barWidth);
    std::string bar = "[";
    for (int i = 0; i < barWidth; ++i)
    {
        if (i < filled)
        {
            bar += "=";
        }
        else if (i == filled)
        {
            bar += ">";
        }
        else
        {
            bar += " ";
        }
    }
    bar += "]";
    return bar;
}
