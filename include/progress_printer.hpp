#pragma once

#include "progress.hpp"

#include <chrono>
#include <mutex>
#include <string>

/**
 * Renders TaskProgress events on stdout.
 * On a terminal: a redrawn progress bar. When piped: plain lines, throttled.
 */
class ProgressPrinter
{
public:
    explicit ProgressPrinter(std::string label);

    ProgressPrinter(const ProgressPrinter &) = delete;
    ProgressPrinter &operator=(const ProgressPrinter &) = delete;

    void update(const TaskProgress &progress);

    /**
     * Terminate the bar line once the task is over.
     */
    void finish();

    std::string formatDuration(long seconds) const;

private:
    std::string renderBar(double percentage) const;

    std::string label_;
    std::mutex mutex_;
    std::chrono::steady_clock::time_point startTime_;
    std::chrono::steady_clock::time_point lastProgressTime_;
    std::chrono::steady_clock::time_point lastPrintedTime_;
    double lastPrintedPercentage_ = -1.0;
    bool printedAnything_ = false;
    bool isTerminalOutput_ = true;
};
