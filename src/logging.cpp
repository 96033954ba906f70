#include "logging.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <vector>

namespace
{
    const std::vector<std::string> SUBSYSTEMS = {"digest", "manifest", "tasks", "config", "cli"};
}

void LogRegistry::init(const Settings &settings)
{
    std::scoped_lock lock(mutex_);
    if (initialized_)
    {
        spdlog::warn("[LogRegistry] Already initialized, ignoring second init()");
        return;
    }

    // Drop any fallback loggers handed out before init()
    for (const auto &name : SUBSYSTEMS)
    {
        spdlog::drop(name);
    }

    consoleSink_ = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    consoleSink_->set_level(settings.consoleLevel);
    consoleSink_->set_pattern(LOG_FORMAT);

    auto loggerLevel = settings.consoleLevel;
    if (settings.logFile && !settings.logFile->empty())
    {
        const auto parent = settings.logFile->parent_path();
        if (!parent.empty())
        {
            std::filesystem::create_directories(parent);
        }
        fileSink_ = std::make_shared<spdlog::sinks::basic_file_sink_mt>(settings.logFile->string(),
                                                                        /*truncate=*/false);
        fileSink_->set_level(spdlog::level::debug);
        fileSink_->set_pattern(LOG_FORMAT);
        loggerLevel = spdlog::level::debug;
    }

    initialized_ = true;
    for (const auto &name : SUBSYSTEMS)
    {
        makeLogger(name, loggerLevel);
    }

    spdlog::get("cli")->debug("[LogRegistry] Initialized");
}

void LogRegistry::shutdown()
{
    std::scoped_lock lock(mutex_);
    for (const auto &name : SUBSYSTEMS)
    {
        if (auto logger = spdlog::get(name))
        {
            logger->flush();
        }
        spdlog::drop(name);
    }
    consoleSink_.reset();
    fileSink_.reset();
    initialized_ = false;
}

std::shared_ptr<spdlog::logger> LogRegistry::get(const std::string &name)
{
    if (auto logger = spdlog::get(name))
    {
        return logger;
    }

    std::scoped_lock lock(mutex_);
    // Another thread may have registered it while we waited
    if (auto logger = spdlog::get(name))
    {
        return logger;
    }
    return makeLogger(name, spdlog::level::warn);
}

bool LogRegistry::isInitialized()
{
    std::scoped_lock lock(mutex_);
    return initialized_;
}

std::shared_ptr<spdlog::logger> LogRegistry::makeLogger(const std::string &name,
                                                        spdlog::level::level_enum level)
{
    std::vector<spdlog::sink_ptr> sinks;
    if (initialized_)
    {
        sinks.push_back(consoleSink_);
        if (fileSink_)
        {
            sinks.push_back(fileSink_);
        }
    }
    else
    {
        auto fallback = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        fallback->set_pattern(LOG_FORMAT);
        sinks.push_back(fallback);
    }

    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(logger);
    return logger;
}
