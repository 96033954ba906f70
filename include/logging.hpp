#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

/**
 * Named spdlog loggers for the engine subsystems.
 *
 * init() wires a colour console sink and, optionally, a debug file sink.
 * Loggers requested before init() get a console-only fallback so the
 * engine can be used as a plain library.
 */
class LogRegistry
{
public:
    struct Settings
    {
        spdlog::level::level_enum consoleLevel = spdlog::level::warn;
        std::optional<std::filesystem::path> logFile; // Debug log, disabled if empty
    };

    static constexpr const char *LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    static void init(const Settings &settings);
    static void shutdown();

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string &name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> digest() { return get("digest"); }
    static std::shared_ptr<spdlog::logger> manifest() { return get("manifest"); }
    static std::shared_ptr<spdlog::logger> tasks() { return get("tasks"); }
    static std::shared_ptr<spdlog::logger> config() { return get("config"); }
    static std::shared_ptr<spdlog::logger> cli() { return get("cli"); }

    [[nodiscard]] static bool isInitialized();

private:
    static std::shared_ptr<spdlog::logger> makeLogger(const std::string &name,
                                                      spdlog::level::level_enum level);

    static inline std::mutex mutex_;
    static inline bool initialized_ = false;
    static inline spdlog::sink_ptr consoleSink_;
    static inline spdlog::sink_ptr fileSink_;
};
