#pragma once

#include "comparator.hpp"
#include "generator.hpp"
#include "manifest.hpp"
#include "report.hpp"
#include "verifier.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

/**
 * Settings for the checker.
 * Loaded from a JSON settings file, then overridden by CLI11 flags.
 * Passed explicitly into each task; nothing here is global.
 */
struct AppConfig
{
    // Checksum settings
    std::string algorithm = "CRC32";
    std::string delimiter = "space"; // "space", "tab" or any custom string
    std::string commentMarker = ";";
    PathStyle pathStyle = PathStyle::Relative;
    std::vector<std::string> excludeExtensions;

    // Execution
    unsigned int threads = 0; // 0 = hardware concurrency
    std::size_t chunkSize = ChecksumCalculator::DEFAULT_CHUNK_SIZE;

    // Output manifest
    std::string manifestName = "checksum"; // Default file stem, ".sfv" appended
    bool backupExisting = false;           // Otherwise pick a unique name
    bool verifyAfterGenerate = false;

    // Verification log
    bool loggingEnabled = false;
    std::string logFile = "sfv_checker_debug.log";
    ReportFormat logFormat = ReportFormat::Txt;

    std::string defaultDirectory;
};

/**
 * JSON persistence for AppConfig, plus the option structs each task takes.
 */
class ConfigLoader
{
public:
    /**
     * Read settings. A missing file yields the defaults.
     * @throws ChecksumError IOError (phase "config") on unreadable or invalid JSON
     */
    static AppConfig load(const std::filesystem::path &file);

    /**
     * @throws ChecksumError IOError (phase "config") if the file cannot be written
     */
    static void save(const AppConfig &config, const std::filesystem::path &file);

    /**
     * Unknown keys are ignored, missing keys keep their defaults.
     */
    static AppConfig fromJson(const nlohmann::json &json);
    static nlohmann::json toJson(const AppConfig &config);

    /**
     * @throws ChecksumError UnsupportedAlgorithm for an unknown algorithm name
     */
    static ChecksumAlgorithm algorithm(const AppConfig &config);

    static GenerationOptions generationOptions(const AppConfig &config);
    static VerificationOptions verificationOptions(const AppConfig &config, VerificationMode mode);
    static ComparisonOptions comparisonOptions(const AppConfig &config, ComparisonMode mode);
    static ParseOptions parseOptions(const AppConfig &config, std::optional<ChecksumAlgorithm> algorithm);
    static SaveOptions saveOptions(const AppConfig &config);
};
