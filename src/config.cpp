#include "config.hpp"
#include "errors.hpp"
#include "logging.hpp"

#include <fstream>
#include <system_error>
#include <fmt/core.h>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

namespace
{
    template <typename T>
    void read(const nlohmann::json &json, const char *key, T &target)
    {
        const auto it = json.find(key);
        if (it != json.end() && !it->is_null())
        {
            target = it->get<T>();
        }
    }
}

AppConfig ConfigLoader::load(const fs::path &file)
{
    std::error_code ec;
    if (!fs::exists(file, ec))
    {
        LogRegistry::config()->debug("No settings file at {}, using defaults", file.string());
        return AppConfig{};
    }

    std::ifstream in(file);
    if (!in)
    {
        throw ChecksumError(ChecksumError::Kind::IOError, file.string(), "Cannot open settings file", "config");
    }

    try
    {
        const auto json = nlohmann::json::parse(in);
        auto config = fromJson(json);
        LogRegistry::config()->debug("Loaded settings from {}", file.string());
        return config;
    }
    catch (const nlohmann::json::exception &e)
    {
        throw ChecksumError(ChecksumError::Kind::IOError, file.string(),
                            fmt::format("Invalid settings: {}", e.what()), "config");
    }
}

void ConfigLoader::save(const AppConfig &config, const fs::path &file)
{
    std::ofstream out(file, std::ios::trunc);
    if (!out)
    {
        throw ChecksumError(ChecksumError::Kind::IOError, file.string(), "Cannot write settings file", "config");
    }
    out << toJson(config).dump(4) << '\n';
    if (!out.good())
    {
        throw ChecksumError(ChecksumError::Kind::IOError, file.string(), "Write error while saving settings",
                            "config");
    }
}

AppConfig ConfigLoader::fromJson(const nlohmann::json &json)
{
    AppConfig config;
    if (!json.is_object())
    {
        throw ChecksumError(ChecksumError::Kind::IOError, "", "Settings must be a JSON object", "config");
    }

    read(json, "checksum_algorithm", config.algorithm);
    read(json, "delimiter", config.delimiter);
    read(json, "comment_marker", config.commentMarker);
    read(json, "exclude_file_types", config.excludeExtensions);
    read(json, "num_threads", config.threads);
    read(json, "chunk_size", config.chunkSize);
    read(json, "default_sfv_filename", config.manifestName);
    read(json, "backup_original_sfv", config.backupExisting);
    read(json, "verify_after_generate", config.verifyAfterGenerate);
    read(json, "logging_enabled", config.loggingEnabled);
    read(json, "log_file_path", config.logFile);
    read(json, "default_directory", config.defaultDirectory);

    // The desktop settings stored "Custom" plus a separate custom_delimiter
    if (config.delimiter == "Custom")
    {
        config.delimiter = " ";
        read(json, "custom_delimiter", config.delimiter);
    }

    std::string pathType;
    read(json, "output_path_type", pathType);
    if (pathType == "Absolute" || pathType == "absolute")
    {
        config.pathStyle = PathStyle::Absolute;
    }

    std::string logFormat;
    read(json, "log_format", logFormat);
    if (auto format = VerificationReport::parseFormat(logFormat))
    {
        config.logFormat = *format;
    }

    return config;
}

nlohmann::json ConfigLoader::toJson(const AppConfig &config)
{
    return nlohmann::json{
        {"checksum_algorithm", config.algorithm},
        {"delimiter", config.delimiter},
        {"comment_marker", config.commentMarker},
        {"output_path_type", config.pathStyle == PathStyle::Absolute ? "Absolute" : "Relative"},
        {"exclude_file_types", config.excludeExtensions},
        {"num_threads", config.threads},
        {"chunk_size", config.chunkSize},
        {"default_sfv_filename", config.manifestName},
        {"backup_original_sfv", config.backupExisting},
        {"verify_after_generate", config.verifyAfterGenerate},
        {"logging_enabled", config.loggingEnabled},
        {"log_file_path", config.logFile},
        {"log_format", VerificationReport::formatName(config.logFormat)},
        {"default_directory", config.defaultDirectory},
    };
}

ChecksumAlgorithm ConfigLoader::algorithm(const AppConfig &config)
{
    return ChecksumCalculator::requireAlgorithm(config.algorithm);
}

GenerationOptions ConfigLoader::generationOptions(const AppConfig &config)
{
    GenerationOptions options;
    options.excludeExtensions = config.excludeExtensions;
    options.manifestNames = {config.manifestName + ".sfv"};
    options.delimiter = ManifestCodec::delimiterFromName(config.delimiter);
    options.commentMarker = config.commentMarker;
    options.threads = config.threads;
    options.chunkSize = config.chunkSize;
    options.verifyAfterGenerate = config.verifyAfterGenerate;
    return options;
}

VerificationOptions ConfigLoader::verificationOptions(const AppConfig &config, VerificationMode mode)
{
    VerificationOptions options;
    options.mode = mode;
    options.threads = config.threads;
    options.chunkSize = config.chunkSize;
    return options;
}

ComparisonOptions ConfigLoader::comparisonOptions(const AppConfig &config, ComparisonMode mode)
{
    ComparisonOptions options;
    options.mode = mode;
    options.threads = config.threads;
    options.chunkSize = config.chunkSize;
    return options;
}

ParseOptions ConfigLoader::parseOptions(const AppConfig &config, std::optional<ChecksumAlgorithm> algorithm)
{
    ParseOptions options;
    options.delimiter = ManifestCodec::delimiterFromName(config.delimiter);
    options.commentMarker = config.commentMarker;
    options.algorithm = algorithm;
    return options;
}

SaveOptions ConfigLoader::saveOptions(const AppConfig &config)
{
    SaveOptions options;
    options.pathStyle = config.pathStyle;
    options.existing = config.backupExisting ? ExistingFilePolicy::Backup : ExistingFilePolicy::UniqueName;
    return options;
}
