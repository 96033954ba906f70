#include <gtest/gtest.h>

#include "config.hpp"
#include "errors.hpp"
#include "test_helpers.hpp"

#include <nlohmann/json.hpp>

class ConfigTest : public ::testing::Test {
protected:
    TempDir dir;
};

TEST_F(ConfigTest, MissingFileGivesDefaults) {
    const auto config = ConfigLoader::load(dir.path() / "settings.json");
    EXPECT_EQ(config.algorithm, "CRC32");
    EXPECT_EQ(config.delimiter, "space");
    EXPECT_EQ(config.commentMarker, ";");
    EXPECT_EQ(config.pathStyle, PathStyle::Relative);
    EXPECT_EQ(config.threads, 0u);
    EXPECT_EQ(config.manifestName, "checksum");
    EXPECT_FALSE(config.backupExisting);
}

TEST_F(ConfigTest, ReadsDesktopSettingsKeys) {
    dir.write("settings.json", R"({
        "checksum_algorithm": "SHA256",
        "delimiter": "Custom",
        "custom_delimiter": " | ",
        "output_path_type": "Absolute",
        "exclude_file_types": [".tmp", ".bak"],
        "num_threads": 3,
        "backup_original_sfv": true,
        "log_format": "CSV",
        "unknown_key": 42
    })");

    const auto config = ConfigLoader::load(dir.path() / "settings.json");
    EXPECT_EQ(ConfigLoader::algorithm(config), ChecksumAlgorithm::SHA256);
    EXPECT_EQ(config.delimiter, " | ");
    EXPECT_EQ(config.pathStyle, PathStyle::Absolute);
    EXPECT_EQ(config.excludeExtensions, (std::vector<std::string>{".tmp", ".bak"}));
    EXPECT_EQ(config.threads, 3u);
    EXPECT_TRUE(config.backupExisting);
    EXPECT_EQ(config.logFormat, ReportFormat::Csv);

    const auto generation = ConfigLoader::generationOptions(config);
    EXPECT_EQ(generation.delimiter, " | ");
    EXPECT_EQ(generation.threads, 3u);
    EXPECT_EQ(generation.manifestNames, std::vector<std::string>{"checksum.sfv"});
    EXPECT_EQ(ConfigLoader::saveOptions(config).existing, ExistingFilePolicy::Backup);
    EXPECT_EQ(ConfigLoader::saveOptions(config).pathStyle, PathStyle::Absolute);
}

TEST_F(ConfigTest, SaveThenLoad) {
    AppConfig config;
    config.algorithm = "MD5";
    config.delimiter = "tab";
    config.verifyAfterGenerate = true;
    config.excludeExtensions = {"log"};
    ConfigLoader::save(config, dir.path() / "settings.json");

    const auto loaded = ConfigLoader::load(dir.path() / "settings.json");
    EXPECT_EQ(loaded.algorithm, "MD5");
    EXPECT_EQ(ConfigLoader::parseOptions(loaded, std::nullopt).delimiter, "\t");
    EXPECT_TRUE(loaded.verifyAfterGenerate);
    EXPECT_EQ(loaded.excludeExtensions, std::vector<std::string>{"log"});
}

TEST_F(ConfigTest, InvalidJsonIsIOError) {
    dir.write("settings.json", "{ not json");
    try {
        ConfigLoader::load(dir.path() / "settings.json");
        FAIL() << "expected ChecksumError";
    } catch (const ChecksumError &e) {
        EXPECT_EQ(e.kind(), ChecksumError::Kind::IOError);
        EXPECT_EQ(e.phase(), "config");
    }
}

TEST_F(ConfigTest, UnknownAlgorithmIsUnsupported) {
    AppConfig config;
    config.algorithm = "tiger";
    try {
        ConfigLoader::algorithm(config);
        FAIL() << "expected ChecksumError";
    } catch (const ChecksumError &e) {
        EXPECT_EQ(e.kind(), ChecksumError::Kind::UnsupportedAlgorithm);
    }
}

TEST_F(ConfigTest, TaskOptionsCarryMode) {
    AppConfig config;
    config.threads = 2;
    EXPECT_EQ(ConfigLoader::verificationOptions(config, VerificationMode::Quick).mode, VerificationMode::Quick);
    EXPECT_EQ(ConfigLoader::comparisonOptions(config, ComparisonMode::Full).mode, ComparisonMode::Full);
    EXPECT_EQ(ConfigLoader::comparisonOptions(config, ComparisonMode::Full).threads, 2u);
}
