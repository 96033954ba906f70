#include <gtest/gtest.h>

#include "errors.hpp"
#include "manifest.hpp"
#include "test_helpers.hpp"

namespace {

FileEntry entry(const std::string &path, const std::string &digest) {
    FileEntry e;
    e.path = path;
    e.digest = digest;
    return e;
}

}

TEST(ManifestParseTest, EntriesAndCommentsInOrder) {
    const auto result = ManifestCodec::parse("; generated\nfile_a.txt 3610a686\nsub/file_b.txt 3A771143\n");

    ASSERT_TRUE(result.warnings.empty());
    const auto &manifest = result.manifest;
    ASSERT_EQ(manifest.items.size(), 3u);
    EXPECT_TRUE(manifest.items[0].isComment);
    EXPECT_EQ(manifest.items[0].comment, "; generated");

    const auto entries = manifest.entries();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].path, "file_a.txt");
    EXPECT_EQ(entries[0].digest, "3610a686");
    EXPECT_EQ(entries[1].path, "sub/file_b.txt");
    EXPECT_EQ(entries[1].digest, "3a771143"); // normalized to lowercase
    EXPECT_EQ(manifest.algorithm, ChecksumAlgorithm::CRC32);
}

TEST(ManifestParseTest, SplitsOnLastDelimiter) {
    const auto result = ManifestCodec::parse("my holiday photo.jpg 3610a686\n");
    ASSERT_EQ(result.manifest.entryCount(), 1u);
    EXPECT_EQ(result.manifest.entries()[0].path, "my holiday photo.jpg");
}

TEST(ManifestParseTest, CustomDelimiterAndCrlf) {
    ParseOptions options;
    options.delimiter = " | ";
    const auto result = ManifestCodec::parse("a | b.txt | 3610a686\r\nc.txt | 3a771143\r\n", options);

    ASSERT_TRUE(result.warnings.empty());
    const auto entries = result.manifest.entries();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].path, "a | b.txt");
    EXPECT_EQ(entries[1].digest, "3a771143");
}

TEST(ManifestParseTest, MalformedLinesAreReportedAndSkipped) {
    std::string text;
    for (int i = 0; i < 9; ++i) {
        text += fmt::format("file{}.txt 3610a686\n", i);
    }
    text += "this-line-has-no-delimiter\n";

    const auto result = ManifestCodec::parse(text);
    EXPECT_EQ(result.manifest.entryCount(), 9u);
    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_EQ(result.warnings[0].lineNumber, 10u);
    EXPECT_EQ(result.warnings[0].text, "this-line-has-no-delimiter");
    EXPECT_EQ(result.warnings[0].reason, "missing delimiter");
}

TEST(ManifestParseTest, NonHexDigestIsMalformed) {
    const auto result = ManifestCodec::parse("file.txt notahash\n\n   \n");
    EXPECT_EQ(result.manifest.entryCount(), 0u);
    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_EQ(result.warnings[0].lineNumber, 1u);
    EXPECT_NE(result.warnings[0].reason.find("not hexadecimal"), std::string::npos);
}

TEST(ManifestParseTest, AlgorithmGuessedFromDigestLength) {
    const auto result = ManifestCodec::parse("hello.txt aaf4c61ddcc5e8a2dabede0f3b482cd9aea9434d\n");
    EXPECT_EQ(result.manifest.algorithm, ChecksumAlgorithm::SHA1);
    EXPECT_EQ(result.manifest.entries()[0].algorithm, ChecksumAlgorithm::SHA1);
}

TEST(ManifestSerializeTest, ParseOfSerializeIsIdentity) {
    Manifest manifest;
    manifest.addComment("created by sfvcheck");
    manifest.addEntry(entry("a.txt", "3610a686"));
    manifest.addEntry(entry("dir/with space.txt", "3a771143"));

    const auto text = ManifestCodec::serialize(manifest);
    EXPECT_EQ(text, "; created by sfvcheck\na.txt 3610a686\ndir/with space.txt 3a771143\n");

    const auto reparsed = ManifestCodec::parse(text);
    EXPECT_TRUE(reparsed.warnings.empty());
    EXPECT_EQ(reparsed.manifest, manifest);
}

TEST(ManifestSerializeTest, PathStyles) {
    Manifest manifest;
    manifest.baseDirectory = "/data/set";
    manifest.addEntry(entry("/data/set/sub/a.txt", "3610a686"));

    EXPECT_EQ(ManifestCodec::serialize(manifest, PathStyle::Relative), "sub/a.txt 3610a686\n");
    EXPECT_EQ(ManifestCodec::serialize(manifest, PathStyle::Absolute), "/data/set/sub/a.txt 3610a686\n");

    Manifest relative;
    relative.baseDirectory = "/data/set";
    relative.addEntry(entry("sub/a.txt", "3610a686"));
    EXPECT_EQ(ManifestCodec::renderPath(relative, relative.entries()[0], PathStyle::Absolute), "/data/set/sub/a.txt");
    EXPECT_EQ(ManifestCodec::resolvePath(relative, relative.entries()[0]), fs::path("/data/set/sub/a.txt"));
}

TEST(ManifestSerializeTest, DelimiterNames) {
    EXPECT_EQ(ManifestCodec::delimiterFromName("space"), " ");
    EXPECT_EQ(ManifestCodec::delimiterFromName("Tab"), "\t");
    EXPECT_EQ(ManifestCodec::delimiterFromName("\\t"), "\t");
    EXPECT_EQ(ManifestCodec::delimiterFromName("::"), "::");
}

class ManifestFileTest : public ::testing::Test {
protected:
    TempDir dir;

    Manifest sample() const {
        Manifest manifest;
        manifest.baseDirectory = dir.path();
        manifest.addEntry(entry((dir.path() / "a.txt").generic_string(), "3610a686"));
        return manifest;
    }
};

TEST_F(ManifestFileTest, LoadSetsBaseDirectoryToManifestFolder) {
    dir.write("sub/list.sfv", "a.txt 3610a686\n");
    const auto result = ManifestCodec::load(dir.path() / "sub" / "list.sfv");
    EXPECT_EQ(result.manifest.baseDirectory, fs::absolute(dir.path() / "sub"));
    EXPECT_EQ(ManifestCodec::resolvePath(result.manifest, result.manifest.entries()[0]),
              fs::absolute(dir.path() / "sub") / "a.txt");
}

TEST_F(ManifestFileTest, LoadMissingFileIsIOError) {
    try {
        ManifestCodec::load(dir.path() / "missing.sfv");
        FAIL() << "expected ChecksumError";
    } catch (const ChecksumError &e) {
        EXPECT_EQ(e.kind(), ChecksumError::Kind::IOError);
        EXPECT_EQ(e.phase(), "load");
    }
}

TEST_F(ManifestFileTest, SaveWritesRelativePaths) {
    const auto written = ManifestCodec::save(sample(), dir.path() / "checksum.sfv");
    EXPECT_EQ(written, dir.path() / "checksum.sfv");
    EXPECT_EQ(dir.read("checksum.sfv"), "a.txt 3610a686\n");
}

TEST_F(ManifestFileTest, SaveOverExistingPicksUniqueName) {
    dir.write("checksum.sfv", "old\n");
    dir.write("checksum_1.sfv", "older\n");

    const auto written = ManifestCodec::save(sample(), dir.path() / "checksum.sfv");
    EXPECT_EQ(written, dir.path() / "checksum_2.sfv");
    EXPECT_EQ(dir.read("checksum.sfv"), "old\n");
}

TEST_F(ManifestFileTest, SaveWithBackupKeepsOldContent) {
    dir.write("checksum.sfv", "old\n");

    SaveOptions options;
    options.existing = ExistingFilePolicy::Backup;
    const auto written = ManifestCodec::save(sample(), dir.path() / "checksum.sfv", options);
    EXPECT_EQ(written, dir.path() / "checksum.sfv");
    EXPECT_EQ(dir.read("checksum.sfv"), "a.txt 3610a686\n");

    int backups = 0;
    for (const auto &item : fs::directory_iterator(dir.path())) {
        const auto name = item.path().filename().string();
        if (name.rfind("checksum.sfv.", 0) == 0 && item.path().extension() == ".bak") {
            ++backups;
            std::ifstream in(item.path());
            std::string line;
            std::getline(in, line);
            EXPECT_EQ(line, "old");
        }
    }
    EXPECT_EQ(backups, 1);
}

TEST_F(ManifestFileTest, SaveOverwrite) {
    dir.write("checksum.sfv", "old\n");
    SaveOptions options;
    options.existing = ExistingFilePolicy::Overwrite;
    options.pathStyle = PathStyle::Absolute;
    ManifestCodec::save(sample(), dir.path() / "checksum.sfv", options);
    EXPECT_EQ(dir.read("checksum.sfv"), fmt::format("{} 3610a686\n", (dir.path() / "a.txt").generic_string()));
}

TEST(ManifestSerializeTest, PathsKeepLeadingAndTrailingBlanks) {
    for (const std::string delimiter : {" ", "\t"}) {
        Manifest manifest;
        manifest.delimiter = delimiter;
        manifest.addEntry(entry(" lead.txt", "3610a686"));
        manifest.addEntry(entry("trail.txt ", "3a771143"));
        manifest.addEntry(entry("  both  ", "00000000"));

        ParseOptions options;
        options.delimiter = delimiter;
        const auto reparsed = ManifestCodec::parse(ManifestCodec::serialize(manifest), options);

        EXPECT_TRUE(reparsed.warnings.empty());
        EXPECT_EQ(reparsed.manifest, manifest) << "delimiter '" << delimiter << "'";
        ASSERT_EQ(reparsed.manifest.entryCount(), 3u);
        EXPECT_EQ(reparsed.manifest.entries()[0].path, " lead.txt");
        EXPECT_EQ(reparsed.manifest.entries()[1].path, "trail.txt ");
    }
}

TEST(ManifestParseTest, TrailingWhitespaceAfterDigestIsIgnored) {
    const auto result = ManifestCodec::parse("a.txt 3610a686  \t\r\n");
    ASSERT_EQ(result.manifest.entryCount(), 1u);
    EXPECT_EQ(result.manifest.entries()[0].path, "a.txt");
    EXPECT_EQ(result.manifest.entries()[0].digest, "3610a686");
}

TEST(ManifestParseTest, BlankPathIsMalformed) {
    const auto result = ManifestCodec::parse("   3610a686\n");
    EXPECT_EQ(result.manifest.entryCount(), 0u);
    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_EQ(result.warnings[0].reason, "empty path");
}
