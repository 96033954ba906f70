#include <gtest/gtest.h>

#include "errors.hpp"
#include "generator.hpp"
#include "verifier.hpp"
#include "test_helpers.hpp"

#include <unistd.h>

class VerifierTest : public ::testing::Test {
protected:
    TempDir dir;

    void SetUp() override {
        dir.write("file_a.txt", "hello");
        dir.write("file_b.txt", "world");
        dir.write("checksum.sfv",
                  "; sample\n"
                  "file_a.txt 3610a686\n"
                  "file_b.txt 00000000\n"
                  "file_c.txt 12345678\n");
    }
};

TEST_F(VerifierTest, ClassifiesOkMismatchMissing) {
    const auto result = ManifestVerifier::verifyFile(dir.path() / "checksum.sfv");

    ASSERT_EQ(result.items.size(), 3u);
    EXPECT_EQ(result.items[0].entry.path, "file_a.txt");
    EXPECT_EQ(result.items[0].status, EntryStatus::Ok);
    EXPECT_EQ(result.items[1].status, EntryStatus::Mismatch);
    EXPECT_EQ(result.items[1].actualDigest, "3a771143");
    EXPECT_EQ(result.items[2].status, EntryStatus::Missing);

    EXPECT_EQ(result.count(EntryStatus::Ok), 1u);
    EXPECT_FALSE(result.allOk());
    EXPECT_TRUE(result.warnings.empty());
}

TEST_F(VerifierTest, ResultDoesNotDependOnPoolSize) {
    VerificationOptions single;
    single.threads = 1;
    VerificationOptions many;
    many.threads = 8;

    const auto a = ManifestVerifier::verifyFile(dir.path() / "checksum.sfv", {}, single);
    const auto b = ManifestVerifier::verifyFile(dir.path() / "checksum.sfv", {}, many);

    ASSERT_EQ(a.items.size(), b.items.size());
    for (std::size_t i = 0; i < a.items.size(); ++i) {
        EXPECT_EQ(a.items[i].entry, b.items[i].entry);
        EXPECT_EQ(a.items[i].status, b.items[i].status);
        EXPECT_EQ(a.items[i].actualDigest, b.items[i].actualDigest);
    }
}

TEST_F(VerifierTest, UppercaseDigestsMatch) {
    dir.write("upper.sfv", "file_a.txt 3610A686\n");
    const auto result = ManifestVerifier::verifyFile(dir.path() / "upper.sfv");
    EXPECT_TRUE(result.allOk());
}

TEST_F(VerifierTest, MalformedLinesBecomeWarnings) {
    dir.write("mixed.sfv", "file_a.txt 3610a686\ngarbage\n");
    const auto result = ManifestVerifier::verifyFile(dir.path() / "mixed.sfv");
    EXPECT_EQ(result.items.size(), 1u);
    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_EQ(result.warnings[0].lineNumber, 2u);
}

TEST_F(VerifierTest, ManifestWithoutValidEntriesIsMalformed) {
    dir.write("bad.sfv", "garbage\nmore garbage here\n");
    try {
        ManifestVerifier::verifyFile(dir.path() / "bad.sfv");
        FAIL() << "expected ChecksumError";
    } catch (const ChecksumError &e) {
        EXPECT_EQ(e.kind(), ChecksumError::Kind::MalformedManifest);
        EXPECT_EQ(e.phase(), "parse");
    }
}

TEST_F(VerifierTest, QuickModeRejectsOnSizeWithoutHashing) {
    Manifest manifest;
    manifest.baseDirectory = dir.path();
    FileEntry entry;
    entry.path = "file_a.txt";
    entry.digest = "3610a686";
    entry.size = 99;
    manifest.addEntry(entry);

    VerificationOptions options;
    options.mode = VerificationMode::Quick;
    const auto quick = ManifestVerifier::verify(manifest, options);
    ASSERT_EQ(quick.items.size(), 1u);
    EXPECT_EQ(quick.items[0].status, EntryStatus::Mismatch);
    EXPECT_TRUE(quick.items[0].actualDigest.empty());

    options.mode = VerificationMode::Full;
    const auto full = ManifestVerifier::verify(manifest, options);
    EXPECT_EQ(full.items[0].status, EntryStatus::Ok);
}

TEST_F(VerifierTest, DirectoryEntryIsMissing) {
    fs::create_directories(dir.path() / "folder");
    Manifest manifest;
    manifest.baseDirectory = dir.path();
    FileEntry entry;
    entry.path = "folder";
    entry.digest = "00000000";
    manifest.addEntry(entry);

    const auto result = ManifestVerifier::verify(manifest);
    EXPECT_EQ(result.items[0].status, EntryStatus::Missing);
}

TEST_F(VerifierTest, ProgressReachesTotal) {
    std::size_t last = 0;
    std::size_t total = 0;
    ManifestVerifier::verifyFile(dir.path() / "checksum.sfv", {}, {}, [&](const TaskProgress &progress) {
        last = progress.processed;
        total = progress.total;
    });
    EXPECT_EQ(total, 3u);
    EXPECT_EQ(last, 3u);
}

TEST_F(VerifierTest, CancelledBeforeStart) {
    CancellationToken token;
    token.cancel();
    EXPECT_THROW(ManifestVerifier::verifyFile(dir.path() / "checksum.sfv", {}, {}, {}, token), ChecksumError);
}

TEST(VerifierStatusTest, Names) {
    EXPECT_STREQ(ManifestVerifier::statusName(EntryStatus::Ok), "OK");
    EXPECT_STREQ(ManifestVerifier::statusName(EntryStatus::Mismatch), "MISMATCH");
    EXPECT_STREQ(ManifestVerifier::statusName(EntryStatus::Missing), "MISSING");
    EXPECT_STREQ(ManifestVerifier::statusName(EntryStatus::Error), "ERROR");
}

TEST(VerifierRoundTripTest, GenerateThenModifyAndDelete) {
    TempDir dir;
    dir.write("set/a.txt", "hello");
    dir.write("set/b.txt", "world");
    dir.write("set/c.txt", "third");

    const auto generated = ManifestGenerator::generate({dir.path() / "set"}, ChecksumAlgorithm::CRC32);
    const auto written = ManifestCodec::save(generated.manifest, dir.path() / "set" / "checksum.sfv");

    dir.write("set/b.txt", "World");
    fs::remove(dir.path() / "set" / "c.txt");

    const auto result = ManifestVerifier::verifyFile(written);
    ASSERT_EQ(result.items.size(), 3u);
    EXPECT_EQ(result.items[0].entry.path, "a.txt");
    EXPECT_EQ(result.items[0].status, EntryStatus::Ok);
    EXPECT_EQ(result.items[1].entry.path, "b.txt");
    EXPECT_EQ(result.items[1].status, EntryStatus::Mismatch);
    EXPECT_EQ(result.items[2].entry.path, "c.txt");
    EXPECT_EQ(result.items[2].status, EntryStatus::Missing);
}

TEST_F(VerifierTest, UnreadableFileIsErrorNotMissing) {
    if (::geteuid() == 0) {
        GTEST_SKIP() << "permission bits do not apply to root";
    }
    const auto locked = dir.write("locked.txt", "hello");
    fs::permissions(locked, fs::perms::none);
    dir.write("locked.sfv", "locked.txt 3610a686\n");

    const auto result = ManifestVerifier::verifyFile(dir.path() / "locked.sfv");
    fs::permissions(locked, fs::perms::owner_read | fs::perms::owner_write);

    ASSERT_EQ(result.items.size(), 1u);
    EXPECT_EQ(result.items[0].status, EntryStatus::Error);
    EXPECT_FALSE(result.items[0].error.empty());
}
