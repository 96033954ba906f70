#include <gtest/gtest.h>

#include "checksum.hpp"
#include "errors.hpp"
#include "test_helpers.hpp"

#include <stdexcept>

class ChecksumTest : public ::testing::Test {
protected:
    TempDir dir;
};

TEST_F(ChecksumTest, Crc32OfKnownStrings) {
    EXPECT_EQ(ChecksumCalculator::compute(dir.write("a.txt", "hello"), ChecksumAlgorithm::CRC32), "3610a686");
    EXPECT_EQ(ChecksumCalculator::compute(dir.write("b.txt", "world"), ChecksumAlgorithm::CRC32), "3a771143");
    EXPECT_EQ(ChecksumCalculator::compute(dir.write("c.txt", "123456789"), ChecksumAlgorithm::CRC32), "cbf43926");
}

TEST_F(ChecksumTest, Crc32OfEmptyFileIsZeroPadded) {
    EXPECT_EQ(ChecksumCalculator::compute(dir.write("empty.bin", ""), ChecksumAlgorithm::CRC32), "00000000");
}

TEST_F(ChecksumTest, OpenSslDigestsOfHello) {
    const auto file = dir.write("hello.txt", "hello");
    EXPECT_EQ(ChecksumCalculator::compute(file, ChecksumAlgorithm::MD5), "5d41402abc4b2a76b9719d911017c592");
    EXPECT_EQ(ChecksumCalculator::compute(file, ChecksumAlgorithm::SHA1), "aaf4c61ddcc5e8a2dabede0f3b482cd9aea9434d");
    EXPECT_EQ(ChecksumCalculator::compute(file, ChecksumAlgorithm::SHA256),
              "2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824");
}

TEST_F(ChecksumTest, DigestDoesNotDependOnChunkSize) {
    std::string content;
    for (int i = 0; i < 50000; ++i) {
        content += static_cast<char>('a' + i % 26);
    }
    const auto file = dir.write("big.bin", content);

    const auto small = ChecksumCalculator::compute(file, ChecksumAlgorithm::SHA256, ChecksumCalculator::MIN_CHUNK_SIZE);
    const auto large = ChecksumCalculator::compute(file, ChecksumAlgorithm::SHA256);
    EXPECT_EQ(small, large);
    EXPECT_EQ(ChecksumCalculator::compute(file, ChecksumAlgorithm::CRC32, 1),
              ChecksumCalculator::compute(file, ChecksumAlgorithm::CRC32));
}

TEST_F(ChecksumTest, DigestLengthMatchesRegistry) {
    const auto file = dir.write("x.bin", "some bytes");
    for (auto algorithm : ChecksumCalculator::allAlgorithms()) {
        if (!ChecksumCalculator::isSupported(algorithm)) {
            continue;
        }
        const auto digest = ChecksumCalculator::compute(file, algorithm);
        EXPECT_EQ(digest.size(), ChecksumCalculator::digestLength(algorithm))
            << ChecksumCalculator::algorithmName(algorithm);
        EXPECT_TRUE(ChecksumCalculator::isHex(digest));
    }
}

TEST_F(ChecksumTest, MissingFileIsIOError) {
    try {
        ChecksumCalculator::compute(dir.path() / "nope.txt", ChecksumAlgorithm::CRC32);
        FAIL() << "expected ChecksumError";
    } catch (const ChecksumError &e) {
        EXPECT_EQ(e.kind(), ChecksumError::Kind::IOError);
        EXPECT_EQ(e.phase(), "digest");
        EXPECT_NE(e.path().find("nope.txt"), std::string::npos);
    }
}

TEST_F(ChecksumTest, DirectoryIsIOError) {
    try {
        ChecksumCalculator::compute(dir.path(), ChecksumAlgorithm::MD5);
        FAIL() << "expected ChecksumError";
    } catch (const ChecksumError &e) {
        EXPECT_EQ(e.kind(), ChecksumError::Kind::IOError);
    }
}

TEST(ChecksumAlgorithmTest, ParseAcceptsCommonSpellings) {
    EXPECT_EQ(ChecksumCalculator::parseAlgorithm("crc32"), ChecksumAlgorithm::CRC32);
    EXPECT_EQ(ChecksumCalculator::parseAlgorithm("CRC32"), ChecksumAlgorithm::CRC32);
    EXPECT_EQ(ChecksumCalculator::parseAlgorithm("SHA-256"), ChecksumAlgorithm::SHA256);
    EXPECT_EQ(ChecksumCalculator::parseAlgorithm("sha3_512"), ChecksumAlgorithm::SHA3_512);
    EXPECT_EQ(ChecksumCalculator::parseAlgorithm("BLAKE2b"), ChecksumAlgorithm::BLAKE2b512);
    EXPECT_FALSE(ChecksumCalculator::parseAlgorithm("whirlpool").has_value());
}

TEST(ChecksumAlgorithmTest, NamesRoundTripThroughParse) {
    for (auto algorithm : ChecksumCalculator::allAlgorithms()) {
        EXPECT_EQ(ChecksumCalculator::parseAlgorithm(ChecksumCalculator::algorithmName(algorithm)), algorithm);
    }
}

TEST(ChecksumAlgorithmTest, UnknownNameIsUnsupportedAlgorithm) {
    try {
        ChecksumCalculator::requireAlgorithm("rot13");
        FAIL() << "expected ChecksumError";
    } catch (const ChecksumError &e) {
        EXPECT_EQ(e.kind(), ChecksumError::Kind::UnsupportedAlgorithm);
    }
}

TEST(ChecksumAlgorithmTest, GuessFromDigestLength) {
    EXPECT_EQ(ChecksumCalculator::algorithmFromDigestLength(8), ChecksumAlgorithm::CRC32);
    EXPECT_EQ(ChecksumCalculator::algorithmFromDigestLength(32), ChecksumAlgorithm::MD5);
    EXPECT_EQ(ChecksumCalculator::algorithmFromDigestLength(40), ChecksumAlgorithm::SHA1);
    EXPECT_EQ(ChecksumCalculator::algorithmFromDigestLength(64), ChecksumAlgorithm::SHA256);
    EXPECT_FALSE(ChecksumCalculator::algorithmFromDigestLength(7).has_value());
}

TEST(ChecksumHexTest, NormalizeAndCompare) {
    EXPECT_EQ(ChecksumCalculator::normalizeHex(" 3610A686 "), "3610a686");
    EXPECT_THROW(ChecksumCalculator::normalizeHex("36zz"), std::invalid_argument);
    EXPECT_TRUE(ChecksumCalculator::digestsEqual("3610A686", "3610a686"));
    EXPECT_FALSE(ChecksumCalculator::digestsEqual("3610a686", "3610a687"));
    EXPECT_FALSE(ChecksumCalculator::digestsEqual("3610a686", "3610a6"));

    const unsigned char bytes[] = {0x01, 0xFF};
    EXPECT_EQ(ChecksumCalculator::toHex(bytes, sizeof(bytes)), "01ff");
}
