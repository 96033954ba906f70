#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

/**
 * Digest functions known to the engine.
 * CRC32 is served by zlib, everything else by OpenSSL's EVP interface.
 */
enum class ChecksumAlgorithm
{
    CRC32,
    MD5,
    SHA1,
    SHA224,
    SHA256,
    SHA384,
    SHA512,
    SHA3_224,
    SHA3_256,
    SHA3_384,
    SHA3_512,
    BLAKE2b512,
    BLAKE2s256
};

/**
 * Incremental digest state for one stream.
 * Never shared between threads: every file gets its own instance.
 */
class Hasher
{
public:
    virtual ~Hasher() = default;

    virtual void update(const char *data, std::size_t length) = 0;

    /**
     * Finish the digest and return it as lowercase hex.
     * The hasher must not be updated afterwards.
     */
    virtual std::string finish() = 0;
};

/**
 * Streams files through a registered digest function.
 */
class ChecksumCalculator
{
public:
    // Chunk size for file reading (1 MB)
    static constexpr std::size_t DEFAULT_CHUNK_SIZE = 1024 * 1024;
    static constexpr std::size_t MIN_CHUNK_SIZE = 4 * 1024;

    /**
     * Compute the digest of a file.
     * Reads the file in chunks so memory use does not depend on file size.
     *
     * @param filePath Path to file to hash
     * @param algorithm Digest function to apply
     * @param chunkSize Bytes read per update (clamped to MIN_CHUNK_SIZE)
     * @return Lowercase hex digest (8 characters for CRC32)
     * @throws ChecksumError IOError if the file cannot be opened or read,
     *         UnsupportedAlgorithm if the algorithm is unavailable
     */
    static std::string compute(const std::filesystem::path &filePath,
                               ChecksumAlgorithm algorithm,
                               std::size_t chunkSize = DEFAULT_CHUNK_SIZE);

    /**
     * Registry lookup: create a fresh hasher for an algorithm.
     * @throws ChecksumError UnsupportedAlgorithm
     */
    static std::unique_ptr<Hasher> createHasher(ChecksumAlgorithm algorithm);

    /**
     * True if the linked crypto library can actually provide the algorithm.
     */
    static bool isSupported(ChecksumAlgorithm algorithm);

    /**
     * Fail fast before any work is scheduled.
     * @throws ChecksumError UnsupportedAlgorithm
     */
    static void requireSupported(ChecksumAlgorithm algorithm);

    static const std::vector<ChecksumAlgorithm> &allAlgorithms();

    /**
     * Canonical display name, e.g. "SHA256" or "SHA3-256".
     */
    static std::string algorithmName(ChecksumAlgorithm algorithm);

    /**
     * Parse an algorithm name case-insensitively.
     * Accepts "sha256", "SHA-256", "sha3_256", "blake2b" and similar spellings.
     */
    static std::optional<ChecksumAlgorithm> parseAlgorithm(const std::string &name);

    /**
     * Like parseAlgorithm but throws ChecksumError UnsupportedAlgorithm.
     */
    static ChecksumAlgorithm requireAlgorithm(const std::string &name);

    /**
     * Number of hex characters a digest of this algorithm has.
     */
    static std::size_t digestLength(ChecksumAlgorithm algorithm);

    /**
     * Guess the algorithm from a digest's hex length (8 => CRC32, 32 => MD5,
     * 40 => SHA-1, 56/64/96/128 => SHA-2 family).
     */
    static std::optional<ChecksumAlgorithm> algorithmFromDigestLength(std::size_t length);

    /**
     * Convert hex string to lowercase and remove whitespace.
     * Makes comparison case-insensitive.
     * @throws std::invalid_argument on a non-hex character
     */
    static std::string normalizeHex(const std::string &hex);

    static bool isHex(const std::string &text);

    /**
     * Case-insensitive digest comparison.
     */
    static bool digestsEqual(const std::string &lhs, const std::string &rhs);

    /**
     * Convert binary data to hex string.
     * Example: {0x01, 0xFF} -> "01ff"
     */
    static std::string toHex(const unsigned char *data, std::size_t length);
};
