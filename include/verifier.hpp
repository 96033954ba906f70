#pragma once

#include "errors.hpp"
#include "manifest.hpp"
#include "progress.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

/**
 * QUICK rejects an entry whose recorded size differs from the file on disk
 * without reading it; FULL always computes the digest.
 */
enum class VerificationMode
{
    Quick,
    Full
};

/**
 * Terminal classification of one manifest entry.
 */
enum class EntryStatus
{
    Ok,       // Recomputed digest equals the recorded one
    Mismatch, // File exists, digest (or recorded size) differs
    Missing,  // File does not exist or is not a regular file
    Error     // File exists but could not be read
};

struct VerificationOptions
{
    VerificationMode mode = VerificationMode::Full;
    unsigned int threads = 0; // 0 = hardware concurrency
    std::size_t chunkSize = ChecksumCalculator::DEFAULT_CHUNK_SIZE;
};

struct VerificationItem
{
    FileEntry entry;
    std::filesystem::path resolvedPath;
    EntryStatus status = EntryStatus::Missing;
    std::string actualDigest; // Empty unless the file was digested
    std::string error;        // Cause for Error and Missing
};

/**
 * Outcome of verifying a manifest. Items keep manifest order.
 */
struct VerificationResult
{
    std::vector<VerificationItem> items;
    std::vector<MalformedLine> warnings; // Lines skipped while parsing

    std::size_t count(EntryStatus status) const;
    bool allOk() const;
};

class ManifestVerifier
{
public:
    /**
     * Recompute every entry of an in-memory manifest.
     * Entries are digested concurrently; the result does not depend on the pool size.
     *
     * @throws ChecksumError UnsupportedAlgorithm if the manifest's algorithm is unavailable,
     *         Cancelled if the token fires before all entries are classified
     */
    static VerificationResult verify(const Manifest &manifest,
                                     const VerificationOptions &options = {},
                                     ProgressCallback progress = {},
                                     CancellationToken cancel = {});

    /**
     * Load a manifest file and verify it.
     * Malformed lines are carried into the result as warnings.
     *
     * @throws ChecksumError IOError if the manifest cannot be read,
     *         MalformedManifest if it has malformed lines and no valid entry
     */
    static VerificationResult verifyFile(const std::filesystem::path &manifestFile,
                                         const ParseOptions &parseOptions = {},
                                         const VerificationOptions &options = {},
                                         ProgressCallback progress = {},
                                         CancellationToken cancel = {});

    /**
     * Classify a single entry. Never throws for per-file problems.
     */
    static VerificationItem verifyEntry(const Manifest &manifest,
                                        const FileEntry &entry,
                                        const VerificationOptions &options);

    static const char *statusName(EntryStatus status);
};
