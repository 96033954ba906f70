#pragma once

#include "checksum.hpp"
#include "progress.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

/**
 * QUICK short-circuits on a size difference and hashes with CRC32;
 * FULL always hashes, with SHA-1.
 */
enum class ComparisonMode
{
    Quick,
    Full
};

enum class ComparisonVerdict
{
    Identical,
    Different,
    TypeMismatch // One path is a file, the other a directory
};

struct Difference
{
    enum class Kind
    {
        OnlyInA,
        OnlyInB,
        ContentDiffers,
        Unreadable // Present on both sides but could not be digested
    };

    Kind kind = Kind::ContentDiffers;
    std::string path; // Relative to the compared roots; empty for a file-vs-file comparison
    std::string detail;
};

struct ComparisonOptions
{
    ComparisonMode mode = ComparisonMode::Quick;
    std::optional<ChecksumAlgorithm> algorithm; // Overrides the mode's reference algorithm
    unsigned int threads = 0;
    std::size_t chunkSize = ChecksumCalculator::DEFAULT_CHUNK_SIZE;
};

struct ComparisonResult
{
    ComparisonVerdict verdict = ComparisonVerdict::Identical;
    std::vector<Difference> differences; // Sorted by path
    std::size_t filesCompared = 0;       // Pairs present on both sides

    std::vector<std::string> paths(Difference::Kind kind) const;
};

/**
 * Equality of two files or two directory trees.
 * Directories are compared over their full recursive file content; listing
 * order and empty directories play no part.
 */
class PathComparator
{
public:
    /**
     * @throws ChecksumError IOError if either path does not exist,
     *         UnsupportedAlgorithm, Cancelled
     */
    static ComparisonResult compare(const std::filesystem::path &pathA,
                                    const std::filesystem::path &pathB,
                                    const ComparisonOptions &options = {},
                                    ProgressCallback progress = {},
                                    CancellationToken cancel = {});

    static ChecksumAlgorithm referenceAlgorithm(const ComparisonOptions &options);

    /**
     * Every non-directory entry under root, keyed by generic relative path.
     * The size is empty when it cannot be read (e.g. a dangling symlink).
     */
    static std::map<std::string, std::optional<std::uintmax_t>> listFiles(const std::filesystem::path &root);

    static const char *verdictName(ComparisonVerdict verdict);
    static const char *kindName(Difference::Kind kind);
};
