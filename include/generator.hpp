#pragma once

#include "errors.hpp"
#include "manifest.hpp"
#include "progress.hpp"
#include "verifier.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

struct GenerationOptions
{
    std::vector<std::string> excludeExtensions; // ".tmp" or "tmp", case-insensitive
    // Manifest file names to leave out of the walk, together with their
    // "<stem>_<n><ext>" and "<name>.<timestamp>.bak" variants
    std::vector<std::string> manifestNames{"checksum.sfv"};
    std::string delimiter = " ";
    std::string commentMarker = ";";
    std::optional<std::filesystem::path> baseDirectory; // Common parent of the inputs if unset
    unsigned int threads = 0;                           // 0 = hardware concurrency
    std::size_t chunkSize = ChecksumCalculator::DEFAULT_CHUNK_SIZE;
    bool annotateErrors = true; // Also record failed files as manifest comments
    bool verifyAfterGenerate = false;
    VerificationMode verifyMode = VerificationMode::Full;
};

struct GenerationResult
{
    Manifest manifest;
    std::vector<EntryError> errors;                  // Files that could not be digested
    std::size_t excludedCount = 0;                   // Files dropped by the extension filter
    std::optional<VerificationResult> verification; // Set in verify-after-generate mode
};

/**
 * Builds a manifest from files and directory trees.
 */
class ManifestGenerator
{
public:
    /**
     * Digest every input file and collect the entries.
     *
     * Directories are walked recursively. The file list is sorted so the
     * manifest is identical across runs on an unchanged file set. A file that
     * cannot be read is reported in errors and left out of the manifest body.
     *
     * @throws ChecksumError UnsupportedAlgorithm before any file is read,
     *         Cancelled if the token fires
     */
    static GenerationResult generate(const std::vector<std::filesystem::path> &inputs,
                                     ChecksumAlgorithm algorithm,
                                     const GenerationOptions &options = {},
                                     ProgressCallback progress = {},
                                     CancellationToken cancel = {});

    /**
     * Expand directories into their files, sorted and de-duplicated.
     * Inputs that do not exist are reported in errors.
     */
    static std::vector<std::filesystem::path> expandInputs(const std::vector<std::filesystem::path> &inputs,
                                                           std::vector<EntryError> &errors);

    static bool isExcluded(const std::filesystem::path &file, const std::vector<std::string> &extensions);

    /**
     * True if the file is one of the named manifests, a unique-name copy of
     * one, or a backup of one.
     */
    static bool isManifestFile(const std::filesystem::path &file, const std::vector<std::string> &manifestNames);

    /**
     * Deepest directory containing every file.
     */
    static std::filesystem::path commonBaseDirectory(const std::vector<std::filesystem::path> &files);
};
