#pragma once

#include "checksum.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

/**
 * How entry paths are written when a manifest is rendered.
 */
enum class PathStyle
{
    Relative, // Relative to the manifest's base directory
    Absolute
};

/**
 * One path/digest pair.
 * The size is only known for entries produced by generation; it is a hint for
 * quick verification and takes no part in equality.
 */
struct FileEntry
{
    std::string path; // Generic form ('/' separators)
    std::string digest; // Lowercase hex
    ChecksumAlgorithm algorithm = ChecksumAlgorithm::CRC32;
    std::optional<std::uintmax_t> size;

    bool operator==(const FileEntry &other) const
    {
        return path == other.path && digest == other.digest && algorithm == other.algorithm;
    }
    bool operator!=(const FileEntry &other) const { return !(*this == other); }
};

/**
 * A manifest line: either an entry or a comment kept verbatim.
 */
struct ManifestItem
{
    bool isComment = false;
    std::string comment; // Full line including the marker
    FileEntry entry;

    bool operator==(const ManifestItem &other) const
    {
        return isComment == other.isComment &&
               (isComment ? comment == other.comment : entry == other.entry);
    }
    bool operator!=(const ManifestItem &other) const { return !(*this == other); }
};

/**
 * Ordered checksum list plus the settings needed to read or render it.
 */
struct Manifest
{
    ChecksumAlgorithm algorithm = ChecksumAlgorithm::CRC32;
    std::string delimiter = " ";
    std::string commentMarker = ";";
    std::filesystem::path baseDirectory; // Relative entries resolve against this
    std::vector<ManifestItem> items;

    void addEntry(FileEntry entry);

    /**
     * Append a comment. The marker is prepended when the text lacks it.
     */
    void addComment(const std::string &text);

    std::vector<FileEntry> entries() const;
    std::size_t entryCount() const;

    bool operator==(const Manifest &other) const
    {
        return algorithm == other.algorithm && items == other.items;
    }
    bool operator!=(const Manifest &other) const { return !(*this == other); }
};

/**
 * A line that could not be decoded into a path and digest.
 */
struct MalformedLine
{
    std::size_t lineNumber = 0; // 1-based
    std::string text;
    std::string reason;
};

struct ParseOptions
{
    std::string delimiter = " ";
    std::string commentMarker = ";";
    std::optional<ChecksumAlgorithm> algorithm; // Guessed from digest length if unset
    std::filesystem::path baseDirectory;
};

struct ParseResult
{
    Manifest manifest;
    std::vector<MalformedLine> warnings;
};

/**
 * What to do when saving over an existing manifest file.
 */
enum class ExistingFilePolicy
{
    Overwrite,
    Backup,    // Rename the old file to <name>.<timestamp>.bak
    UniqueName // Write to <stem>_<n><ext> instead
};

struct SaveOptions
{
    PathStyle pathStyle = PathStyle::Relative;
    ExistingFilePolicy existing = ExistingFilePolicy::UniqueName;
};

/**
 * Reads and writes the SFV checksum-list text format.
 *
 * Entry lines are "<path><delimiter><digest>" and are split on the last
 * occurrence of the delimiter, so paths may contain the delimiter. Lines
 * starting with the comment marker are kept as comments. A line that cannot be
 * split is reported as a MalformedLine and the rest of the text still parses.
 */
class ManifestCodec
{
public:
    static ParseResult parse(const std::string &text, const ParseOptions &options = {});

    /**
     * Render the manifest, one line per item, in insertion order.
     * The path style is applied here, not when entries are collected.
     */
    static std::string serialize(const Manifest &manifest, PathStyle style = PathStyle::Relative);

    static std::string renderPath(const Manifest &manifest, const FileEntry &entry, PathStyle style);

    /**
     * Absolute entries are returned as-is, relative ones joined to the base directory.
     */
    static std::filesystem::path resolvePath(const Manifest &manifest, const FileEntry &entry);

    /**
     * Read a manifest file. The base directory becomes the file's directory.
     * @throws ChecksumError IOError if the file cannot be read
     */
    static ParseResult load(const std::filesystem::path &file, ParseOptions options = {});

    /**
     * Write a manifest file.
     * @return The path actually written (differs from file under UniqueName)
     * @throws ChecksumError IOError on any write or rename failure
     */
    static std::filesystem::path save(const Manifest &manifest,
                                      const std::filesystem::path &file,
                                      const SaveOptions &options = {});

    /**
     * Map "space", "tab" (or the literal characters) to the delimiter string;
     * anything else is taken as a custom delimiter.
     */
    static std::string delimiterFromName(const std::string &name);

    static std::filesystem::path uniqueFileName(const std::filesystem::path &file);
};
