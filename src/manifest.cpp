#include "manifest.hpp"
#include "errors.hpp"
#include "logging.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>
#include <fmt/chrono.h>
#include <fmt/core.h>

namespace fs = std::filesystem;

namespace
{
    bool isBlank(char ch)
    {
        return ch == ' ' || ch == '\t';
    }

    std::string trim(const std::string &text)
    {
        const auto first = text.find_first_not_of(" \t\r\n");
        if (first == std::string::npos)
        {
            return "";
        }
        const auto last = text.find_last_not_of(" \t\r\n");
        return text.substr(first, last - first + 1);
    }

    std::string rtrimBlank(const std::string &text)
    {
        auto end = text.size();
        while (end > 0 && isBlank(text[end - 1]))
        {
            --end;
        }
        return text.substr(0, end);
    }

    struct SplitLine
    {
        std::string path;
        std::string digest;
    };

    // Split on the last delimiter. The path is kept verbatim, blanks included,
    // so any path without a line break survives a serialize/parse cycle.
    // A single-space delimiter also accepts a tab before the digest.
    std::optional<SplitLine> splitEntry(const std::string &line, const std::string &delimiter)
    {
        std::size_t pos = std::string::npos;
        std::size_t width = delimiter.size();

        if (delimiter == " ")
        {
            for (std::size_t i = line.size(); i > 0; --i)
            {
                if (isBlank(line[i - 1]))
                {
                    pos = i - 1;
                    width = 1;
                    break;
                }
            }
        }
        else if (!delimiter.empty())
        {
            pos = line.rfind(delimiter);
        }

        if (pos == std::string::npos)
        {
            return std::nullopt;
        }

        SplitLine split;
        split.path = line.substr(0, pos);
        split.digest = trim(line.substr(pos + width));
        return split;
    }

    std::string readWholeFile(const fs::path &file)
    {
        std::ifstream in(file, std::ios::binary);
        if (!in)
        {
            throw ChecksumError(ChecksumError::Kind::IOError, file.string(),
                                "Cannot open manifest for reading", "load");
        }
        std::ostringstream buffer;
        buffer << in.rdbuf();
        if (in.bad())
        {
            throw ChecksumError(ChecksumError::Kind::IOError, file.string(),
                                "Read error while loading manifest", "load");
        }
        return buffer.str();
    }
}

void Manifest::addEntry(FileEntry entry)
{
    ManifestItem item;
    item.entry = std::move(entry);
    items.push_back(std::move(item));
}

void Manifest::addComment(const std::string &text)
{
    ManifestItem item;
    item.isComment = true;
    if (!commentMarker.empty() && trim(text).rfind(commentMarker, 0) == 0)
    {
        item.comment = text;
    }
    else
    {
        item.comment = fmt::format("{} {}", commentMarker, text);
    }
    items.push_back(std::move(item));
}

std::vector<FileEntry> Manifest::entries() const
{
    std::vector<FileEntry> out;
    out.reserve(items.size());
    for (const auto &item : items)
    {
        if (!item.isComment)
        {
            out.push_back(item.entry);
        }
    }
    return out;
}

std::size_t Manifest::entryCount() const
{
    return static_cast<std::size_t>(std::count_if(items.begin(), items.end(),
                                                  [](const ManifestItem &item) { return !item.isComment; }));
}

ParseResult ManifestCodec::parse(const std::string &text, const ParseOptions &options)
{
    ParseResult result;
    auto &manifest = result.manifest;
    manifest.delimiter = options.delimiter;
    manifest.commentMarker = options.commentMarker;
    manifest.baseDirectory = options.baseDirectory;

    std::optional<ChecksumAlgorithm> algorithm = options.algorithm;

    std::istringstream stream(text);
    std::string line;
    std::size_t lineNumber = 0;
    while (std::getline(stream, line))
    {
        ++lineNumber;
        if (!line.empty() && line.back() == '\r')
        {
            line.pop_back();
        }

        const auto trimmed = trim(line);
        if (trimmed.empty())
        {
            continue;
        }

        if (!options.commentMarker.empty() && trimmed.rfind(options.commentMarker, 0) == 0)
        {
            ManifestItem item;
            item.isComment = true;
            item.comment = line;
            manifest.items.push_back(std::move(item));
            continue;
        }

        auto split = splitEntry(rtrimBlank(line), options.delimiter);
        std::string reason;
        if (!split)
        {
            reason = "missing delimiter";
        }
        else if (trim(split->path).empty())
        {
            reason = "empty path";
        }
        else if (!ChecksumCalculator::isHex(split->digest))
        {
            reason = fmt::format("digest '{}' is not hexadecimal", split->digest);
        }

        if (!reason.empty())
        {
            LogRegistry::manifest()->warn("Malformed manifest line {}: {} ({})", lineNumber, trimmed, reason);
            result.warnings.push_back({lineNumber, line, reason});
            continue;
        }

        if (!algorithm)
        {
            // No algorithm from the caller: take the first digest's length as a hint
            algorithm = ChecksumCalculator::algorithmFromDigestLength(split->digest.size());
        }

        FileEntry entry;
        entry.path = split->path;
        entry.digest = ChecksumCalculator::normalizeHex(split->digest);
        manifest.addEntry(std::move(entry));
    }

    manifest.algorithm = algorithm.value_or(ChecksumAlgorithm::CRC32);
    for (auto &item : manifest.items)
    {
        item.entry.algorithm = manifest.algorithm;
    }

    return result;
}

std::string ManifestCodec::serialize(const Manifest &manifest, PathStyle style)
{
    std::string out;
    for (const auto &item : manifest.items)
    {
        if (item.isComment)
        {
            out += item.comment;
        }
        else
        {
            out += renderPath(manifest, item.entry, style);
            out += manifest.delimiter;
            out += item.entry.digest;
        }
        out += '\n';
    }
    return out;
}

std::string ManifestCodec::renderPath(const Manifest &manifest, const FileEntry &entry, PathStyle style)
{
    const fs::path path(entry.path);

    if (style == PathStyle::Relative)
    {
        if (manifest.baseDirectory.empty() || path.is_relative())
        {
            return path.generic_string();
        }
        const auto relative = path.lexically_normal().lexically_relative(manifest.baseDirectory.lexically_normal());
        if (relative.empty())
        {
            // Different root, nothing to be relative to
            return path.generic_string();
        }
        return relative.generic_string();
    }

    return fs::absolute(resolvePath(manifest, entry)).lexically_normal().generic_string();
}

fs::path ManifestCodec::resolvePath(const Manifest &manifest, const FileEntry &entry)
{
    const fs::path path(entry.path);
    if (path.is_absolute() || manifest.baseDirectory.empty())
    {
        return path;
    }
    return manifest.baseDirectory / path;
}

ParseResult ManifestCodec::load(const fs::path &file, ParseOptions options)
{
    const auto text = readWholeFile(file);

    std::error_code ec;
    auto absolute = fs::absolute(file, ec);
    if (ec)
    {
        absolute = file;
    }
    options.baseDirectory = absolute.parent_path();

    auto result = parse(text, options);
    LogRegistry::manifest()->debug("Loaded {} entries from {} ({} malformed)",
                                   result.manifest.entryCount(), file.string(), result.warnings.size());
    return result;
}

fs::path ManifestCodec::save(const Manifest &manifest, const fs::path &file, const SaveOptions &options)
{
    fs::path target = file;
    std::error_code ec;

    if (fs::exists(target, ec))
    {
        if (options.existing == ExistingFilePolicy::Backup)
        {
            const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
            fs::path backup = fmt::format("{}.{:%Y%m%d%H%M%S}.bak", target.string(), fmt::localtime(now));
            backup = uniqueFileName(backup);
            fs::rename(target, backup, ec);
            if (ec)
            {
                throw ChecksumError(ChecksumError::Kind::IOError, target.string(),
                                    fmt::format("Failed to back up existing manifest: {}", ec.message()),
                                    "save");
            }
            LogRegistry::manifest()->info("Backup of existing manifest created: {}", backup.string());
        }
        else if (options.existing == ExistingFilePolicy::UniqueName)
        {
            target = uniqueFileName(target);
        }
    }

    const auto parent = target.parent_path();
    if (!parent.empty())
    {
        fs::create_directories(parent, ec);
        if (ec)
        {
            throw ChecksumError(ChecksumError::Kind::IOError, parent.string(),
                                fmt::format("Cannot create directory: {}", ec.message()), "save");
        }
    }

    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out)
    {
        throw ChecksumError(ChecksumError::Kind::IOError, target.string(),
                            "Cannot open manifest for writing", "save");
    }
    out << serialize(manifest, options.pathStyle);
    out.flush();
    if (!out.good())
    {
        throw ChecksumError(ChecksumError::Kind::IOError, target.string(),
                            "Write error while saving manifest", "save");
    }

    LogRegistry::manifest()->info("Manifest saved at {}", target.string());
    return target;
}

std::string ManifestCodec::delimiterFromName(const std::string &name)
{
    std::string lower;
    std::transform(name.begin(), name.end(), std::back_inserter(lower),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });

    if (lower == "space" || name == " " || name.empty())
    {
        return " ";
    }
    if (lower == "tab" || name == "\t" || name == "\\t")
    {
        return "\t";
    }
    return name;
}

fs::path ManifestCodec::uniqueFileName(const fs::path &file)
{
    std::error_code ec;
    if (!fs::exists(file, ec))
    {
        return file;
    }

    const auto stem = file.stem().string();
    const auto extension = file.extension().string();
    for (int counter = 1;; ++counter)
    {
        auto candidate = file.parent_path() / fmt::format("{}_{}{}", stem, counter, extension);
        if (!fs::exists(candidate, ec))
        {
            return candidate;
        }
    }
}
