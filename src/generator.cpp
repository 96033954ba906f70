#include "generator.hpp"
#include "logging.hpp"
#include "thread_pool.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>
#include <fmt/core.h>

namespace fs = std::filesystem;

namespace
{
    bool allOf(const std::string &text, const char *allowed)
    {
        return !text.empty() && text.find_first_not_of(allowed) == std::string::npos;
    }

    bool startsWith(const std::string &text, const std::string &prefix)
    {
        return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
    }

    bool endsWith(const std::string &text, const std::string &suffix)
    {
        return text.size() >= suffix.size() &&
               text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
    }

    std::string lower(std::string text)
    {
        std::transform(text.begin(), text.end(), text.begin(),
                       [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
        return text;
    }

    // True if every component of prefix starts path
    bool hasPrefix(const fs::path &path, const fs::path &prefix)
    {
        auto it = path.begin();
        for (const auto &component : prefix)
        {
            if (it == path.end() || *it != component)
            {
                return false;
            }
            ++it;
        }
        return true;
    }

    fs::path normalizedAbsolute(const fs::path &path)
    {
        std::error_code ec;
        auto absolute = fs::absolute(path, ec);
        return (ec ? path : absolute).lexically_normal();
    }

    struct Slot
    {
        std::optional<FileEntry> entry;
        std::optional<EntryError> error;
    };
}

GenerationResult ManifestGenerator::generate(const std::vector<fs::path> &inputs,
                                             ChecksumAlgorithm algorithm,
                                             const GenerationOptions &options,
                                             ProgressCallback progress,
                                             CancellationToken cancel)
{
    ChecksumCalculator::requireSupported(algorithm);

    GenerationResult result;
    const auto expanded = expandInputs(inputs, result.errors);

    std::vector<fs::path> files;
    files.reserve(expanded.size());
    for (const auto &file : expanded)
    {
        if (isManifestFile(file, options.manifestNames))
        {
            LogRegistry::tasks()->debug("Skipping manifest file {}", file.string());
            continue;
        }
        if (isExcluded(file, options.excludeExtensions))
        {
            ++result.excludedCount;
            continue;
        }
        files.push_back(file);
    }
    if (result.excludedCount > 0)
    {
        LogRegistry::tasks()->info("Excluded {} files based on extension filter", result.excludedCount);
    }

    auto &manifest = result.manifest;
    manifest.algorithm = algorithm;
    manifest.delimiter = options.delimiter;
    manifest.commentMarker = options.commentMarker;
    manifest.baseDirectory = options.baseDirectory ? normalizedAbsolute(*options.baseDirectory)
                                                   : commonBaseDirectory(files);

    LogRegistry::tasks()->info("Generating {} manifest for {} files under {}",
                               ChecksumCalculator::algorithmName(algorithm), files.size(),
                               manifest.baseDirectory.string());

    const auto total = options.verifyAfterGenerate ? files.size() * 2 : files.size();
    ProgressTracker tracker(total, std::move(progress));
    std::vector<Slot> slots(files.size());

    {
        ThreadPool pool(std::min<unsigned int>(options.threads == 0 ? ThreadPool::defaultSize() : options.threads,
                                               static_cast<unsigned int>(std::max<std::size_t>(files.size(), 1))));
        for (std::size_t i = 0; i < files.size(); ++i)
        {
            pool.submit([&, i] {
                if (cancel.isCancelled())
                {
                    return;
                }

                const auto &file = files[i];
                try
                {
                    FileEntry entry;
                    entry.path = file.generic_string();
                    entry.algorithm = algorithm;
                    std::error_code ec;
                    const auto size = fs::file_size(file, ec);
                    if (!ec)
                    {
                        entry.size = size;
                    }
                    entry.digest = ChecksumCalculator::compute(file, algorithm, options.chunkSize);
                    slots[i].entry = std::move(entry);
                }
                catch (const ChecksumError &e)
                {
                    LogRegistry::tasks()->error("Error processing {}: {}", file.string(), e.cause());
                    slots[i].error = EntryError{file.string(), e.cause(), "generate"};
                }
                catch (const std::exception &e)
                {
                    LogRegistry::tasks()->error("Error processing {}: {}", file.string(), e.what());
                    slots[i].error = EntryError{file.string(), e.what(), "generate"};
                }
                tracker.advance(file.string());
            });
        }
        pool.wait();
    }

    if (cancel.isCancelled())
    {
        throw ChecksumError(ChecksumError::Kind::Cancelled, manifest.baseDirectory.string(),
                            "Generation cancelled", "generate");
    }

    if (options.annotateErrors)
    {
        for (const auto &error : result.errors)
        {
            manifest.addComment(fmt::format("Error processing {}: {}", fs::path(error.path).filename().string(),
                                            error.cause));
        }
    }

    for (auto &slot : slots)
    {
        if (slot.entry)
        {
            manifest.addEntry(std::move(*slot.entry));
        }
        else if (slot.error)
        {
            if (options.annotateErrors)
            {
                manifest.addComment(fmt::format("Error processing {}: {}",
                                                fs::path(slot.error->path).filename().string(),
                                                slot.error->cause));
            }
            result.errors.push_back(std::move(*slot.error));
        }
    }

    LogRegistry::tasks()->info("Generated {} entries, {} errors", manifest.entryCount(), result.errors.size());

    if (options.verifyAfterGenerate)
    {
        VerificationOptions verifyOptions;
        verifyOptions.mode = options.verifyMode;
        verifyOptions.threads = options.threads;
        verifyOptions.chunkSize = options.chunkSize;

        result.verification = ManifestVerifier::verify(
            manifest, verifyOptions,
            [&tracker](const TaskProgress &step) { tracker.advance(step.currentPath); },
            cancel);
    }

    return result;
}

std::vector<fs::path> ManifestGenerator::expandInputs(const std::vector<fs::path> &inputs,
                                                      std::vector<EntryError> &errors)
{
    std::vector<fs::path> files;

    for (const auto &input : inputs)
    {
        const auto path = normalizedAbsolute(input);
        std::error_code ec;

        if (fs::is_directory(path, ec))
        {
            fs::recursive_directory_iterator it(path, fs::directory_options::skip_permission_denied, ec);
            if (ec)
            {
                errors.push_back({path.string(), ec.message(), "generate"});
                continue;
            }
            const fs::recursive_directory_iterator end;
            while (it != end)
            {
                std::error_code typeEc;
                if (it->is_regular_file(typeEc))
                {
                    files.push_back(it->path().lexically_normal());
                }
                it.increment(ec);
                if (ec)
                {
                    errors.push_back({path.string(), ec.message(), "generate"});
                    break;
                }
            }
        }
        else if (fs::is_regular_file(path, ec))
        {
            files.push_back(path);
        }
        else if (fs::exists(path, ec))
        {
            errors.push_back({path.string(), "Path is not a file", "generate"});
        }
        else
        {
            LogRegistry::tasks()->warn("File not found: {}", path.string());
            errors.push_back({path.string(), "File not found", "generate"});
        }
    }

    std::sort(files.begin(), files.end(), [](const fs::path &a, const fs::path &b) {
        return a.generic_string() < b.generic_string();
    });
    files.erase(std::unique(files.begin(), files.end()), files.end());
    return files;
}

bool ManifestGenerator::isExcluded(const fs::path &file, const std::vector<std::string> &extensions)
{
    if (extensions.empty())
    {
        return false;
    }

    const auto name = lower(file.filename().string());
    for (auto extension : extensions)
    {
        if (extension.empty())
        {
            continue;
        }
        if (extension.front() != '.')
        {
            extension.insert(extension.begin(), '.');
        }
        extension = lower(extension);
        if (name.size() >= extension.size() &&
            name.compare(name.size() - extension.size(), extension.size(), extension) == 0)
        {
            return true;
        }
    }
    return false;
}

bool ManifestGenerator::isManifestFile(const fs::path &file, const std::vector<std::string> &manifestNames)
{
    const auto name = file.filename().string();
    for (const auto &manifestName : manifestNames)
    {
        if (manifestName.empty())
        {
            continue;
        }
        if (name == manifestName)
        {
            return true;
        }

        // <stem>_<n><ext>
        const fs::path manifestPath(manifestName);
        const auto stem = manifestPath.stem().string() + "_";
        const auto extension = manifestPath.extension().string();
        if (startsWith(name, stem) && endsWith(name, extension) &&
            name.size() > stem.size() + extension.size() &&
            allOf(name.substr(stem.size(), name.size() - stem.size() - extension.size()), "0123456789"))
        {
            return true;
        }

        // <name>.<YYYYmmddHHMMSS>[_<n>].bak
        const auto backupPrefix = manifestName + ".";
        const std::string backupSuffix = ".bak";
        if (startsWith(name, backupPrefix) && endsWith(name, backupSuffix) &&
            name.size() > backupPrefix.size() + backupSuffix.size() &&
            allOf(name.substr(backupPrefix.size(), name.size() - backupPrefix.size() - backupSuffix.size()),
                  "0123456789_"))
        {
            return true;
        }
    }
    return false;
}

fs::path ManifestGenerator::commonBaseDirectory(const std::vector<fs::path> &files)
{
    if (files.empty())
    {
        std::error_code ec;
        auto cwd = fs::current_path(ec);
        return ec ? fs::path() : cwd;
    }

    auto base = normalizedAbsolute(files.front()).parent_path();
    for (const auto &file : files)
    {
        const auto directory = normalizedAbsolute(file).parent_path();
        while (!hasPrefix(directory, base) && base.has_relative_path())
        {
            base = base.parent_path();
        }
    }
    return base;
}
