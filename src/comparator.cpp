#include "comparator.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "thread_pool.hpp"

#include <algorithm>
#include <system_error>
#include <tuple>
#include <fmt/core.h>

namespace fs = std::filesystem;

namespace
{
    std::optional<Difference> compareContent(const fs::path &fileA, const fs::path &fileB,
                                             const std::optional<std::uintmax_t> &sizeA,
                                             const std::optional<std::uintmax_t> &sizeB,
                                             const ComparisonOptions &options)
    {
        if (options.mode == ComparisonMode::Quick && sizeA && sizeB && *sizeA != *sizeB)
        {
            return Difference{Difference::Kind::ContentDiffers, "",
                              fmt::format("size differs ({} vs {} bytes)", *sizeA, *sizeB)};
        }

        const auto algorithm = PathComparator::referenceAlgorithm(options);
        std::string digestA;
        std::string digestB;
        std::optional<ChecksumError> errorA;
        std::optional<ChecksumError> errorB;
        try
        {
            digestA = ChecksumCalculator::compute(fileA, algorithm, options.chunkSize);
        }
        catch (const ChecksumError &e)
        {
            errorA = e;
        }
        try
        {
            digestB = ChecksumCalculator::compute(fileB, algorithm, options.chunkSize);
        }
        catch (const ChecksumError &e)
        {
            errorB = e;
        }

        if (errorA && errorB && errorA->kind() == errorB->kind() && errorA->cause() == errorB->cause())
        {
            // Both sides fail the same way: equal as far as content can tell
            LogRegistry::tasks()->warn("Cannot read either side ({}): {}", errorA->path(), errorA->cause());
            return std::nullopt;
        }
        if (errorA || errorB)
        {
            const auto &error = errorA ? *errorA : *errorB;
            LogRegistry::tasks()->error("Error comparing files: {}", error.what());
            return Difference{Difference::Kind::Unreadable, "", fmt::format("{}: {}", error.path(), error.cause())};
        }

        LogRegistry::tasks()->debug("{} {} / {}", ChecksumCalculator::algorithmName(algorithm), digestA, digestB);
        if (digestA == digestB)
        {
            return std::nullopt;
        }
        return Difference{Difference::Kind::ContentDiffers, "", "content differs"};
    }

    std::optional<std::uintmax_t> sizeOf(const fs::path &file)
    {
        std::error_code ec;
        const auto size = fs::file_size(file, ec);
        if (ec)
        {
            return std::nullopt;
        }
        return size;
    }
}

std::vector<std::string> ComparisonResult::paths(Difference::Kind kind) const
{
    std::vector<std::string> out;
    for (const auto &difference : differences)
    {
        if (difference.kind == kind)
        {
            out.push_back(difference.path);
        }
    }
    return out;
}

ComparisonResult PathComparator::compare(const fs::path &pathA,
                                         const fs::path &pathB,
                                         const ComparisonOptions &options,
                                         ProgressCallback progress,
                                         CancellationToken cancel)
{
    const auto algorithm = referenceAlgorithm(options);
    ChecksumCalculator::requireSupported(algorithm);

    for (const auto &path : {pathA, pathB})
    {
        std::error_code ec;
        if (!fs::exists(path, ec))
        {
            throw ChecksumError(ChecksumError::Kind::IOError, path.string(), "Path does not exist", "compare");
        }
    }

    LogRegistry::tasks()->info("Comparing {} and {} using {}", pathA.string(), pathB.string(),
                               ChecksumCalculator::algorithmName(algorithm));

    std::error_code ec;
    const bool dirA = fs::is_directory(pathA, ec);
    const bool dirB = fs::is_directory(pathB, ec);

    ComparisonResult result;
    if (fs::equivalent(pathA, pathB, ec) && !ec)
    {
        result.filesCompared = dirA ? listFiles(pathA).size() : 1;
        LogRegistry::tasks()->info("{} and {} are the same path", pathA.string(), pathB.string());
        return result;
    }
    ec.clear();

    if (dirA != dirB)
    {
        LogRegistry::tasks()->warn("Comparison paths mismatch: one is file, other is directory");
        result.verdict = ComparisonVerdict::TypeMismatch;
        return result;
    }

    if (!dirA)
    {
        ProgressTracker tracker(1, std::move(progress));
        if (cancel.isCancelled())
        {
            throw ChecksumError(ChecksumError::Kind::Cancelled, pathA.string(), "Comparison cancelled", "compare");
        }
        auto difference = compareContent(pathA, pathB, sizeOf(pathA), sizeOf(pathB), options);
        tracker.advance(pathA.string());
        result.filesCompared = 1;
        if (difference)
        {
            result.differences.push_back(std::move(*difference));
            result.verdict = ComparisonVerdict::Different;
        }
        return result;
    }

    const auto filesA = listFiles(pathA);
    const auto filesB = listFiles(pathB);

    // Merge both key sets; std::map keeps keys sorted
    std::vector<std::string> common;
    std::size_t unionSize = filesA.size();
    for (const auto &[key, size] : filesA)
    {
        if (filesB.count(key) != 0)
        {
            common.push_back(key);
        }
        else
        {
            result.differences.push_back({Difference::Kind::OnlyInA, key, fmt::format("only in {}", pathA.string())});
        }
    }
    for (const auto &[key, size] : filesB)
    {
        if (filesA.count(key) == 0)
        {
            ++unionSize;
            result.differences.push_back({Difference::Kind::OnlyInB, key, fmt::format("only in {}", pathB.string())});
        }
    }

    ProgressTracker tracker(unionSize, std::move(progress));
    for (const auto &difference : result.differences)
    {
        tracker.advance(difference.path);
    }

    std::vector<std::optional<Difference>> outcomes(common.size());
    {
        ThreadPool pool(std::min<unsigned int>(options.threads == 0 ? ThreadPool::defaultSize() : options.threads,
                                               static_cast<unsigned int>(std::max<std::size_t>(common.size(), 1))));
        for (std::size_t i = 0; i < common.size(); ++i)
        {
            pool.submit([&, i] {
                if (cancel.isCancelled())
                {
                    return;
                }
                const auto &key = common[i];
                outcomes[i] = compareContent(pathA / fs::path(key), pathB / fs::path(key),
                                             filesA.at(key), filesB.at(key), options);
                if (outcomes[i])
                {
                    outcomes[i]->path = key;
                }
                tracker.advance(key);
            });
        }
        pool.wait();
    }

    if (cancel.isCancelled())
    {
        throw ChecksumError(ChecksumError::Kind::Cancelled, pathA.string(), "Comparison cancelled", "compare");
    }

    for (auto &outcome : outcomes)
    {
        if (outcome)
        {
            result.differences.push_back(std::move(*outcome));
        }
    }

    std::sort(result.differences.begin(), result.differences.end(), [](const Difference &a, const Difference &b) {
        return std::tie(a.path, a.kind) < std::tie(b.path, b.kind);
    });

    result.filesCompared = common.size();
    result.verdict = result.differences.empty() ? ComparisonVerdict::Identical : ComparisonVerdict::Different;
    LogRegistry::tasks()->info("Comparison finished: {} ({} differences, {} files compared)",
                               verdictName(result.verdict), result.differences.size(), result.filesCompared);
    return result;
}

ChecksumAlgorithm PathComparator::referenceAlgorithm(const ComparisonOptions &options)
{
    if (options.algorithm)
    {
        return *options.algorithm;
    }
    return options.mode == ComparisonMode::Quick ? ChecksumAlgorithm::CRC32 : ChecksumAlgorithm::SHA1;
}

std::map<std::string, std::optional<std::uintmax_t>> PathComparator::listFiles(const fs::path &root)
{
    std::map<std::string, std::optional<std::uintmax_t>> files;
    std::error_code ec;

    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec)
    {
        throw ChecksumError(ChecksumError::Kind::IOError, root.string(),
                            fmt::format("Cannot list directory: {}", ec.message()), "compare");
    }

    const fs::recursive_directory_iterator end;
    while (it != end)
    {
        std::error_code typeEc;
        if (!it->is_directory(typeEc))
        {
            const auto relative = it->path().lexically_relative(root).generic_string();
            files.emplace(relative, sizeOf(it->path()));
        }
        it.increment(ec);
        if (ec)
        {
            throw ChecksumError(ChecksumError::Kind::IOError, root.string(),
                                fmt::format("Cannot list directory: {}", ec.message()), "compare");
        }
    }
    return files;
}

const char *PathComparator::verdictName(ComparisonVerdict verdict)
{
    switch (verdict)
    {
    case ComparisonVerdict::Identical:
        return "IDENTICAL";
    case ComparisonVerdict::Different:
        return "DIFFERENT";
    case ComparisonVerdict::TypeMismatch:
        return "TYPE_MISMATCH";
    }
    return "UNKNOWN";
}

const char *PathComparator::kindName(Difference::Kind kind)
{
    switch (kind)
    {
    case Difference::Kind::OnlyInA:
        return "only in A";
    case Difference::Kind::OnlyInB:
        return "only in B";
    case Difference::Kind::ContentDiffers:
        return "content differs";
    case Difference::Kind::Unreadable:
        return "unreadable";
    }
    return "unknown";
}
