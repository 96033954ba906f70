#include "verifier.hpp"
#include "logging.hpp"
#include "thread_pool.hpp"

#include <algorithm>
#include <system_error>
#include <fmt/core.h>

namespace fs = std::filesystem;

std::size_t VerificationResult::count(EntryStatus status) const
{
    return static_cast<std::size_t>(std::count_if(items.begin(), items.end(),
                                                  [status](const VerificationItem &item) { return item.status == status; }));
}

bool VerificationResult::allOk() const
{
    return count(EntryStatus::Ok) == items.size();
}

VerificationResult ManifestVerifier::verify(const Manifest &manifest,
                                            const VerificationOptions &options,
                                            ProgressCallback progress,
                                            CancellationToken cancel)
{
    ChecksumCalculator::requireSupported(manifest.algorithm);

    const auto entries = manifest.entries();
    LogRegistry::tasks()->info("Verifying {} entries with {} ({} mode)",
                               entries.size(), ChecksumCalculator::algorithmName(manifest.algorithm),
                               options.mode == VerificationMode::Quick ? "quick" : "full");

    VerificationResult result;
    result.items.resize(entries.size());
    ProgressTracker tracker(entries.size(), std::move(progress));

    {
        ThreadPool pool(std::min<unsigned int>(options.threads == 0 ? ThreadPool::defaultSize() : options.threads,
                                               static_cast<unsigned int>(std::max<std::size_t>(entries.size(), 1))));
        for (std::size_t i = 0; i < entries.size(); ++i)
        {
            pool.submit([&, i] {
                // Checked between files only, never inside a read
                if (cancel.isCancelled())
                {
                    return;
                }
                result.items[i] = verifyEntry(manifest, entries[i], options);
                tracker.advance(entries[i].path);
            });
        }
        pool.wait();
    }

    if (cancel.isCancelled())
    {
        LogRegistry::tasks()->info("Verification cancelled after {} of {} entries",
                                   tracker.snapshot().processed, entries.size());
        throw ChecksumError(ChecksumError::Kind::Cancelled, manifest.baseDirectory.string(),
                            "Verification cancelled", "verify");
    }

    LogRegistry::tasks()->info("Verification finished: {} OK, {} mismatched, {} missing, {} errors",
                               result.count(EntryStatus::Ok), result.count(EntryStatus::Mismatch),
                               result.count(EntryStatus::Missing), result.count(EntryStatus::Error));
    return result;
}

VerificationResult ManifestVerifier::verifyFile(const fs::path &manifestFile,
                                                const ParseOptions &parseOptions,
                                                const VerificationOptions &options,
                                                ProgressCallback progress,
                                                CancellationToken cancel)
{
    auto parsed = ManifestCodec::load(manifestFile, parseOptions);

    if (parsed.manifest.entryCount() == 0 && !parsed.warnings.empty())
    {
        throw ChecksumError(ChecksumError::Kind::MalformedManifest, manifestFile.string(),
                            fmt::format("No valid entries, {} malformed line(s); first at line {}: {}",
                                        parsed.warnings.size(), parsed.warnings.front().lineNumber,
                                        parsed.warnings.front().reason),
                            "parse");
    }

    auto result = verify(parsed.manifest, options, std::move(progress), std::move(cancel));
    result.warnings = std::move(parsed.warnings);
    return result;
}

VerificationItem ManifestVerifier::verifyEntry(const Manifest &manifest,
                                               const FileEntry &entry,
                                               const VerificationOptions &options)
{
    VerificationItem item;
    item.entry = entry;
    item.resolvedPath = ManifestCodec::resolvePath(manifest, entry);

    std::error_code ec;
    if (!fs::is_regular_file(item.resolvedPath, ec))
    {
        item.status = EntryStatus::Missing;
        item.error = ec ? ec.message() : "File not found";
        LogRegistry::tasks()->warn("File not found: {}", item.resolvedPath.string());
        return item;
    }

    if (options.mode == VerificationMode::Quick && entry.size)
    {
        const auto size = fs::file_size(item.resolvedPath, ec);
        if (!ec && size != *entry.size)
        {
            item.status = EntryStatus::Mismatch;
            item.error = fmt::format("size differs (expected {} bytes, got {})", *entry.size, size);
            return item;
        }
    }

    try
    {
        item.actualDigest = ChecksumCalculator::compute(item.resolvedPath, manifest.algorithm, options.chunkSize);
    }
    catch (const ChecksumError &e)
    {
        item.status = EntryStatus::Error;
        item.error = e.cause();
        LogRegistry::tasks()->error("Error verifying {}: {}", item.resolvedPath.string(), e.what());
        return item;
    }
    catch (const std::exception &e)
    {
        item.status = EntryStatus::Error;
        item.error = e.what();
        LogRegistry::tasks()->error("Error verifying {}: {}", item.resolvedPath.string(), e.what());
        return item;
    }

    LogRegistry::tasks()->debug("Expected {} got {} for {}", entry.digest, item.actualDigest, entry.path);
    item.status = ChecksumCalculator::digestsEqual(item.actualDigest, entry.digest) ? EntryStatus::Ok
                                                                                    : EntryStatus::Mismatch;
    return item;
}

const char *ManifestVerifier::statusName(EntryStatus status)
{
    switch (status)
    {
    case EntryStatus::Ok:
        return "OK";
    case EntryStatus::Mismatch:
        return "MISMATCH";
    case EntryStatus::Missing:
        return "MISSING";
    case EntryStatus::Error:
        return "ERROR";
    }
    return "UNKNOWN";
}
