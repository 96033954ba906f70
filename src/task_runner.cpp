#include "task_runner.hpp"
#include "logging.hpp"

namespace fs = std::filesystem;

TaskHandle<GenerationResult> TaskRunner::submitGenerate(std::vector<fs::path> inputs,
                                                        ChecksumAlgorithm algorithm,
                                                        GenerationOptions options,
                                                        ProgressCallback progress)
{
    // Unsupported algorithms fail here, before a thread is started
    ChecksumCalculator::requireSupported(algorithm);
    LogRegistry::tasks()->debug("Submitting generation of {} input(s)", inputs.size());

    return submit<GenerationResult>(
        [inputs = std::move(inputs), algorithm, options = std::move(options)](
            const ProgressCallback &relay, const CancellationToken &token) {
            return ManifestGenerator::generate(inputs, algorithm, options, relay, token);
        },
        std::move(progress));
}

TaskHandle<VerificationResult> TaskRunner::submitVerify(Manifest manifest,
                                                        VerificationOptions options,
                                                        ProgressCallback progress)
{
    ChecksumCalculator::requireSupported(manifest.algorithm);
    LogRegistry::tasks()->debug("Submitting verification of {} entries", manifest.entryCount());

    return submit<VerificationResult>(
        [manifest = std::move(manifest), options](const ProgressCallback &relay, const CancellationToken &token) {
            return ManifestVerifier::verify(manifest, options, relay, token);
        },
        std::move(progress));
}

TaskHandle<VerificationResult> TaskRunner::submitVerifyFile(fs::path manifestFile,
                                                            ParseOptions parseOptions,
                                                            VerificationOptions options,
                                                            ProgressCallback progress)
{
    if (parseOptions.algorithm)
    {
        ChecksumCalculator::requireSupported(*parseOptions.algorithm);
    }
    LogRegistry::tasks()->debug("Submitting verification of {}", manifestFile.string());

    return submit<VerificationResult>(
        [manifestFile = std::move(manifestFile), parseOptions = std::move(parseOptions), options](
            const ProgressCallback &relay, const CancellationToken &token) {
            return ManifestVerifier::verifyFile(manifestFile, parseOptions, options, relay, token);
        },
        std::move(progress));
}

TaskHandle<ComparisonResult> TaskRunner::submitCompare(fs::path pathA,
                                                       fs::path pathB,
                                                       ComparisonOptions options,
                                                       ProgressCallback progress)
{
    ChecksumCalculator::requireSupported(PathComparator::referenceAlgorithm(options));
    LogRegistry::tasks()->debug("Submitting comparison of {} and {}", pathA.string(), pathB.string());

    return submit<ComparisonResult>(
        [pathA = std::move(pathA), pathB = std::move(pathB), options](
            const ProgressCallback &relay, const CancellationToken &token) {
            return PathComparator::compare(pathA, pathB, options, relay, token);
        },
        std::move(progress));
}
