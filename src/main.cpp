#include <atomic>
#include <chrono>
#include <csignal>
#include <optional>
#include <fmt/core.h>
#include <CLI/CLI.hpp> // CLI11 main header
#include "config.hpp"
#include "logging.hpp"
#include "progress_printer.hpp"
#include "report.hpp"
#include "session.hpp"
#include "task_runner.hpp"

namespace fs = std::filesystem;

namespace
{
    // Exit codes
    constexpr int EXIT_OK = 0;
    constexpr int EXIT_DIFFERENCES = 1;
    constexpr int EXIT_TASK_ERROR = 2;

    std::atomic<bool> interrupted{false};

    void onInterrupt(int)
    {
        interrupted.store(true);
    }

    // Flags shared by all subcommands
    struct GlobalOptions
    {
        std::string configPath = "settings.json";
        std::optional<unsigned int> threads;
        std::optional<std::string> logFile;
        bool verbose = false;
    };

    struct GenerateCommand
    {
        std::vector<std::string> paths;
        std::optional<std::string> algorithm;
        std::optional<std::string> output;
        std::optional<std::string> delimiter;
        std::vector<std::string> exclude;
        std::optional<std::string> session;
        bool absolute = false;
        bool verify = false;
        bool backup = false;
        bool toStdout = false;
    };

    struct VerifyCommand
    {
        std::optional<std::string> manifest;
        std::optional<std::string> algorithm;
        std::optional<std::string> logPath;
        std::optional<std::string> logFormat;
        std::optional<std::string> session;
        bool quick = false;
    };

    struct CompareCommand
    {
        std::string pathA;
        std::string pathB;
        std::optional<std::string> algorithm;
        bool quick = false;
    };

    /**
     * Wait for a task while forwarding Ctrl+C as a cancellation request.
     */
    template <typename Result>
    Result waitForTask(const TaskHandle<Result> &handle, ProgressPrinter &printer)
    {
        bool cancelRequested = false;
        while (!handle.waitFor(std::chrono::milliseconds(100)))
        {
            if (interrupted.load() && !cancelRequested)
            {
                fmt::print(stderr, "\nCancelling, finishing files in progress...\n");
                handle.cancel();
                cancelRequested = true;
            }
        }
        printer.finish();
        return handle.get();
    }

    ProgressCallback printTo(ProgressPrinter &printer)
    {
        return [&printer](const TaskProgress &progress) { printer.update(progress); };
    }

    int runGenerate(const AppConfig &config, const GenerateCommand &command)
    {
        auto options = ConfigLoader::generationOptions(config);
        const auto algorithm = command.algorithm ? ChecksumCalculator::requireAlgorithm(*command.algorithm)
                                                 : ConfigLoader::algorithm(config);

        SessionState session;
        if (command.session)
        {
            session = SessionStore::load(*command.session);
        }

        std::vector<fs::path> inputs(command.paths.begin(), command.paths.end());
        if (inputs.empty())
        {
            inputs = session.files;
        }
        if (inputs.empty())
        {
            fmt::print(stderr, "✗ No files to process.\n");
            return EXIT_TASK_ERROR;
        }

        if (command.output)
        {
            options.baseDirectory = fs::absolute(*command.output).parent_path();
            options.manifestNames.push_back(fs::path(*command.output).filename().string());
        }

        ProgressPrinter printer("Generating");
        auto handle = TaskRunner::submitGenerate(inputs, algorithm, options, printTo(printer));
        auto result = waitForTask(handle, printer);

        for (const auto &error : result.errors)
        {
            fmt::print(stderr, "✗ {}: {}\n", error.path, error.cause);
        }
        if (result.excludedCount > 0)
        {
            fmt::print("Excluded {} file(s) by extension.\n", result.excludedCount);
        }
        if (result.manifest.entryCount() == 0)
        {
            fmt::print(stderr, "✗ No files to process after applying exclusions.\n");
            return EXIT_TASK_ERROR;
        }

        const auto style = command.absolute ? PathStyle::Absolute : config.pathStyle;
        if (command.toStdout)
        {
            fmt::print("{}", ManifestCodec::serialize(result.manifest, style));
        }
        else
        {
            auto target = command.output ? fs::path(*command.output)
                                         : result.manifest.baseDirectory / (config.manifestName + ".sfv");
            auto saveOptions = ConfigLoader::saveOptions(config);
            saveOptions.pathStyle = style;
            if (command.backup)
            {
                saveOptions.existing = ExistingFilePolicy::Backup;
            }
            const auto written = ManifestCodec::save(result.manifest, target, saveOptions);
            fmt::print("✓ SFV file saved at {} ({} entries, {})\n", written.string(), result.manifest.entryCount(),
                       ChecksumCalculator::algorithmName(algorithm));
            session.lastManifest = written;
        }

        if (command.session)
        {
            session.files = inputs;
            SessionStore::save(session, *command.session);
        }

        int status = result.errors.empty() ? EXIT_OK : EXIT_DIFFERENCES;
        if (result.verification)
        {
            const auto &verification = *result.verification;
            if (verification.allOk())
            {
                fmt::print("✓ Verification after generation passed ({} files).\n", verification.items.size());
            }
            else
            {
                fmt::print(stderr, "✗ Verification after generation FAILED:\n");
                for (const auto &item : verification.items)
                {
                    if (item.status != EntryStatus::Ok)
                    {
                        fmt::print(stderr, "  {}: {}\n", item.entry.path, VerificationReport::statusText(item));
                    }
                }
                status = EXIT_DIFFERENCES;
            }
        }
        return status;
    }

    int runVerify(const AppConfig &config, const VerifyCommand &command)
    {
        SessionState session;
        if (command.session)
        {
            session = SessionStore::load(*command.session);
        }

        std::optional<fs::path> manifestPath;
        if (command.manifest)
        {
            manifestPath = fs::path(*command.manifest);
        }
        else
        {
            manifestPath = session.lastManifest;
        }
        if (!manifestPath)
        {
            fmt::print(stderr, "✗ Please select an SFV file to verify.\n");
            return EXIT_TASK_ERROR;
        }

        std::optional<ChecksumAlgorithm> algorithm;
        if (command.algorithm)
        {
            algorithm = ChecksumCalculator::requireAlgorithm(*command.algorithm);
        }
        else if (fs::path(*manifestPath).extension() == ".sfv")
        {
            // .sfv files use the configured algorithm, anything else is guessed from digest length
            algorithm = ConfigLoader::algorithm(config);
        }

        const auto mode = command.quick ? VerificationMode::Quick : VerificationMode::Full;
        ProgressPrinter printer("Verifying");
        auto handle = TaskRunner::submitVerifyFile(*manifestPath, ConfigLoader::parseOptions(config, algorithm),
                                                   ConfigLoader::verificationOptions(config, mode),
                                                   printTo(printer));
        const auto result = waitForTask(handle, printer);

        for (const auto &item : result.items)
        {
            const char *mark = item.status == EntryStatus::Ok ? "✓" : "✗";
            fmt::print("{} {}: {}\n", mark, item.entry.path, VerificationReport::statusText(item));
        }
        for (const auto &warning : result.warnings)
        {
            fmt::print(stderr, "Warning: invalid line {} ({}): {}\n", warning.lineNumber, warning.reason, warning.text);
        }
        fmt::print("\n{} OK, {} mismatched, {} missing, {} errors\n", result.count(EntryStatus::Ok),
                   result.count(EntryStatus::Mismatch), result.count(EntryStatus::Missing),
                   result.count(EntryStatus::Error));

        std::optional<fs::path> logPath;
        if (command.logPath)
        {
            logPath = fs::path(*command.logPath);
        }
        else if (config.loggingEnabled)
        {
            logPath = fs::path(config.logFile);
        }
        if (logPath)
        {
            auto format = config.logFormat;
            if (command.logFormat)
            {
                format = VerificationReport::parseFormat(*command.logFormat).value_or(format);
            }
            VerificationReport::save(result, *logPath, format);
            fmt::print("Log saved to {}\n", logPath->string());
        }

        if (command.session)
        {
            session.lastManifest = *manifestPath;
            SessionStore::save(session, *command.session);
        }

        return result.allOk() && result.warnings.empty() ? EXIT_OK : EXIT_DIFFERENCES;
    }

    int runCompare(const AppConfig &config, const CompareCommand &command)
    {
        auto options = ConfigLoader::comparisonOptions(config, command.quick ? ComparisonMode::Quick
                                                                             : ComparisonMode::Full);
        if (command.algorithm)
        {
            options.algorithm = ChecksumCalculator::requireAlgorithm(*command.algorithm);
        }

        ProgressPrinter printer("Comparing");
        auto handle = TaskRunner::submitCompare(command.pathA, command.pathB, options, printTo(printer));
        const auto result = waitForTask(handle, printer);

        switch (result.verdict)
        {
        case ComparisonVerdict::Identical:
            fmt::print("✓ {} and {} are identical ({} files compared).\n", command.pathA, command.pathB,
                       result.filesCompared);
            return EXIT_OK;
        case ComparisonVerdict::TypeMismatch:
            fmt::print(stderr, "✗ Both paths must be either files or directories.\n");
            return EXIT_DIFFERENCES;
        case ComparisonVerdict::Different:
            break;
        }

        for (const auto &difference : result.differences)
        {
            const auto path = difference.path.empty() ? command.pathA : difference.path;
            fmt::print("✗ {}: {}\n", path, difference.detail);
        }
        fmt::print("\n{} difference(s), {} files compared\n", result.differences.size(), result.filesCompared);
        return EXIT_DIFFERENCES;
    }
}

int main(int argc, char *argv[])
{
    // Quick check for --version flag before full parsing
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--version" || arg == "-V") {
            fmt::print("SFV Checker v1.0\n");
            fmt::print("Built with:\n");
            fmt::print("  - OpenSSL: MD5, SHA-1, SHA-2, SHA-3, BLAKE2\n");
            fmt::print("  - zlib: CRC32\n");
            fmt::print("  - CLI11: Command-line parsing\n");
            fmt::print("  - fmt / spdlog: Formatting and logging\n");
            return 0;
        }
    }

    // Create CLI11 app
    CLI::App app{"SFV Checker v1.0 - Generate, verify and compare file checksums"};
    app.require_subcommand(1);

    GlobalOptions global;
    GenerateCommand generate;
    VerifyCommand verify;
    CompareCommand compare;

    // ====================================================================
    // DEFINE ARGUMENTS
    // ====================================================================

    app.add_option("-c,--config", global.configPath, "JSON settings file")
        ->default_val("settings.json");
    app.add_option("-j,--threads", global.threads, "Worker threads (0 = one per CPU)")
        ->check(CLI::Range(0, 1024));
    app.add_option("--log-file", global.logFile, "Write a debug log to FILE");
    app.add_flag("-v,--verbose", global.verbose, "Log engine activity to stderr");
    app.add_flag("-V,--version", "Display version information");

    const auto algorithmCheck = [](const std::string &name) -> std::string {
        if (ChecksumCalculator::parseAlgorithm(name)) {
            return ""; // Empty string = valid
        }
        return "Unknown algorithm: " + name;
    };

    auto *generateCmd = app.add_subcommand("generate", "Compute checksums and write an SFV file");
    generateCmd->add_option("PATHS", generate.paths, "Files or directories to include");
    generateCmd->add_option("-a,--algorithm", generate.algorithm, "Checksum algorithm (crc32, md5, sha1, sha256, ...)")
        ->check(algorithmCheck);
    generateCmd->add_option("-o,--output", generate.output, "Manifest path (default: <common dir>/checksum.sfv)");
    generateCmd->add_option("-d,--delimiter", generate.delimiter, "space, tab or a custom string");
    generateCmd->add_option("-x,--exclude", generate.exclude, "Extensions to skip, e.g. .tmp,.bak")
        ->delimiter(',');
    generateCmd->add_option("--session", generate.session, "Session file to restore from and update");
    generateCmd->add_flag("--absolute", generate.absolute, "Write absolute paths");
    generateCmd->add_flag("--verify", generate.verify, "Verify the manifest right after generating it");
    generateCmd->add_flag("--backup", generate.backup, "Back up an existing manifest instead of renaming the new one");
    generateCmd->add_flag("--stdout", generate.toStdout, "Print the manifest instead of saving it");

    auto *verifyCmd = app.add_subcommand("verify", "Check files against an SFV file");
    verifyCmd->add_option("MANIFEST", verify.manifest, "SFV file to verify");
    verifyCmd->add_option("-a,--algorithm", verify.algorithm, "Algorithm the manifest was written with")
        ->check(algorithmCheck);
    verifyCmd->add_option("-l,--log", verify.logPath, "Save a verification log");
    verifyCmd->add_option("--log-format", verify.logFormat, "Log format")
        ->check(CLI::IsMember({"txt", "csv", "TXT", "CSV"}));
    verifyCmd->add_option("--session", verify.session, "Session file to restore from and update");
    verifyCmd->add_flag("-q,--quick", verify.quick, "Skip hashing when the recorded size differs");

    auto *compareCmd = app.add_subcommand("compare", "Compare two files or directory trees");
    compareCmd->add_option("PATH_A", compare.pathA, "First file or directory")->required();
    compareCmd->add_option("PATH_B", compare.pathB, "Second file or directory")->required();
    compareCmd->add_option("-a,--algorithm", compare.algorithm, "Digest used for content comparison")
        ->check(algorithmCheck);
    compareCmd->add_flag("-q,--quick", compare.quick, "Compare sizes first and hash with CRC32");

    // ====================================================================
    // PARSE ARGUMENTS
    // ====================================================================

    try
    {
        app.parse(argc, argv);
    }
    catch (const CLI::ParseError &e)
    {
        return app.exit(e);
    }

    try
    {
        AppConfig config = ConfigLoader::load(global.configPath);

        // Command line overrides the settings file
        if (global.threads)
        {
            config.threads = *global.threads;
        }
        if (generate.delimiter)
        {
            config.delimiter = *generate.delimiter;
        }
        if (!generate.exclude.empty())
        {
            config.excludeExtensions = generate.exclude;
        }
        if (generate.verify)
        {
            config.verifyAfterGenerate = true;
        }

        LogRegistry::Settings logSettings;
        logSettings.consoleLevel = global.verbose ? spdlog::level::debug : spdlog::level::warn;
        if (global.logFile)
        {
            logSettings.logFile = fs::path(*global.logFile);
        }
        LogRegistry::init(logSettings);

        std::signal(SIGINT, onInterrupt);

        int status = EXIT_OK;
        if (*generateCmd)
        {
            status = runGenerate(config, generate);
        }
        else if (*verifyCmd)
        {
            status = runVerify(config, verify);
        }
        else if (*compareCmd)
        {
            status = runCompare(config, compare);
        }

        LogRegistry::shutdown();
        return status;
    }
    catch (const ChecksumError &e)
    {
        if (e.kind() == ChecksumError::Kind::Cancelled)
        {
            fmt::print(stderr, "✗ Cancelled.\n");
        }
        else
        {
            fmt::print(stderr, "✗ {}\n", e.what());
        }
        LogRegistry::shutdown();
        return EXIT_TASK_ERROR;
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "✗ Fatal error: {}\n", e.what());
        LogRegistry::shutdown();
        return EXIT_TASK_ERROR;
    }
}
