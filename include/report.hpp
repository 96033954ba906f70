#pragma once

#include "verifier.hpp"

#include <filesystem>
#include <optional>
#include <string>

enum class ReportFormat
{
    Txt,
    Csv
};

/**
 * Verification logs in the plain-text or CSV layout.
 */
class VerificationReport
{
public:
    /**
     * Text status of one entry, e.g. "OK", "MISMATCH (Expected x, Got y)" or "File not found".
     */
    static std::string statusText(const VerificationItem &item);

    static std::string render(const VerificationResult &result, ReportFormat format);

    /**
     * @throws ChecksumError IOError if the log cannot be written
     */
    static void save(const VerificationResult &result, const std::filesystem::path &file, ReportFormat format);

    static std::optional<ReportFormat> parseFormat(const std::string &name);
    static const char *formatName(ReportFormat format);
};
