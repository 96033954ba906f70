#include "report.hpp"
#include "errors.hpp"
#include "logging.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <fmt/core.h>

namespace
{
    // RFC 4180 quoting
    std::string csvField(const std::string &value)
    {
        if (value.find_first_of(",\"\r\n") == std::string::npos)
        {
            return value;
        }
        std::string quoted = "\"";
        for (char ch : value)
        {
            if (ch == '"')
            {
                quoted += '"';
            }
            quoted += ch;
        }
        quoted += '"';
        return quoted;
    }
}

std::string VerificationReport::statusText(const VerificationItem &item)
{
    switch (item.status)
    {
    case EntryStatus::Ok:
        return "OK";
    case EntryStatus::Mismatch:
        if (item.actualDigest.empty())
        {
            return fmt::format("MISMATCH ({})", item.error);
        }
        return fmt::format("MISMATCH (Expected {}, Got {})", item.entry.digest, item.actualDigest);
    case EntryStatus::Missing:
        return "File not found";
    case EntryStatus::Error:
        return fmt::format("ERROR {}", item.error);
    }
    return "UNKNOWN";
}

std::string VerificationReport::render(const VerificationResult &result, ReportFormat format)
{
    std::string out;

    if (format == ReportFormat::Csv)
    {
        out += "Filename,Status\n";
        for (const auto &item : result.items)
        {
            out += fmt::format("{},{}\n", csvField(item.entry.path), csvField(statusText(item)));
        }
        for (const auto &warning : result.warnings)
        {
            out += fmt::format("{},{}\n", csvField(warning.text),
                               csvField(fmt::format("Invalid line {} ({})", warning.lineNumber, warning.reason)));
        }
        return out;
    }

    for (const auto &item : result.items)
    {
        out += fmt::format("{}: {}\n", item.entry.path, statusText(item));
    }
    for (const auto &warning : result.warnings)
    {
        out += fmt::format("Line {}: Invalid line ({}): {}\n", warning.lineNumber, warning.reason, warning.text);
    }
    out += fmt::format("; {} OK, {} mismatched, {} missing, {} errors, {} invalid lines\n",
                       result.count(EntryStatus::Ok), result.count(EntryStatus::Mismatch),
                       result.count(EntryStatus::Missing), result.count(EntryStatus::Error),
                       result.warnings.size());
    return out;
}

void VerificationReport::save(const VerificationResult &result, const std::filesystem::path &file,
                              ReportFormat format)
{
    std::ofstream out(file, std::ios::binary | std::ios::trunc);
    if (!out)
    {
        throw ChecksumError(ChecksumError::Kind::IOError, file.string(), "Cannot open log for writing", "save");
    }
    out << render(result, format);
    out.flush();
    if (!out.good())
    {
        throw ChecksumError(ChecksumError::Kind::IOError, file.string(), "Write error while saving log", "save");
    }
    LogRegistry::tasks()->info("Log saved to {}", file.string());
}

std::optional<ReportFormat> VerificationReport::parseFormat(const std::string &name)
{
    std::string lower;
    std::transform(name.begin(), name.end(), std::back_inserter(lower),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    if (lower == "txt" || lower == "text")
    {
        return ReportFormat::Txt;
    }
    if (lower == "csv")
    {
        return ReportFormat::Csv;
    }
    return std::nullopt;
}

const char *VerificationReport::formatName(ReportFormat format)
{
    return format == ReportFormat::Csv ? "CSV" : "TXT";
}
