#pragma once

#include <stdexcept>
#include <string>

/**
 * Error raised by the checksum engine for task-level failures.
 *
 * Carries enough context (kind, path, underlying cause and task phase) for a
 * caller to log or display the failure without inspecting engine internals.
 * Per-file failures inside a batch are never thrown; they are attached to the
 * affected entry's result instead (see EntryError).
 */
class ChecksumError : public std::runtime_error
{
public:
    enum class Kind
    {
        IOError,              // Path unreadable, missing or permission denied
        UnsupportedAlgorithm, // Requested digest not registered
        MalformedManifest,    // Manifest text could not be parsed
        Cancelled             // Task stopped by caller request
    };

    ChecksumError(Kind kind, std::string path, std::string cause, std::string phase);

    Kind kind() const { return kind_; }
    const std::string &path() const { return path_; }
    const std::string &cause() const { return cause_; }
    const std::string &phase() const { return phase_; }

    static const char *kindName(Kind kind);

private:
    Kind kind_;
    std::string path_;
    std::string cause_;
    std::string phase_;
};

/**
 * A failure attached to a single path inside a batch.
 */
struct EntryError
{
    std::string path;
    std::string cause;
    std::string phase;
};
