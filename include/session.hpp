#pragma once

#include <filesystem>
#include <optional>
#include <vector>

/**
 * Snapshot of a working set that can be re-submitted unchanged:
 * the generation file list and the last selected manifest.
 */
struct SessionState
{
    std::vector<std::filesystem::path> files;
    std::optional<std::filesystem::path> lastManifest;
};

class SessionStore
{
public:
    /**
     * A missing file yields an empty session.
     * @throws ChecksumError IOError (phase "session") on unreadable or invalid JSON
     */
    static SessionState load(const std::filesystem::path &file);

    /**
     * @throws ChecksumError IOError (phase "session")
     */
    static void save(const SessionState &state, const std::filesystem::path &file);
};
