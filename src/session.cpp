#include "session.hpp"
#include "errors.hpp"
#include "logging.hpp"

#include <fstream>
#include <string>
#include <system_error>
#include <fmt/core.h>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

SessionState SessionStore::load(const fs::path &file)
{
    SessionState state;

    std::error_code ec;
    if (!fs::exists(file, ec))
    {
        return state;
    }

    std::ifstream in(file);
    if (!in)
    {
        throw ChecksumError(ChecksumError::Kind::IOError, file.string(), "Cannot open session file", "session");
    }

    try
    {
        const auto json = nlohmann::json::parse(in);
        for (const auto &path : json.value("files", std::vector<std::string>{}))
        {
            state.files.emplace_back(path);
        }
        const auto manifest = json.value("last_manifest", std::string{});
        if (!manifest.empty())
        {
            state.lastManifest = manifest;
        }
    }
    catch (const nlohmann::json::exception &e)
    {
        throw ChecksumError(ChecksumError::Kind::IOError, file.string(),
                            fmt::format("Invalid session: {}", e.what()), "session");
    }

    LogRegistry::config()->debug("Restored session with {} files from {}", state.files.size(), file.string());
    return state;
}

void SessionStore::save(const SessionState &state, const fs::path &file)
{
    nlohmann::json json;
    json["files"] = nlohmann::json::array();
    for (const auto &path : state.files)
    {
        json["files"].push_back(path.string());
    }
    json["last_manifest"] = state.lastManifest ? state.lastManifest->string() : std::string{};

    std::ofstream out(file, std::ios::trunc);
    if (!out)
    {
        throw ChecksumError(ChecksumError::Kind::IOError, file.string(), "Cannot write session file", "session");
    }
    out << json.dump(4) << '\n';
    if (!out.good())
    {
        throw ChecksumError(ChecksumError::Kind::IOError, file.string(), "Write error while saving session",
                            "session");
    }
}
