#include "errors.hpp"

#include <utility>

#include <fmt/core.h>

namespace
{
    std::string describe(ChecksumError::Kind kind, const std::string &path,
                         const std::string &cause, const std::string &phase)
    {
        if (path.empty())
        {
            return fmt::format("{} during {}: {}", ChecksumError::kindName(kind), phase, cause);
        }
        return fmt::format("{} during {} ({}): {}", ChecksumError::kindName(kind), phase, path, cause);
    }
}

ChecksumError::ChecksumError(Kind kind, std::string path, std::string cause, std::string phase)
    : std::runtime_error(describe(kind, path, cause, phase)),
      kind_(kind),
      path_(std::move(path)),
      cause_(std::move(cause)),
      phase_(std::move(phase))
{
}

const char *ChecksumError::kindName(Kind kind)
{
    switch (kind)
    {
    case Kind::IOError:
        return "IOError";
    case Kind::UnsupportedAlgorithm:
        return "UnsupportedAlgorithm";
    case Kind::MalformedManifest:
        return "MalformedManifest";
    case Kind::Cancelled:
        return "Cancelled";
    }
    return "Unknown";
}
