#include "checksum.hpp"
#include "errors.hpp"
#include "logging.hpp"

#include <algorithm>
#include <cstdint>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <fmt/core.h>

// OpenSSL for the cryptographic digests, zlib for CRC32
#include <openssl/evp.h>
#include <zlib.h>

namespace
{
    struct AlgorithmInfo
    {
        ChecksumAlgorithm algorithm;
        const char *name;
        std::size_t hexLength;
        const EVP_MD *(*evp)(); // nullptr for CRC32
        std::vector<std::string> aliases; // Lowercase, without '-' and '_'
    };

    const std::vector<AlgorithmInfo> &registry()
    {
        static const std::vector<AlgorithmInfo> table = {
            {ChecksumAlgorithm::CRC32, "CRC32", 8, nullptr, {"crc32", "crc", "sfv"}},
            {ChecksumAlgorithm::MD5, "MD5", 32, &EVP_md5, {"md5"}},
            {ChecksumAlgorithm::SHA1, "SHA1", 40, &EVP_sha1, {"sha1", "sha"}},
            {ChecksumAlgorithm::SHA224, "SHA224", 56, &EVP_sha224, {"sha224"}},
            {ChecksumAlgorithm::SHA256, "SHA256", 64, &EVP_sha256, {"sha256"}},
            {ChecksumAlgorithm::SHA384, "SHA384", 96, &EVP_sha384, {"sha384"}},
            {ChecksumAlgorithm::SHA512, "SHA512", 128, &EVP_sha512, {"sha512"}},
            {ChecksumAlgorithm::SHA3_224, "SHA3-224", 56, &EVP_sha3_224, {"sha3224"}},
            {ChecksumAlgorithm::SHA3_256, "SHA3-256", 64, &EVP_sha3_256, {"sha3256"}},
            {ChecksumAlgorithm::SHA3_384, "SHA3-384", 96, &EVP_sha3_384, {"sha3384"}},
            {ChecksumAlgorithm::SHA3_512, "SHA3-512", 128, &EVP_sha3_512, {"sha3512"}},
            {ChecksumAlgorithm::BLAKE2b512, "BLAKE2b", 128, &EVP_blake2b512, {"blake2b", "blake2b512"}},
            {ChecksumAlgorithm::BLAKE2s256, "BLAKE2s", 64, &EVP_blake2s256, {"blake2s", "blake2s256"}},
        };
        return table;
    }

    const AlgorithmInfo &lookup(ChecksumAlgorithm algorithm)
    {
        for (const auto &info : registry())
        {
            if (info.algorithm == algorithm)
            {
                return info;
            }
        }
        throw ChecksumError(ChecksumError::Kind::UnsupportedAlgorithm, "",
                            fmt::format("Algorithm #{} is not registered", static_cast<int>(algorithm)),
                            "digest");
    }

    class Crc32Hasher : public Hasher
    {
    public:
        void update(const char *data, std::size_t length) override
        {
            // zlib takes uInt lengths, feed oversized buffers in slices
            while (length > 0)
            {
                const auto slice = static_cast<uInt>(std::min<std::size_t>(length, 1u << 30));
                crc_ = crc32(crc_, reinterpret_cast<const Bytef *>(data), slice);
                data += slice;
                length -= slice;
            }
        }

        std::string finish() override
        {
            return fmt::format("{:08x}", static_cast<std::uint32_t>(crc_ & 0xFFFFFFFFUL));
        }

    private:
        uLong crc_ = crc32(0L, Z_NULL, 0);
    };

    class EvpHasher : public Hasher
    {
    public:
        EvpHasher(const EVP_MD *md, const char *name)
            : context_(EVP_MD_CTX_new(), &EVP_MD_CTX_free), name_(name)
        {
            if (!context_)
            {
                throw std::runtime_error("Failed to create OpenSSL context");
            }
            if (md == nullptr || EVP_DigestInit_ex(context_.get(), md, nullptr) != 1)
            {
                throw ChecksumError(ChecksumError::Kind::UnsupportedAlgorithm, "",
                                    fmt::format("OpenSSL cannot initialize {} digest", name_),
                                    "digest");
            }
        }

        void update(const char *data, std::size_t length) override
        {
            if (EVP_DigestUpdate(context_.get(), data, length) != 1)
            {
                throw std::runtime_error(fmt::format("Failed to update {} digest", name_));
            }
        }

        std::string finish() override
        {
            unsigned char hash[EVP_MAX_MD_SIZE];
            unsigned int hashLength = 0;

            if (EVP_DigestFinal_ex(context_.get(), hash, &hashLength) != 1)
            {
                throw std::runtime_error(fmt::format("Failed to finalize {} digest", name_));
            }
            return ChecksumCalculator::toHex(hash, hashLength);
        }

    private:
        std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> context_;
        const char *name_;
    };

    std::string aliasKey(const std::string &name)
    {
        std::string key;
        key.reserve(name.size());
        for (char ch : name)
        {
            if (ch == '-' || ch == '_' || std::isspace(static_cast<unsigned char>(ch)))
            {
                continue;
            }
            key += static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
        }
        return key;
    }
}

std::string ChecksumCalculator::compute(const std::filesystem::path &filePath,
                                        ChecksumAlgorithm algorithm,
                                        std::size_t chunkSize)
{
    // Resolve the digest first so a bad algorithm never touches the disk
    auto hasher = createHasher(algorithm);

    std::error_code ec;
    if (std::filesystem::is_directory(filePath, ec))
    {
        throw ChecksumError(ChecksumError::Kind::IOError, filePath.string(),
                            "Path is a directory", "digest");
    }

    std::ifstream file(filePath, std::ios::binary);
    if (!file)
    {
        throw ChecksumError(ChecksumError::Kind::IOError, filePath.string(),
                            "Cannot open file for checksum", "digest");
    }

    std::vector<char> buffer(std::max(chunkSize, MIN_CHUNK_SIZE));
    while (file.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || file.gcount() > 0)
    {
        hasher->update(buffer.data(), static_cast<std::size_t>(file.gcount()));
    }

    if (file.bad())
    {
        throw ChecksumError(ChecksumError::Kind::IOError, filePath.string(),
                            "Read error while computing checksum", "digest");
    }

    auto digest = hasher->finish();
    LogRegistry::digest()->trace("{} {} = {}", algorithmName(algorithm), filePath.string(), digest);
    return digest;
}

std::unique_ptr<Hasher> ChecksumCalculator::createHasher(ChecksumAlgorithm algorithm)
{
    const auto &info = lookup(algorithm);
    if (info.evp == nullptr)
    {
        return std::make_unique<Crc32Hasher>();
    }
    return std::make_unique<EvpHasher>(info.evp(), info.name);
}

bool ChecksumCalculator::isSupported(ChecksumAlgorithm algorithm)
{
    try
    {
        createHasher(algorithm);
        return true;
    }
    catch (const ChecksumError &e)
    {
        LogRegistry::digest()->debug("{}", e.what());
        return false;
    }
}

void ChecksumCalculator::requireSupported(ChecksumAlgorithm algorithm)
{
    // Throws UnsupportedAlgorithm with OpenSSL's verdict attached
    createHasher(algorithm);
}

const std::vector<ChecksumAlgorithm> &ChecksumCalculator::allAlgorithms()
{
    static const std::vector<ChecksumAlgorithm> all = [] {
        std::vector<ChecksumAlgorithm> out;
        for (const auto &info : registry())
        {
            out.push_back(info.algorithm);
        }
        return out;
    }();
    return all;
}

std::string ChecksumCalculator::algorithmName(ChecksumAlgorithm algorithm)
{
    return lookup(algorithm).name;
}

std::optional<ChecksumAlgorithm> ChecksumCalculator::parseAlgorithm(const std::string &name)
{
    const auto key = aliasKey(name);
    for (const auto &info : registry())
    {
        if (std::find(info.aliases.begin(), info.aliases.end(), key) != info.aliases.end())
        {
            return info.algorithm;
        }
    }
    return std::nullopt;
}

ChecksumAlgorithm ChecksumCalculator::requireAlgorithm(const std::string &name)
{
    auto algorithm = parseAlgorithm(name);
    if (!algorithm)
    {
        throw ChecksumError(ChecksumError::Kind::UnsupportedAlgorithm, "",
                            fmt::format("Unsupported algorithm: '{}'", name), "config");
    }
    return *algorithm;
}

std::size_t ChecksumCalculator::digestLength(ChecksumAlgorithm algorithm)
{
    return lookup(algorithm).hexLength;
}

std::optional<ChecksumAlgorithm> ChecksumCalculator::algorithmFromDigestLength(std::size_t length)
{
    switch (length)
    {
    case 8:
        return ChecksumAlgorithm::CRC32;
    case 32:
        return ChecksumAlgorithm::MD5;
    case 40:
        return ChecksumAlgorithm::SHA1;
    case 56:
        return ChecksumAlgorithm::SHA224;
    case 64:
        return ChecksumAlgorithm::SHA256;
    case 96:
        return ChecksumAlgorithm::SHA384;
    case 128:
        return ChecksumAlgorithm::SHA512;
    default:
        return std::nullopt;
    }
}

std::string ChecksumCalculator::normalizeHex(const std::string &hex)
{
    std::string result;
    result.reserve(hex.length());

    for (char ch : hex)
    {
        const auto uch = static_cast<unsigned char>(ch);
        if (std::isspace(uch))
        {
            continue;
        }

        // Keep only hex digits
        if (std::isxdigit(uch))
        {
            result += static_cast<char>(std::tolower(uch));
        }
        else
        {
            throw std::invalid_argument(
                fmt::format("Invalid character in checksum: '{}'", ch));
        }
    }

    return result;
}

bool ChecksumCalculator::isHex(const std::string &text)
{
    return !text.empty() && std::all_of(text.begin(), text.end(), [](char ch) {
        return std::isxdigit(static_cast<unsigned char>(ch)) != 0;
    });
}

bool ChecksumCalculator::digestsEqual(const std::string &lhs, const std::string &rhs)
{
    return lhs.size() == rhs.size() &&
           std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) {
               return std::tolower(static_cast<unsigned char>(a)) ==
                      std::tolower(static_cast<unsigned char>(b));
           });
}

std::string ChecksumCalculator::toHex(const unsigned char *data, std::size_t length)
{
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');

    for (std::size_t i = 0; i < length; ++i)
    {
        oss << std::setw(2) << static_cast<unsigned int>(data[i]);
    }

    return oss.str();
}
