#include "bulkdl/checksum.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>

#include <fmt/core.h>

#include <openssl/evp.h>

namespace bulkdl
{

std::string ChecksumVerifier::computeSHA256(const std::filesystem::path &filePath)
{
    std::ifstream file(filePath, std::ios::binary);
    if (!file)
    {
        throw std::runtime_error(fmt::format("Cannot open file for checksum: {}", filePath.string()));
    }

    // EVP context freed on every exit path
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> context(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!context)
    {
        throw std::runtime_error("Failed to create OpenSSL digest context");
    }
    if (EVP_DigestInit_ex(context.get(), EVP_sha256(), nullptr) != 1)
    {
        throw std::runtime_error("Failed to initialize SHA-256 digest");
    }

    std::vector<char> buffer(CHUNK_SIZE);
    while (file.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || file.gcount() > 0)
    {
        size_t bytesRead = static_cast<size_t>(file.gcount());
        if (EVP_DigestUpdate(context.get(), buffer.data(), bytesRead) != 1)
        {
            throw std::runtime_error("Failed to update SHA-256 digest");
        }
    }
    if (file.bad())
    {
        throw std::runtime_error(fmt::format("Read error while hashing {}", filePath.string()));
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hashLength = 0;
    if (EVP_DigestFinal_ex(context.get(), hash, &hashLength) != 1)
    {
        throw std::runtime_error("Failed to finalize SHA-256 digest");
    }

    return toHex(std::vector<unsigned char>(hash, hash + hashLength));
}

bool ChecksumVerifier::verify(const std::filesystem::path &filePath, const ExpectedChecksum &expected)
{
    if (expected.algorithm != "sha256")
    {
        throw std::runtime_error(fmt::format("Unsupported checksum algorithm '{}'", expected.algorithm));
    }
    return computeSHA256(filePath) == normalizeHex(expected.hex);
}

ExpectedChecksum ChecksumVerifier::parse(const std::string &checksumString)
{
    size_t colonPos = checksumString.find(':');
    if (colonPos == std::string::npos)
    {
        throw std::runtime_error("Invalid checksum format. Expected 'algorithm:hexhash'");
    }

    std::string algorithm = checksumString.substr(0, colonPos);
    std::transform(algorithm.begin(), algorithm.end(), algorithm.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    if (algorithm != "sha256")
    {
        throw std::runtime_error(fmt::format("Unsupported algorithm: '{}'", algorithm));
    }

    std::string hex = normalizeHex(checksumString.substr(colonPos + 1));
    if (hex.length() != 64)
    {
        throw std::runtime_error(
            fmt::format("Invalid sha256 hash length. Expected 64 hex characters, got {}", hex.length()));
    }

    return ExpectedChecksum{algorithm, hex};
}

std::string ChecksumVerifier::toHex(const std::vector<unsigned char> &data)
{
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned char byte : data)
    {
        oss << std::setw(2) << static_cast<unsigned int>(byte);
    }
    return oss.str();
}

std::string ChecksumVerifier::normalizeHex(const std::string &hex)
{
    std::string result;
    result.reserve(hex.length());

    for (char ch : hex)
    {
        // Skip whitespace and common separators
        if (std::isspace(static_cast<unsigned char>(ch)) || ch == ':' || ch == '-')
        {
            continue;
        }
        if (!std::isxdigit(static_cast<unsigned char>(ch)))
        {
            throw std::runtime_error(fmt::format("Invalid character in checksum: '{}'", ch));
        }
        result += static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }

    return result;
}

} // namespace bulkdl
