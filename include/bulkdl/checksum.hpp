#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace bulkdl
{

/**
 * An expected file digest in "algorithm:hexhash" form.
 * Only SHA-256 is supported.
 */
struct ExpectedChecksum
{
    std::string algorithm; // Lowercase algorithm name ("sha256")
    std::string hex;       // Lowercase hex digest

    std::string toString() const { return algorithm + ":" + hex; }
};

/**
 * File integrity verification using OpenSSL's EVP digests.
 */
class ChecksumVerifier
{
public:
    /**
     * Compute the SHA-256 hash of a file.
     * Reads the file in chunks to avoid loading it into memory.
     *
     * @param filePath Path to file to hash
     * @return Hex-encoded hash string (64 characters)
     * @throws std::runtime_error if the file cannot be read
     */
    static std::string computeSHA256(const std::filesystem::path &filePath);

    /**
     * Verify that a file matches an expected checksum.
     *
     * @param filePath Path to file to verify
     * @param expected Parsed expected checksum
     * @return true if the digests match
     * @throws std::runtime_error if the file cannot be read
     */
    static bool verify(const std::filesystem::path &filePath, const ExpectedChecksum &expected);

    /**
     * Parse a checksum string such as "sha256:abc123...".
     * Case and whitespace in the hex part are ignored.
     *
     * @throws std::runtime_error if the format, algorithm or length is invalid
     */
    static ExpectedChecksum parse(const std::string &checksumString);

private:
    static std::string toHex(const std::vector<unsigned char> &data);
    static std::string normalizeHex(const std::string &hex);

    static constexpr size_t CHUNK_SIZE = 1024 * 1024;
};

} // namespace bulkdl
