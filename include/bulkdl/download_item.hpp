#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "bulkdl/checksum.hpp"

namespace bulkdl
{

/**
 * One remote resource to fetch. Immutable once built.
 */
class DownloadItem
{
public:
    /**
     * Build an item from an HTTP(S) URL.
     *
     * The filename is the last non-empty segment of the URL path,
     * percent-decoded, unless an override is given.
     *
     * @param url Source URL
     * @param filenameOverride Filename to use instead of the URL's last segment
     * @param directoryOverride Directory to use instead of the run's directory
     * @param checksum Expected digest of the finished file ("sha256:<hex>")
     * @throws InvalidItemError if the URL is unusable, no filename can be
     *         derived, or the checksum is malformed
     */
    static DownloadItem fromUrl(const std::string &url,
                                std::optional<std::string> filenameOverride = std::nullopt,
                                std::optional<std::filesystem::path> directoryOverride = std::nullopt,
                                const std::optional<std::string> &checksum = std::nullopt);

    const std::string &url() const { return url_; }
    const std::string &filename() const { return filename_; }
    const std::optional<std::filesystem::path> &directoryOverride() const { return directoryOverride_; }
    const std::optional<ExpectedChecksum> &checksum() const { return checksum_; }

    /**
     * Destination directory: the override when present, otherwise the run's.
     */
    std::filesystem::path directory(const std::filesystem::path &runDirectory) const;

    /**
     * Full destination path (directory / filename). Not validated; see
     * validateFilename().
     */
    std::filesystem::path destination(const std::filesystem::path &runDirectory) const;

    /**
     * Check that the filename is a single usable path component.
     * @return Problem description, or std::nullopt when the name is usable
     */
    std::optional<std::string> validateFilename() const;

private:
    DownloadItem() = default;

    std::string url_;
    std::string filename_;
    std::optional<std::filesystem::path> directoryOverride_;
    std::optional<ExpectedChecksum> checksum_;
};

/**
 * Last non-empty path segment of a URL, percent-decoded.
 * @return std::nullopt if the URL has no such segment
 * @throws InvalidItemError if the URL cannot be parsed or is not HTTP(S)
 */
std::optional<std::string> filenameFromUrl(const std::string &url);

} // namespace bulkdl
