#include "bulkdl/download_item.hpp"

#include <memory>
#include <stdexcept>

#include <curl/curl.h>
#include <fmt/core.h>

#include "bulkdl/errors.hpp"
#include "curl_global.hpp"

namespace bulkdl
{

namespace
{

using UrlHandle = std::unique_ptr<CURLU, decltype(&curl_url_cleanup)>;

// Fetch one URL part; libcurl allocates the string, we own it afterwards
std::optional<std::string> getPart(CURLU *url, CURLUPart part)
{
    char *value = nullptr;
    if (curl_url_get(url, part, &value, 0) != CURLUE_OK || value == nullptr)
    {
        return std::nullopt;
    }
    std::string result(value);
    curl_free(value);
    return result;
}

std::string percentDecode(const std::string &segment)
{
    ensureCurlGlobalInit();
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl)
    {
        throw std::runtime_error("Failed to initialize CURL");
    }

    int length = 0;
    char *decoded = curl_easy_unescape(curl.get(), segment.c_str(), static_cast<int>(segment.size()), &length);
    if (decoded == nullptr)
    {
        throw InvalidItemError(fmt::format("Cannot percent-decode '{}'", segment));
    }
    std::string result(decoded, static_cast<size_t>(length));
    curl_free(decoded);
    return result;
}

} // namespace

std::optional<std::string> filenameFromUrl(const std::string &url)
{
    UrlHandle handle(curl_url(), curl_url_cleanup);
    if (!handle)
    {
        throw std::runtime_error("Failed to allocate CURL URL handle");
    }

    CURLUcode rc = curl_url_set(handle.get(), CURLUPART_URL, url.c_str(), 0);
    if (rc != CURLUE_OK)
    {
        throw InvalidItemError(fmt::format("The url \"{}\" cannot be parsed: {}", url, curl_url_strerror(rc)));
    }

    auto scheme = getPart(handle.get(), CURLUPART_SCHEME);
    if (!scheme || (*scheme != "http" && *scheme != "https"))
    {
        throw InvalidItemError(fmt::format("The url \"{}\" is not an HTTP or HTTPS url", url));
    }

    auto path = getPart(handle.get(), CURLUPART_PATH);
    if (!path)
    {
        return std::nullopt;
    }

    // Split before decoding so an encoded '/' stays inside its segment
    size_t end = path->find_last_not_of('/');
    if (end == std::string::npos)
    {
        return std::nullopt;
    }
    size_t slash = path->find_last_of('/', end);
    size_t start = (slash == std::string::npos) ? 0 : slash + 1;
    std::string segment = path->substr(start, end - start + 1);

    std::string decoded = percentDecode(segment);
    if (decoded.empty())
    {
        return std::nullopt;
    }
    return decoded;
}

DownloadItem DownloadItem::fromUrl(const std::string &url,
                                   std::optional<std::string> filenameOverride,
                                   std::optional<std::filesystem::path> directoryOverride,
                                   const std::optional<std::string> &checksum)
{
    DownloadItem item;
    item.url_ = url;

    // Parse even when overridden so bad URLs are rejected before the run
    auto derived = filenameFromUrl(url);
    if (filenameOverride && !filenameOverride->empty())
    {
        item.filename_ = std::move(*filenameOverride);
    }
    else if (derived)
    {
        item.filename_ = std::move(*derived);
    }
    else
    {
        throw InvalidItemError(fmt::format("The url \"{}\" does not contain a filename", url));
    }

    if (directoryOverride && !directoryOverride->empty())
    {
        item.directoryOverride_ = std::move(directoryOverride);
    }

    if (checksum)
    {
        try
        {
            item.checksum_ = ChecksumVerifier::parse(*checksum);
        }
        catch (const std::runtime_error &e)
        {
            throw InvalidItemError(fmt::format("Invalid checksum for \"{}\": {}", url, e.what()));
        }
    }

    return item;
}

std::filesystem::path DownloadItem::directory(const std::filesystem::path &runDirectory) const
{
    return directoryOverride_ ? *directoryOverride_ : runDirectory;
}

std::filesystem::path DownloadItem::destination(const std::filesystem::path &runDirectory) const
{
    return directory(runDirectory) / filename_;
}

std::optional<std::string> DownloadItem::validateFilename() const
{
    if (filename_.empty())
    {
        return std::string("empty filename");
    }
    if (filename_ == "." || filename_ == "..")
    {
        return fmt::format("'{}' is not a file name", filename_);
    }
    if (filename_.find_first_of("/\\") != std::string::npos)
    {
        return fmt::format("'{}' contains a path separator", filename_);
    }
    if (filename_.find('\0') != std::string::npos)
    {
        return std::string("filename contains a NUL byte");
    }
    return std::nullopt;
}

} // namespace bulkdl
