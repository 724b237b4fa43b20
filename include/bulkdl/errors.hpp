#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace bulkdl
{

/**
 * Raised when a run cannot start: an invalid option value or an unusable
 * destination directory. This is the only error that escapes Downloader::run.
 */
class ConfigError : public std::runtime_error
{
public:
    explicit ConfigError(const std::string &message) : std::runtime_error(message) {}
};

/**
 * Raised while building a DownloadItem from a URL, filename or checksum that
 * cannot be used.
 */
class InvalidItemError : public std::invalid_argument
{
public:
    explicit InvalidItemError(const std::string &message) : std::invalid_argument(message) {}
};

/**
 * Category of an item-level failure.
 */
enum class ErrorKind
{
    Network,         // Transient transport failure (retried)
    Protocol,        // Unexpected or unhandled HTTP status
    Filesystem,      // Cannot stat, open or write the destination
    InvalidPath,     // Destination filename cannot be used
    SizeMismatch,    // Streamed length disagrees with the declared total
    ChecksumMismatch // Finished file does not match the expected digest
};

const char *toString(ErrorKind kind);

/**
 * Item-level failure. These never propagate as exceptions; they end up in the
 * item's OutcomeRecord.
 */
struct TransferError
{
    ErrorKind kind = ErrorKind::Network;
    std::string message;
    std::optional<long> httpStatus;
};

} // namespace bulkdl
