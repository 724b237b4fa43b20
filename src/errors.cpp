#include "bulkdl/errors.hpp"

namespace bulkdl
{

const char *toString(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::Network:
        return "network";
    case ErrorKind::Protocol:
        return "protocol";
    case ErrorKind::Filesystem:
        return "filesystem";
    case ErrorKind::InvalidPath:
        return "invalid-path";
    case ErrorKind::SizeMismatch:
        return "size-mismatch";
    case ErrorKind::ChecksumMismatch:
        return "checksum-mismatch";
    }
    return "unknown";
}

} // namespace bulkdl
