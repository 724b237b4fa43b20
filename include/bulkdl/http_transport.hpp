#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace bulkdl
{

/**
 * One GET request as the transfer executor wants it issued.
 */
struct HttpRequest
{
    std::string url;
    std::map<std::string, std::string> headers;
    std::optional<std::uint64_t> rangeStart; // Sends "Range: bytes=<start>-" when set
};

/**
 * How a transfer ended, from the transport's point of view.
 */
struct TransportResult
{
    enum class Status
    {
        Completed,        // Body fully received
        AbortedByHandler, // A ResponseHandler callback asked to stop
        Failed            // Connection, timeout, TLS or other transport error
    };

    Status status = Status::Completed;
    bool retryable = false; // Only meaningful for Failed
    std::string message;
};

/**
 * Receives the events of one transfer. Callbacks for a given transfer are
 * invoked sequentially, in stream order, from the thread driving perform().
 */
class ResponseHandler
{
public:
    virtual ~ResponseHandler() = default;

    /**
     * Status line and headers are known (after redirects were followed).
     *
     * @param statusCode Final HTTP status
     * @param contentLength Content-Length of this response, if present
     * @return false to abort the transfer
     */
    virtual bool onResponse(long statusCode, std::optional<std::uint64_t> contentLength) = 0;

    /**
     * A chunk of the response body.
     * @return false to abort the transfer
     */
    virtual bool onBody(const char *data, std::size_t size) = 0;

    /**
     * Periodic liveness check while the transfer is in flight, including
     * while no data arrives.
     * @return false to abort the transfer
     */
    virtual bool onTick() { return true; }

    /**
     * The transfer is over. Called exactly once per started transfer unless
     * it is dropped by HttpTransport::abortAll(); the transport no longer
     * references the handler afterwards.
     */
    virtual void onComplete(const TransportResult &result) = 0;
};

/**
 * The HTTP collaborator: runs many transfers concurrently on the caller's
 * thread, multiplexed over non-blocking I/O.
 */
class HttpTransport
{
public:
    virtual ~HttpTransport() = default;

    /**
     * Begin a transfer. The handler must outlive the transfer.
     * @throws std::runtime_error if the transfer cannot be set up
     */
    virtual void start(const HttpRequest &request, ResponseHandler &handler) = 0;

    /**
     * Number of transfers started and not yet completed.
     */
    virtual std::size_t inFlight() const = 0;

    /**
     * Drive I/O, waiting up to `timeout` for activity. Invokes handler
     * callbacks, including onComplete for transfers that finished.
     * An exception thrown by a handler callback propagates out of perform().
     */
    virtual void perform(std::chrono::milliseconds timeout) = 0;

    /**
     * Drop every in-flight transfer without calling its handler again.
     * Afterwards no handler passed to start() is referenced.
     */
    virtual void abortAll() noexcept = 0;
};

} // namespace bulkdl
