#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>

#include <curl/curl.h>

#include "bulkdl/config.hpp"
#include "bulkdl/http_transport.hpp"

namespace bulkdl
{

/**
 * HttpTransport backed by libcurl's multi interface.
 * Each transfer owns one easy handle; all of them are driven from the thread
 * calling perform(). Uses RAII for every CURL handle.
 */
class CurlTransport : public HttpTransport
{
public:
    /**
     * @param config Supplies user agent, proxy, timeouts, redirect limit and buffer size
     * @throws std::runtime_error if libcurl cannot be initialized
     */
    explicit CurlTransport(const RunConfig &config);
    ~CurlTransport() override;

    // CURL handles aren't copyable
    CurlTransport(const CurlTransport &) = delete;
    CurlTransport &operator=(const CurlTransport &) = delete;

    void start(const HttpRequest &request, ResponseHandler &handler) override;
    std::size_t inFlight() const override { return transfers_.size(); }
    void perform(std::chrono::milliseconds timeout) override;
    void abortAll() noexcept override;

    /**
     * Classify a failed libcurl transfer for retry logic.
     * Transient errors (network glitches, timeouts) are retryable; permanent
     * ones (invalid URL, TLS trust failures) are not. Unknown codes are
     * treated as transient.
     *
     * @param code CURL error code from the finished transfer (not CURLE_OK)
     * @param detail Error buffer contents, may be empty
     */
    static TransportResult classify(CURLcode code, const std::string &detail);

private:
    struct Transfer;

    // libcurl is a C library, so callbacks must be static
    static size_t writeCallback(char *ptr, size_t size, size_t nmemb, void *userdata);
    static int progressCallback(void *clientp,
                                curl_off_t dltotal,
                                curl_off_t dlnow,
                                curl_off_t ultotal,
                                curl_off_t ulnow);
    static bool deliverResponse(Transfer &transfer);

    void configure(Transfer &transfer, const HttpRequest &request);
    void completeFinished();
    void rethrowCallbackError();

    std::string userAgent_;
    std::optional<std::string> proxy_;
    long connectTimeoutSeconds_;
    long requestTimeoutSeconds_;
    long stallTimeoutSeconds_;
    long maxRedirects_;
    long bufferSize_;

    std::unique_ptr<CURLM, decltype(&curl_multi_cleanup)> multi_;
    std::map<CURL *, std::unique_ptr<Transfer>> transfers_;
};

} // namespace bulkdl
