#include "bulkdl/curl_transport.hpp"

#include <exception>
#include <stdexcept>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "bulkdl/log.hpp"
#include "curl_global.hpp"

namespace bulkdl
{

namespace
{

template <typename T>
void setOption(CURL *easy, CURLoption option, T value)
{
    CURLcode rc = curl_easy_setopt(easy, option, value);
    if (rc != CURLE_OK)
    {
        throw std::runtime_error(fmt::format("curl_easy_setopt({}) failed: {}",
                                             static_cast<int>(option), curl_easy_strerror(rc)));
    }
}

} // namespace

// curl_global_init is not thread-safe; a function-local static runs it once
void ensureCurlGlobalInit()
{
    struct CurlInit
    {
        CurlInit()
        {
            if (curl_global_init(CURL_GLOBAL_ALL) != CURLE_OK)
            {
                throw std::runtime_error("Failed to initialize libcurl");
            }
        }
        ~CurlInit() { curl_global_cleanup(); }
    };
    static CurlInit init;
}

struct CurlTransport::Transfer
{
    Transfer() : easy(curl_easy_init(), curl_easy_cleanup), headers(nullptr, curl_slist_free_all) {}

    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> easy;
    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers;
    ResponseHandler *handler = nullptr;
    std::string url;
    std::string range;
    bool responseDelivered = false;
    bool abortedByHandler = false;
    std::exception_ptr callbackError; // Thrown by the handler inside a libcurl callback
    char errorBuffer[CURL_ERROR_SIZE] = {};
};

CurlTransport::CurlTransport(const RunConfig &config)
    : userAgent_(config.userAgent()),
      proxy_(config.proxy()),
      connectTimeoutSeconds_(static_cast<long>(config.connectTimeout().count())),
      requestTimeoutSeconds_(static_cast<long>(config.requestTimeout().count())),
      stallTimeoutSeconds_(static_cast<long>(config.stallTimeout().count())),
      maxRedirects_(config.maxRedirects()),
      bufferSize_(static_cast<long>(config.bufferSize())),
      multi_(nullptr, curl_multi_cleanup)
{
    ensureCurlGlobalInit();

    multi_.reset(curl_multi_init());
    if (!multi_)
    {
        throw std::runtime_error("Failed to initialize CURL multi handle (out of memory or library error)");
    }
}

CurlTransport::~CurlTransport()
{
    abortAll();
}

void CurlTransport::abortAll() noexcept
{
    // Easy handles must leave the multi handle before either is cleaned up
    for (const auto &entry : transfers_)
    {
        curl_multi_remove_handle(multi_.get(), entry.first);
    }
    transfers_.clear();
}

void CurlTransport::start(const HttpRequest &request, ResponseHandler &handler)
{
    auto transfer = std::make_unique<Transfer>();
    if (!transfer->easy)
    {
        throw std::runtime_error("Failed to initialize CURL easy handle");
    }
    transfer->handler = &handler;
    transfer->url = request.url;

    configure(*transfer, request);

    CURL *easy = transfer->easy.get();
    CURLMcode rc = curl_multi_add_handle(multi_.get(), easy);
    if (rc != CURLM_OK)
    {
        throw std::runtime_error(fmt::format("curl_multi_add_handle failed: {}", curl_multi_strerror(rc)));
    }
    transfers_.emplace(easy, std::move(transfer));
}

void CurlTransport::configure(Transfer &transfer, const HttpRequest &request)
{
    CURL *easy = transfer.easy.get();

    // 1. Target and plain GET
    setOption(easy, CURLOPT_URL, transfer.url.c_str());
    setOption(easy, CURLOPT_HTTPGET, 1L);
    setOption(easy, CURLOPT_USERAGENT, userAgent_.c_str());
    setOption(easy, CURLOPT_ERRORBUFFER, transfer.errorBuffer);

    // 2. Body and liveness callbacks get the Transfer as context
    setOption(easy, CURLOPT_WRITEFUNCTION, writeCallback);
    setOption(easy, CURLOPT_WRITEDATA, &transfer);
    setOption(easy, CURLOPT_NOPROGRESS, 0L);
    setOption(easy, CURLOPT_XFERINFOFUNCTION, progressCallback);
    setOption(easy, CURLOPT_XFERINFODATA, &transfer);
    setOption(easy, CURLOPT_BUFFERSIZE, bufferSize_);

    // 3. HTTPS settings
    setOption(easy, CURLOPT_SSL_VERIFYPEER, 1L);
    setOption(easy, CURLOPT_SSL_VERIFYHOST, 2L);

    // 4. Redirects
    setOption(easy, CURLOPT_FOLLOWLOCATION, 1L);
    setOption(easy, CURLOPT_MAXREDIRS, maxRedirects_);

    // 5. Timeouts; signals are unusable for timeouts with several handles
    setOption(easy, CURLOPT_NOSIGNAL, 1L);
    setOption(easy, CURLOPT_CONNECTTIMEOUT, connectTimeoutSeconds_);
    if (requestTimeoutSeconds_ > 0)
    {
        setOption(easy, CURLOPT_TIMEOUT, requestTimeoutSeconds_);
    }
    if (stallTimeoutSeconds_ > 0)
    {
        setOption(easy, CURLOPT_LOW_SPEED_LIMIT, 1L);
        setOption(easy, CURLOPT_LOW_SPEED_TIME, stallTimeoutSeconds_);
    }

    if (proxy_)
    {
        setOption(easy, CURLOPT_PROXY, proxy_->c_str());
    }

    // 6. Caller headers, then the byte range
    curl_slist *list = nullptr;
    for (const auto &[name, value] : request.headers)
    {
        std::string line = value.empty() ? name + ";" : name + ": " + value;
        curl_slist *appended = curl_slist_append(list, line.c_str());
        if (appended == nullptr)
        {
            curl_slist_free_all(list);
            throw std::runtime_error("Failed to build request header list");
        }
        list = appended;
    }
    transfer.headers.reset(list);
    if (list != nullptr)
    {
        setOption(easy, CURLOPT_HTTPHEADER, list);
    }

    if (request.rangeStart)
    {
        // Format: "N-" means "from byte N to end of file"
        transfer.range = fmt::format("{}-", *request.rangeStart);
        setOption(easy, CURLOPT_RANGE, transfer.range.c_str());
    }
}

size_t CurlTransport::writeCallback(char *ptr, size_t size, size_t nmemb, void *userdata)
{
    size_t totalSize = size * nmemb;
    auto *transfer = static_cast<Transfer *>(userdata);

    // Exceptions must not unwind through libcurl's C frames
    try
    {
        if (!transfer->responseDelivered && !deliverResponse(*transfer))
        {
            return 0;
        }

        if (!transfer->handler->onBody(ptr, totalSize))
        {
            transfer->abortedByHandler = true;
            return 0; // Any value other than totalSize aborts the transfer
        }
    }
    catch (...)
    {
        transfer->callbackError = std::current_exception();
        transfer->abortedByHandler = true;
        return 0;
    }
    return totalSize;
}

int CurlTransport::progressCallback(void *clientp,
                                    curl_off_t dltotal,
                                    curl_off_t dlnow,
                                    curl_off_t ultotal,
                                    curl_off_t ulnow)
{
    (void)dltotal;
    (void)dlnow;
    (void)ultotal;
    (void)ulnow;

    auto *transfer = static_cast<Transfer *>(clientp);
    try
    {
        if (!transfer->handler->onTick())
        {
            transfer->abortedByHandler = true;
            return 1; // Non-zero aborts with CURLE_ABORTED_BY_CALLBACK
        }
    }
    catch (...)
    {
        transfer->callbackError = std::current_exception();
        transfer->abortedByHandler = true;
        return 1;
    }
    return 0;
}

bool CurlTransport::deliverResponse(Transfer &transfer)
{
    transfer.responseDelivered = true;

    long httpCode = 0;
    curl_easy_getinfo(transfer.easy.get(), CURLINFO_RESPONSE_CODE, &httpCode);

    // -1 when the server sent no Content-Length
    curl_off_t contentLength = -1;
    if (curl_easy_getinfo(transfer.easy.get(), CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &contentLength) != CURLE_OK)
    {
        contentLength = -1;
    }

    std::optional<std::uint64_t> length;
    if (contentLength >= 0)
    {
        length = static_cast<std::uint64_t>(contentLength);
    }

    if (!transfer.handler->onResponse(httpCode, length))
    {
        transfer.abortedByHandler = true;
        return false;
    }
    return true;
}

void CurlTransport::perform(std::chrono::milliseconds timeout)
{
    int numfds = 0;
    CURLMcode rc = curl_multi_poll(multi_.get(), nullptr, 0, static_cast<int>(timeout.count()), &numfds);
    if (rc != CURLM_OK)
    {
        throw std::runtime_error(fmt::format("curl_multi_poll failed: {}", curl_multi_strerror(rc)));
    }

    int stillRunning = 0;
    rc = curl_multi_perform(multi_.get(), &stillRunning);
    if (rc != CURLM_OK)
    {
        throw std::runtime_error(fmt::format("curl_multi_perform failed: {}", curl_multi_strerror(rc)));
    }

    rethrowCallbackError();
    completeFinished();
}

void CurlTransport::rethrowCallbackError()
{
    for (auto &entry : transfers_)
    {
        if (entry.second->callbackError)
        {
            std::exception_ptr error = std::exchange(entry.second->callbackError, nullptr);
            std::rethrow_exception(error);
        }
    }
}

void CurlTransport::completeFinished()
{
    // Collect first: message data does not survive curl_multi_remove_handle
    std::vector<std::pair<std::unique_ptr<Transfer>, CURLcode>> finished;

    CURLMsg *msg = nullptr;
    int msgsLeft = 0;
    while ((msg = curl_multi_info_read(multi_.get(), &msgsLeft)))
    {
        if (msg->msg != CURLMSG_DONE)
        {
            continue;
        }
        CURL *easy = msg->easy_handle;
        CURLcode code = msg->data.result;

        auto it = transfers_.find(easy);
        if (it == transfers_.end())
        {
            log::error("Received DONE message for an unknown transfer");
            continue;
        }
        finished.emplace_back(std::move(it->second), code);
        transfers_.erase(it);
        curl_multi_remove_handle(multi_.get(), easy);
    }

    for (auto &[transfer, code] : finished)
    {
        TransportResult result;
        if (transfer->abortedByHandler)
        {
            result.status = TransportResult::Status::AbortedByHandler;
        }
        else if (code == CURLE_OK)
        {
            // Empty bodies never reach the write callback
            if (!transfer->responseDelivered && !deliverResponse(*transfer))
            {
                result.status = TransportResult::Status::AbortedByHandler;
            }
        }
        else
        {
            result = classify(code, transfer->errorBuffer);
        }

        log::debug("Transfer of {} finished: {}", transfer->url,
                   code == CURLE_OK ? "ok" : curl_easy_strerror(code));
        transfer->handler->onComplete(result);
    }
}

TransportResult CurlTransport::classify(CURLcode code, const std::string &detail)
{
    TransportResult result;
    result.status = TransportResult::Status::Failed;
    result.message = detail.empty() ? curl_easy_strerror(code) : detail;

    switch (code)
    {
    // Transient network errors - worth retrying
    case CURLE_OPERATION_TIMEDOUT:   // Server didn't respond in time, or the stream stalled
    case CURLE_COULDNT_RESOLVE_HOST: // DNS lookup failed (might be temporary)
    case CURLE_COULDNT_RESOLVE_PROXY:
    case CURLE_COULDNT_CONNECT: // Connection refused (server might be restarting)
    case CURLE_PARTIAL_FILE:    // Transfer ended early (network interruption)
    case CURLE_RECV_ERROR:      // Error receiving data, e.g. connection reset
    case CURLE_SEND_ERROR:
    case CURLE_GOT_NOTHING: // Server sent no data (might be overloaded)
    case CURLE_HTTP2:
    case CURLE_HTTP2_STREAM:
        result.retryable = true;
        break;

    // Permanent errors - retrying won't help
    case CURLE_URL_MALFORMAT:
    case CURLE_UNSUPPORTED_PROTOCOL:
    case CURLE_OUT_OF_MEMORY:
    case CURLE_SSL_CERTPROBLEM:
    case CURLE_SSL_CIPHER:
    case CURLE_PEER_FAILED_VERIFICATION:
    case CURLE_SSL_CACERT_BADFILE:
    case CURLE_TOO_MANY_REDIRECTS:
    case CURLE_LOGIN_DENIED:
        result.retryable = false;
        break;

    // Unknown CURL error - be conservative and retry
    default:
        result.retryable = true;
        break;
    }

    return result;
}

} // namespace bulkdl
