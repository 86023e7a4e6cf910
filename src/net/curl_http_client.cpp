// IptvMux - IPTV Stream Multiplexing Proxy
// Upstream HTTP client on libcurl - Implementation

#include "iptvmux/net/curl_http_client.hpp"
#include "iptvmux/core/url.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <cstring>

namespace iptvmux {
namespace net {

namespace {

// Upper bound of a single curl_multi_poll() so cancellation is noticed
// even without a wakeup.
constexpr int POLL_SLICE_MS = 200;

struct CurlGlobal {
    CurlGlobal() { curl_global_init(CURL_GLOBAL_DEFAULT); }
    ~CurlGlobal() { curl_global_cleanup(); }
};

void ensureCurlGlobal() {
    static CurlGlobal global;
    (void)global;
}

bool isRedirectStatus(int status) {
    return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

std::string trimLine(const char* data, std::size_t size) {
    std::size_t begin = 0;
    std::size_t end = size;
    while (begin < end && std::isspace(static_cast<unsigned char>(data[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(data[end - 1]))) {
        --end;
    }
    return std::string(data + begin, end - begin);
}

// =============================================================================
// CurlHttpResponse
// =============================================================================

class CurlHttpResponse : public IUpstreamResponse {
public:
    explicit CurlHttpResponse(std::function<bool()> isCancelled)
        : isCancelled_(std::move(isCancelled))
        , easy_(curl_easy_init())
        , multi_(curl_multi_init()) {
        errorBuffer_[0] = '\0';
    }

    ~CurlHttpResponse() override {
        if (multi_ != nullptr && easy_ != nullptr && attached_) {
            curl_multi_remove_handle(multi_, easy_);
        }
        if (easy_ != nullptr) {
            curl_easy_cleanup(easy_);
        }
        if (multi_ != nullptr) {
            curl_multi_cleanup(multi_);
        }
        if (headerList_ != nullptr) {
            curl_slist_free_all(headerList_);
        }
    }

    CurlHttpResponse(const CurlHttpResponse&) = delete;
    CurlHttpResponse& operator=(const CurlHttpResponse&) = delete;

    core::Result<void, UpstreamError> start(const UpstreamRequest& request,
                                            const CurlHttpClientOptions& options);

    /**
     * @brief Drive the transfer until the final response head arrived.
     */
    core::Result<void, UpstreamError> awaitHead(const UpstreamRequest& request);

    int statusCode() const override { return status_; }

    std::optional<std::string> header(const std::string& name) const override {
        return headers_.get(name);
    }

    core::Result<std::size_t, UpstreamError> read(uint8_t* buffer, std::size_t capacity) override;

    void abort() override {
        aborted_.store(true);
        if (multi_ != nullptr) {
            curl_multi_wakeup(multi_);
        }
    }

private:
    static size_t onWrite(char* data, size_t size, size_t count, void* userdata);
    static size_t onHeader(char* data, size_t size, size_t count, void* userdata);
    static int onProgress(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t);

    core::Result<void, UpstreamError> drive();
    void collectDone();
    UpstreamError transferError() const;

    std::function<bool()> isCancelled_;
    CURL* easy_;
    CURLM* multi_;
    curl_slist* headerList_ = nullptr;
    bool attached_ = false;
    bool followRedirects_ = false;
    char errorBuffer_[CURL_ERROR_SIZE];

    // Written only from callbacks, which run on the reading thread.
    int status_ = 0;
    HttpHeaders headers_;
    bool headersDone_ = false;
    bool transferDone_ = false;
    CURLcode result_ = CURLE_OK;
    std::string pending_;
    std::size_t pendingOffset_ = 0;

    std::atomic<bool> aborted_{false};
};

core::Result<void, UpstreamError> CurlHttpResponse::start(const UpstreamRequest& request,
                                                          const CurlHttpClientOptions& options) {
    using StartResult = core::Result<void, UpstreamError>;

    if (easy_ == nullptr || multi_ == nullptr) {
        return StartResult::error(UpstreamError(UpstreamError::Code::ConnectionFailed,
            "Cannot create curl handles"));
    }

    curl_easy_setopt(easy_, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(easy_, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(easy_, CURLOPT_ERRORBUFFER, errorBuffer_);
#if LIBCURL_VERSION_NUM >= 0x075500
    curl_easy_setopt(easy_, CURLOPT_PROTOCOLS_STR, "http,https");
    curl_easy_setopt(easy_, CURLOPT_REDIR_PROTOCOLS_STR, "http,https");
#else
    curl_easy_setopt(easy_, CURLOPT_PROTOCOLS, static_cast<long>(CURLPROTO_HTTP | CURLPROTO_HTTPS));
    curl_easy_setopt(easy_, CURLOPT_REDIR_PROTOCOLS, static_cast<long>(CURLPROTO_HTTP | CURLPROTO_HTTPS));
#endif

    if (request.method == "HEAD") {
        curl_easy_setopt(easy_, CURLOPT_NOBODY, 1L);
    } else if (request.method == "GET" || request.method.empty()) {
        curl_easy_setopt(easy_, CURLOPT_HTTPGET, 1L);
    } else {
        curl_easy_setopt(easy_, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    }

    // Timeouts: connect is bounded directly, reads by "less than one byte per
    // second for readTimeout", rounded up to whole seconds.
    curl_easy_setopt(easy_, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(request.connectTimeout.count()));
    long stallSeconds = static_cast<long>((request.readTimeout.count() + 999) / 1000);
    curl_easy_setopt(easy_, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(easy_, CURLOPT_LOW_SPEED_TIME, std::max(1L, stallSeconds));

    followRedirects_ = request.maxRedirects > 0;
    curl_easy_setopt(easy_, CURLOPT_FOLLOWLOCATION, followRedirects_ ? 1L : 0L);
    curl_easy_setopt(easy_, CURLOPT_MAXREDIRS, static_cast<long>(request.maxRedirects));

    if (!request.userAgent.empty()) {
        curl_easy_setopt(easy_, CURLOPT_USERAGENT, request.userAgent.c_str());
    }
    if (!request.headers.contains("Accept")) {
        headerList_ = curl_slist_append(headerList_, "Accept: */*");
    }
    for (const auto& entry : request.headers.entries()) {
        std::string line = entry.first + ": " + entry.second;
        headerList_ = curl_slist_append(headerList_, line.c_str());
    }
    if (headerList_ != nullptr) {
        curl_easy_setopt(easy_, CURLOPT_HTTPHEADER, headerList_);
    }

    curl_easy_setopt(easy_, CURLOPT_SSL_VERIFYPEER, options.verifyPeer ? 1L : 0L);
    curl_easy_setopt(easy_, CURLOPT_SSL_VERIFYHOST, options.verifyPeer ? 2L : 0L);
    if (!options.caFile.empty()) {
        curl_easy_setopt(easy_, CURLOPT_CAINFO, options.caFile.c_str());
    }

    curl_easy_setopt(easy_, CURLOPT_WRITEFUNCTION, &CurlHttpResponse::onWrite);
    curl_easy_setopt(easy_, CURLOPT_WRITEDATA, this);
    curl_easy_setopt(easy_, CURLOPT_HEADERFUNCTION, &CurlHttpResponse::onHeader);
    curl_easy_setopt(easy_, CURLOPT_HEADERDATA, this);
    curl_easy_setopt(easy_, CURLOPT_XFERINFOFUNCTION, &CurlHttpResponse::onProgress);
    curl_easy_setopt(easy_, CURLOPT_XFERINFODATA, this);
    curl_easy_setopt(easy_, CURLOPT_NOPROGRESS, 0L);

    CURLMcode added = curl_multi_add_handle(multi_, easy_);
    if (added != CURLM_OK) {
        return StartResult::error(UpstreamError(UpstreamError::Code::ConnectionFailed,
            std::string("curl_multi_add_handle failed: ") + curl_multi_strerror(added)));
    }
    attached_ = true;
    return StartResult::success();
}

core::Result<void, UpstreamError> CurlHttpResponse::awaitHead(const UpstreamRequest& request) {
    using HeadResult = core::Result<void, UpstreamError>;

    while (!headersDone_ && !transferDone_) {
        if (aborted_.load() || (request.isCancelled && request.isCancelled())) {
            return HeadResult::error(UpstreamError(UpstreamError::Code::Cancelled,
                "Request aborted"));
        }
        auto driven = drive();
        if (driven.isError()) {
            return driven;
        }
    }

    if (!headersDone_ && result_ != CURLE_OK) {
        return HeadResult::error(transferError());
    }

    long code = 0;
    if (curl_easy_getinfo(easy_, CURLINFO_RESPONSE_CODE, &code) == CURLE_OK && code != 0) {
        status_ = static_cast<int>(code);
    }
    if (status_ == 0) {
        return HeadResult::error(UpstreamError(UpstreamError::Code::Protocol,
            "No response status received"));
    }
    return HeadResult::success();
}

core::Result<std::size_t, UpstreamError> CurlHttpResponse::read(uint8_t* buffer, std::size_t capacity) {
    using ReadResult = core::Result<std::size_t, UpstreamError>;

    while (true) {
        if (aborted_.load()) {
            return ReadResult::error(UpstreamError(UpstreamError::Code::Cancelled,
                "Request aborted"));
        }

        std::size_t available = pending_.size() - pendingOffset_;
        if (available > 0) {
            std::size_t n = std::min(capacity, available);
            std::memcpy(buffer, pending_.data() + pendingOffset_, n);
            pendingOffset_ += n;
            if (pendingOffset_ == pending_.size()) {
                pending_.clear();
                pendingOffset_ = 0;
            }
            return ReadResult::success(n);
        }

        if (transferDone_) {
            if (result_ != CURLE_OK) {
                return ReadResult::error(transferError());
            }
            return ReadResult::success(0);
        }

        auto driven = drive();
        if (driven.isError()) {
            return ReadResult::error(driven.error());
        }
    }
}

core::Result<void, UpstreamError> CurlHttpResponse::drive() {
    using DriveResult = core::Result<void, UpstreamError>;

    std::size_t before = pending_.size();
    int running = 0;
    CURLMcode performed = curl_multi_perform(multi_, &running);
    if (performed != CURLM_OK) {
        return DriveResult::error(UpstreamError(UpstreamError::Code::Protocol,
            std::string("curl_multi_perform failed: ") + curl_multi_strerror(performed)));
    }
    collectDone();

    if (transferDone_ || pending_.size() != before || aborted_.load()) {
        return DriveResult::success();
    }

    CURLMcode polled = curl_multi_poll(multi_, nullptr, 0, POLL_SLICE_MS, nullptr);
    if (polled != CURLM_OK) {
        return DriveResult::error(UpstreamError(UpstreamError::Code::Protocol,
            std::string("curl_multi_poll failed: ") + curl_multi_strerror(polled)));
    }
    return DriveResult::success();
}

void CurlHttpResponse::collectDone() {
    int queued = 0;
    while (CURLMsg* message = curl_multi_info_read(multi_, &queued)) {
        if (message->msg == CURLMSG_DONE && message->easy_handle == easy_) {
            transferDone_ = true;
            result_ = message->data.result;
        }
    }
}

UpstreamError CurlHttpResponse::transferError() const {
    if (result_ == CURLE_ABORTED_BY_CALLBACK || aborted_.load()) {
        return UpstreamError(UpstreamError::Code::Cancelled, "Request aborted");
    }
    std::string detail = errorBuffer_[0] != '\0' ? std::string(errorBuffer_)
                                                 : std::string(curl_easy_strerror(result_));
    return upstreamErrorFromCurl(result_, detail);
}

size_t CurlHttpResponse::onWrite(char* data, size_t size, size_t count, void* userdata) {
    auto* self = static_cast<CurlHttpResponse*>(userdata);
    size_t total = size * count;
    // Bodies of interim responses never reach the caller.
    if (self->headersDone_) {
        self->pending_.append(data, total);
    }
    return total;
}

size_t CurlHttpResponse::onHeader(char* data, size_t size, size_t count, void* userdata) {
    auto* self = static_cast<CurlHttpResponse*>(userdata);
    size_t total = size * count;
    std::string line = trimLine(data, total);

    if (self->headersDone_) {
        // Trailers
        return total;
    }

    if (line.compare(0, 5, "HTTP/") == 0) {
        self->headers_ = HttpHeaders();
        self->status_ = 0;
        std::size_t space = line.find(' ');
        if (space != std::string::npos) {
            self->status_ = std::atoi(line.c_str() + space + 1);
        }
        return total;
    }

    if (line.empty()) {
        bool interim = self->status_ >= 100 && self->status_ < 200;
        bool followed = self->followRedirects_ && isRedirectStatus(self->status_) &&
                        self->headers_.contains("Location");
        if (!interim && !followed) {
            self->headersDone_ = true;
        }
        return total;
    }

    std::size_t colon = line.find(':');
    if (colon != std::string::npos) {
        std::string name = trimLine(line.data(), colon);
        std::string value = trimLine(line.data() + colon + 1, line.size() - colon - 1);
        self->headers_.add(std::move(name), std::move(value));
    }
    return total;
}

int CurlHttpResponse::onProgress(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* self = static_cast<CurlHttpResponse*>(userdata);
    if (self->aborted_.load()) {
        return 1;
    }
    if (!self->headersDone_ && self->isCancelled_ && self->isCancelled_()) {
        return 1;
    }
    return 0;
}

} // anonymous namespace

// =============================================================================
// Error mapping
// =============================================================================

UpstreamError upstreamErrorFromCurl(CURLcode code, const std::string& detail) {
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            return UpstreamError(UpstreamError::Code::Timeout, detail);
        case CURLE_COULDNT_CONNECT:
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CACERT_BADFILE:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
            return UpstreamError(UpstreamError::Code::ConnectionFailed, detail);
        case CURLE_ABORTED_BY_CALLBACK:
            return UpstreamError(UpstreamError::Code::Cancelled, detail);
        case CURLE_TOO_MANY_REDIRECTS:
            return UpstreamError(UpstreamError::Code::Protocol, "Too many redirects: " + detail);
        case CURLE_UNSUPPORTED_PROTOCOL:
        case CURLE_URL_MALFORMAT:
        default:
            return UpstreamError(UpstreamError::Code::Protocol, detail);
    }
}

// =============================================================================
// CurlHttpClient
// =============================================================================

CurlHttpClient::CurlHttpClient(CurlHttpClientOptions options)
    : options_(std::move(options)) {
    ensureCurlGlobal();
}

core::Result<std::unique_ptr<IUpstreamResponse>, UpstreamError>
CurlHttpClient::open(const UpstreamRequest& request) {
    using OpenResult = core::Result<std::unique_ptr<IUpstreamResponse>, UpstreamError>;

    auto parsed = core::parseUrl(request.url);
    if (parsed.isError()) {
        return OpenResult::error(UpstreamError(UpstreamError::Code::Protocol,
            "Invalid upstream URL: " + parsed.error().message));
    }

    auto response = std::make_unique<CurlHttpResponse>(request.isCancelled);
    auto started = response->start(request, options_);
    if (started.isError()) {
        return OpenResult::error(started.error());
    }

    auto head = response->awaitHead(request);
    if (head.isError()) {
        return OpenResult::error(head.error());
    }

    return OpenResult::success(std::unique_ptr<IUpstreamResponse>(std::move(response)));
}

} // namespace net
} // namespace iptvmux
