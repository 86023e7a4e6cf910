// IptvMux - IPTV Stream Multiplexing Proxy
// Stream Proxy - Stream delivery endpoint
//
// Responsibilities:
// - Resolve the account and decide between joining and creating a stream
// - Acquire a credential slot, releasing idle streams and retrying once
//   when the account is exhausted
// - Build the provider URL and subscribe through the StreamRegistry
// - Wait for the upstream handshake and map failures to HTTP statuses
// - Write the chunked response body from the subscriber's ChunkStream

#ifndef IPTVMUX_PROXY_STREAM_PROXY_HPP
#define IPTVMUX_PROXY_STREAM_PROXY_HPP

#include "iptvmux/admission/account_store.hpp"
#include "iptvmux/admission/credential_store.hpp"
#include "iptvmux/core/config_manager.hpp"
#include "iptvmux/core/result.hpp"
#include "iptvmux/core/structured_logger.hpp"
#include "iptvmux/net/http_server.hpp"
#include "iptvmux/net/upstream_client.hpp"
#include "iptvmux/streaming/stream_registry.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace iptvmux {
namespace proxy {

/**
 * @brief HTTP status and client message for an upstream failure.
 */
struct HttpFailure {
    int status = 502;
    std::string message;

    HttpFailure() = default;
    HttpFailure(int s, std::string msg)
        : status(s), message(std::move(msg)) {}
};

/**
 * @brief Map a classified upstream failure to the status sent to clients.
 *
 * Timeout 504, connection failure 502, upstream 404 404, upstream 401 or
 * 403 403, anything else 502.
 */
HttpFailure statusForUpstreamError(const net::UpstreamError& error);

/**
 * @brief Write a {"error": ..., "status": ...} JSON response.
 */
void sendJsonError(net::HttpResponseWriter& response, int status, const std::string& message);

/**
 * @brief Stream delivery settings.
 */
struct StreamProxyConfig {
    std::chrono::milliseconds connectTimeout{60000};
    std::chrono::milliseconds connectGrace{5000};       ///< Added to connectTimeout when waiting
    std::chrono::milliseconds idleReleasePause{500};    ///< Pause before the admission retry
    std::string defaultUserAgent = "okhttp/3.14.9";

    static StreamProxyConfig fromConfig(const core::Configuration& config);
};

/**
 * @brief A subscription whose upstream is connected, ready to deliver.
 */
struct OpenedStream {
    streaming::Subscription subscription;
    bool joined = false;    ///< Attached to a stream another request created
};

/**
 * @brief Stream delivery endpoint.
 *
 * ## Thread Safety
 * Stateless apart from its collaborators; handle() runs concurrently on
 * the HTTP server's connection threads.
 */
class StreamProxy {
public:
    StreamProxy(StreamProxyConfig config,
                std::shared_ptr<admission::IAccountStore> accounts,
                std::shared_ptr<admission::ICredentialStore> credentials,
                std::shared_ptr<streaming::StreamRegistry> registry,
                std::shared_ptr<core::StructuredLogger> logger);

    /**
     * @brief Admission, subscription and upstream handshake.
     *
     * On failure nothing stays subscribed and no slot stays charged.
     */
    core::Result<OpenedStream, HttpFailure> open(core::AccountId accountId,
                                                 const std::string& streamId,
                                                 core::StreamFormat format,
                                                 const std::string& clientIp);

    /**
     * @brief Serve GET /stream/{account}/{stream}.{format}.
     */
    void handle(const net::HttpRequest& request,
                net::HttpResponseWriter& response,
                core::AccountId accountId,
                const std::string& streamId,
                core::StreamFormat format);

private:
    core::Result<OpenedStream, HttpFailure> create(const admission::Account& account,
                                                   const std::string& streamId,
                                                   core::StreamFormat format,
                                                   const std::string& clientIp);

    core::Result<OpenedStream, HttpFailure> awaitConnected(OpenedStream opened);

    StreamProxyConfig config_;
    std::shared_ptr<admission::IAccountStore> accounts_;
    std::shared_ptr<admission::ICredentialStore> credentials_;
    std::shared_ptr<streaming::StreamRegistry> registry_;
    std::shared_ptr<core::StructuredLogger> logger_;
};

} // namespace proxy
} // namespace iptvmux

#endif // IPTVMUX_PROXY_STREAM_PROXY_HPP
