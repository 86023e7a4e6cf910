// IptvMux - IPTV Stream Multiplexing Proxy
// Upstream HTTP client abstraction
//
// The multiplexer only ever talks to a provider through IUpstreamClient,
// so tests can substitute a scripted fake and count upstream requests.

#ifndef IPTVMUX_NET_UPSTREAM_CLIENT_HPP
#define IPTVMUX_NET_UPSTREAM_CLIENT_HPP

#include "iptvmux/core/error_codes.hpp"
#include "iptvmux/core/result.hpp"
#include "iptvmux/net/http_types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace iptvmux {
namespace net {

/**
 * @brief Classified failure of an upstream request.
 *
 * The code decides how the failure is reported to clients; the message
 * carries detail for logs.
 */
struct UpstreamError {
    enum class Code {
        Timeout,           ///< Connect or read exceeded its timeout
        ConnectionFailed,  ///< Resolve, connect, TLS or socket failure
        HttpStatus,        ///< Upstream answered with a non-2xx status
        Protocol,          ///< Unparseable response
        Cancelled          ///< Aborted locally
    };

    Code code = Code::ConnectionFailed;
    int httpStatus = 0;    ///< Set for Code::HttpStatus
    std::string message;

    UpstreamError() = default;
    UpstreamError(Code c, std::string msg, int status = 0)
        : code(c), httpStatus(status), message(std::move(msg)) {}

    /**
     * @brief Render as "Upstream timeout: ...", "Connection error: ...",
     *        "HTTP error: <status>", "Protocol error: ..." or "Cancelled: ...".
     */
    [[nodiscard]] std::string toString() const;

    /**
     * @brief Matching code for log context.
     */
    [[nodiscard]] core::ErrorCode toErrorCode() const;
};

/**
 * @brief One upstream request.
 */
struct UpstreamRequest {
    std::string url;
    std::string method = "GET";
    std::string userAgent;
    HttpHeaders headers;
    std::chrono::milliseconds connectTimeout{60000};
    std::chrono::milliseconds readTimeout{120000};   ///< Max gap between received bytes
    uint32_t maxRedirects = 5;

    // Polled while connecting; returning true abandons the attempt.
    std::function<bool()> isCancelled;
};

/**
 * @brief Open upstream response whose body is read incrementally.
 *
 * read() is called from a single thread. abort() may be called from any
 * thread and makes a blocked or later read() return Code::Cancelled.
 */
class IUpstreamResponse {
public:
    virtual ~IUpstreamResponse() = default;

    virtual int statusCode() const = 0;

    /**
     * @brief Response header value (case-insensitive name).
     */
    virtual std::optional<std::string> header(const std::string& name) const = 0;

    /**
     * @brief Read up to capacity body bytes.
     * @return Bytes read, 0 at end of body
     */
    virtual core::Result<std::size_t, UpstreamError> read(uint8_t* buffer, std::size_t capacity) = 0;

    virtual void abort() = 0;
};

/**
 * @brief Factory for upstream responses.
 */
class IUpstreamClient {
public:
    virtual ~IUpstreamClient() = default;

    /**
     * @brief Connect, send the request and read the response head.
     *
     * Redirects are followed up to request.maxRedirects. Non-2xx statuses
     * are returned as a response, not as an error.
     */
    virtual core::Result<std::unique_ptr<IUpstreamResponse>, UpstreamError>
    open(const UpstreamRequest& request) = 0;
};

} // namespace net
} // namespace iptvmux

#endif // IPTVMUX_NET_UPSTREAM_CLIENT_HPP
