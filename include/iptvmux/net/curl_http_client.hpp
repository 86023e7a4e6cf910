// IptvMux - IPTV Stream Multiplexing Proxy
// Upstream HTTP client on libcurl
//
// Responsibilities:
// - Bounded connect timeout and a read-inactivity limit (low speed limit)
// - Redirect following up to the request's limit
// - Incremental body reads through the curl multi interface, so a caller
//   pulls bytes at its own pace and abort() wakes a blocked read
// - Classify curl failures into UpstreamError codes

#ifndef IPTVMUX_NET_CURL_HTTP_CLIENT_HPP
#define IPTVMUX_NET_CURL_HTTP_CLIENT_HPP

#include "iptvmux/net/upstream_client.hpp"

#include <curl/curl.h>

#include <string>

namespace iptvmux {
namespace net {

/**
 * @brief TLS settings of the curl client.
 */
struct CurlHttpClientOptions {
    bool verifyPeer = true;   ///< Verify certificate chain and host name
    std::string caFile;       ///< CA bundle, libcurl default when empty
};

/**
 * @brief Map a finished transfer's curl code to an upstream error.
 */
UpstreamError upstreamErrorFromCurl(CURLcode code, const std::string& detail);

/**
 * @brief IUpstreamClient backed by libcurl.
 *
 * Each open() creates its own easy and multi handle; the response owns
 * both. libcurl is initialised globally on first construction.
 *
 * ## Thread Safety
 * open() may be called concurrently. Each returned response belongs to
 * the calling thread except for abort().
 */
class CurlHttpClient : public IUpstreamClient {
public:
    explicit CurlHttpClient(CurlHttpClientOptions options = CurlHttpClientOptions());
    ~CurlHttpClient() override = default;

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    core::Result<std::unique_ptr<IUpstreamResponse>, UpstreamError>
    open(const UpstreamRequest& request) override;

private:
    CurlHttpClientOptions options_;
};

} // namespace net
} // namespace iptvmux

#endif // IPTVMUX_NET_CURL_HTTP_CLIENT_HPP
