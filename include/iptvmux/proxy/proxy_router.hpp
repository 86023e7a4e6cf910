// IptvMux - IPTV Stream Multiplexing Proxy
// Proxy Router - Maps request paths onto the proxy endpoints

#ifndef IPTVMUX_PROXY_PROXY_ROUTER_HPP
#define IPTVMUX_PROXY_PROXY_ROUTER_HPP

#include "iptvmux/core/structured_logger.hpp"
#include "iptvmux/net/http_server.hpp"
#include "iptvmux/proxy/admin_api.hpp"
#include "iptvmux/proxy/connectivity_probe.hpp"
#include "iptvmux/proxy/stream_proxy.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace iptvmux {
namespace proxy {

/**
 * @brief Parse a non-negative decimal id or count; std::nullopt unless all digits.
 */
std::optional<int64_t> parseDecimal(const std::string& text);

/**
 * @brief Request dispatcher installed as the HttpServer handler.
 *
 * Routes:
 * - GET  /stream/{account}/{stream}.ts and .m3u8  stream delivery
 * - GET  /stream/{account}/status                 credential status
 * - GET  /stream/active[?account_id=N]            active connection slots
 * - GET  /stream/multiplexer                      shared stream snapshot
 * - POST /stream/{token}/release                  release one slot
 * - POST /stream/cleanup[?account_id=N&timeout=S] stale slot cleanup
 * - GET  /stream/{account}/{stream}/test          connectivity probe
 */
class ProxyRouter {
public:
    ProxyRouter(std::shared_ptr<StreamProxy> streamProxy,
                std::shared_ptr<AdminApi> adminApi,
                std::shared_ptr<ConnectivityProbe> probe,
                std::shared_ptr<core::StructuredLogger> logger);

    void handle(const net::HttpRequest& request, net::HttpResponseWriter& response);

    /**
     * @brief Handler bound to this router. The router must outlive the server.
     */
    net::HttpHandler handler();

private:
    void routeStream(const net::HttpRequest& request, net::HttpResponseWriter& response,
                     const std::vector<std::string>& segments);
    bool requireMethod(const net::HttpRequest& request, net::HttpResponseWriter& response,
                       const char* method);
    static void sendAdmin(net::HttpResponseWriter& response, const AdminResponse& admin);

    std::shared_ptr<StreamProxy> streamProxy_;
    std::shared_ptr<AdminApi> adminApi_;
    std::shared_ptr<ConnectivityProbe> probe_;
    std::shared_ptr<core::StructuredLogger> logger_;
};

} // namespace proxy
} // namespace iptvmux

#endif // IPTVMUX_PROXY_PROXY_ROUTER_HPP
