// IptvMux - IPTV Stream Multiplexing Proxy
// Proxy Router Implementation

#include "iptvmux/proxy/proxy_router.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>

namespace iptvmux {
namespace proxy {

namespace {

constexpr int64_t DEFAULT_CLEANUP_TIMEOUT_SECONDS = 30;

std::vector<std::string> splitPath(const std::string& path) {
    std::vector<std::string> segments;
    std::size_t start = 0;
    while (start <= path.size()) {
        std::size_t slash = path.find('/', start);
        if (slash == std::string::npos) {
            slash = path.size();
        }
        if (slash > start) {
            segments.push_back(path.substr(start, slash - start));
        }
        start = slash + 1;
    }
    return segments;
}

} // anonymous namespace

std::optional<int64_t> parseDecimal(const std::string& text) {
    if (text.empty() || text.size() > 18) {
        return std::nullopt;
    }
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
    }
    errno = 0;
    long long value = std::strtoll(text.c_str(), nullptr, 10);
    if (errno != 0) {
        return std::nullopt;
    }
    return static_cast<int64_t>(value);
}

ProxyRouter::ProxyRouter(std::shared_ptr<StreamProxy> streamProxy,
                         std::shared_ptr<AdminApi> adminApi,
                         std::shared_ptr<ConnectivityProbe> probe,
                         std::shared_ptr<core::StructuredLogger> logger)
    : streamProxy_(std::move(streamProxy))
    , adminApi_(std::move(adminApi))
    , probe_(std::move(probe))
    , logger_(logger ? std::move(logger) : std::make_shared<core::StructuredLogger>()) {
}

net::HttpHandler ProxyRouter::handler() {
    return [this](const net::HttpRequest& request, net::HttpResponseWriter& response) {
        handle(request, response);
    };
}

void ProxyRouter::handle(const net::HttpRequest& request, net::HttpResponseWriter& response) {
    std::vector<std::string> segments = splitPath(request.path);
    if (segments.size() < 2 || segments[0] != "stream") {
        sendJsonError(response, 404, "Not found");
        return;
    }
    routeStream(request, response, segments);
}

void ProxyRouter::routeStream(const net::HttpRequest& request, net::HttpResponseWriter& response,
                              const std::vector<std::string>& segments) {
    if (segments.size() == 2) {
        const std::string& action = segments[1];

        if (action == "active") {
            if (!requireMethod(request, response, "GET")) return;
            std::optional<core::AccountId> accountId;
            if (auto param = request.queryParam("account_id")) {
                accountId = parseDecimal(*param);
                if (!accountId) {
                    sendJsonError(response, 400, "Invalid account_id");
                    return;
                }
            }
            sendAdmin(response, adminApi_->activeConnections(accountId));
            return;
        }

        if (action == "multiplexer") {
            if (!requireMethod(request, response, "GET")) return;
            sendAdmin(response, adminApi_->multiplexerStats());
            return;
        }

        if (action == "cleanup") {
            if (!requireMethod(request, response, "POST")) return;
            std::optional<core::AccountId> accountId;
            if (auto param = request.queryParam("account_id")) {
                accountId = parseDecimal(*param);
                if (!accountId) {
                    sendJsonError(response, 400, "Invalid account_id");
                    return;
                }
            }
            int64_t timeout = DEFAULT_CLEANUP_TIMEOUT_SECONDS;
            if (auto param = request.queryParam("timeout")) {
                auto parsed = parseDecimal(*param);
                if (!parsed) {
                    sendJsonError(response, 400, "Invalid timeout");
                    return;
                }
                timeout = *parsed;
            }
            sendAdmin(response, adminApi_->cleanup(accountId, std::chrono::seconds(timeout)));
            return;
        }

        sendJsonError(response, 404, "Not found");
        return;
    }

    if (segments.size() == 3) {
        const std::string& last = segments[2];

        if (last == "release") {
            if (!requireMethod(request, response, "POST")) return;
            sendAdmin(response, adminApi_->releaseConnection(segments[1]));
            return;
        }

        auto accountId = parseDecimal(segments[1]);
        if (!accountId) {
            sendJsonError(response, 404, "Not found");
            return;
        }

        if (last == "status") {
            if (!requireMethod(request, response, "GET")) return;
            sendAdmin(response, adminApi_->accountStatus(*accountId));
            return;
        }

        std::size_t dot = last.rfind('.');
        if (dot == std::string::npos || dot == 0) {
            sendJsonError(response, 404, "Not found");
            return;
        }
        auto format = core::parseStreamFormat(last.substr(dot + 1));
        if (!format) {
            sendJsonError(response, 404, "Not found");
            return;
        }
        if (!requireMethod(request, response, "GET")) return;
        streamProxy_->handle(request, response, *accountId, last.substr(0, dot), *format);
        return;
    }

    if (segments.size() == 4 && segments[3] == "test") {
        auto accountId = parseDecimal(segments[1]);
        if (!accountId) {
            sendJsonError(response, 404, "Not found");
            return;
        }
        if (!requireMethod(request, response, "GET")) return;

        ProbeResult result = probe_->probe(*accountId, segments[2]);
        response.setStatus(result.httpStatus);
        response.setHeader("Content-Type", "application/json");
        response.send(result.toJson());
        return;
    }

    sendJsonError(response, 404, "Not found");
}

bool ProxyRouter::requireMethod(const net::HttpRequest& request, net::HttpResponseWriter& response,
                                const char* method) {
    if (request.method == method) {
        return true;
    }
    response.setHeader("Allow", method);
    sendJsonError(response, 405, "Method not allowed");
    return false;
}

void ProxyRouter::sendAdmin(net::HttpResponseWriter& response, const AdminResponse& admin) {
    response.setStatus(admin.status);
    response.setHeader("Content-Type", "application/json");
    response.send(admin.body);
}

} // namespace proxy
} // namespace iptvmux
