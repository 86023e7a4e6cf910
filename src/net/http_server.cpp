// IptvMux - IPTV Stream Multiplexing Proxy
// Minimal HTTP/1.1 server implementation

#include "iptvmux/net/http_server.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>

namespace iptvmux {
namespace net {

namespace {

constexpr int ACCEPT_POLL_MS = 200;

std::string peerAddress(const sockaddr_storage& addr) {
    char buf[INET6_ADDRSTRLEN] = {0};
    if (addr.ss_family == AF_INET) {
        const auto* v4 = reinterpret_cast<const sockaddr_in*>(&addr);
        inet_ntop(AF_INET, &v4->sin_addr, buf, sizeof(buf));
    } else if (addr.ss_family == AF_INET6) {
        const auto* v6 = reinterpret_cast<const sockaddr_in6*>(&addr);
        inet_ntop(AF_INET6, &v6->sin6_addr, buf, sizeof(buf));
    }
    return buf;
}

timeval toTimeval(std::chrono::milliseconds ms) {
    timeval tv;
    tv.tv_sec = static_cast<time_t>(ms.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((ms.count() % 1000) * 1000);
    return tv;
}

bool sendRaw(int fd, const char* data, size_t size) {
    size_t sent = 0;
    while (sent < size) {
        ssize_t n = ::send(fd, data + sent, size - sent, MSG_NOSIGNAL);
        if (n > 0) {
            sent += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        return false;
    }
    return true;
}

void sendSimpleResponse(int fd, int status, const std::string& body) {
    std::string response = "HTTP/1.1 " + std::to_string(status) + " " + reasonPhrase(status) + "\r\n";
    response += "Content-Type: text/plain\r\n";
    response += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    response += "Connection: close\r\n\r\n";
    response += body;
    sendRaw(fd, response.data(), response.size());
}

} // anonymous namespace

// =============================================================================
// HttpResponseWriter
// =============================================================================

HttpResponseWriter::HttpResponseWriter(int fd, bool headRequest)
    : fd_(fd)
    , headRequest_(headRequest) {
}

void HttpResponseWriter::setStatus(int statusCode) {
    statusCode_ = statusCode;
}

void HttpResponseWriter::setHeader(const std::string& name, std::string value) {
    headers_.set(name, std::move(value));
}

bool HttpResponseWriter::send(const std::string& body) {
    if (headersSent_) {
        return false;
    }
    if (!sendHead(false, body.size())) {
        return false;
    }
    if (headRequest_ || body.empty()) {
        return true;
    }
    if (!sendAll(body.data(), body.size())) {
        return false;
    }
    bodyBytes_ += body.size();
    return true;
}

bool HttpResponseWriter::beginChunked() {
    if (headersSent_) {
        return false;
    }
    chunked_ = true;
    return sendHead(true, 0);
}

bool HttpResponseWriter::writeChunk(const uint8_t* data, std::size_t size) {
    if (!chunked_ || failed_) {
        return false;
    }
    if (headRequest_ || size == 0) {
        return true;
    }

    char prefix[32];
    int len = std::snprintf(prefix, sizeof(prefix), "%zx\r\n", size);
    if (!sendAll(prefix, static_cast<size_t>(len)) ||
        !sendAll(reinterpret_cast<const char*>(data), size) ||
        !sendAll("\r\n", 2)) {
        return false;
    }
    bodyBytes_ += size;
    return true;
}

bool HttpResponseWriter::finishChunked() {
    if (!chunked_ || failed_) {
        return false;
    }
    if (headRequest_) {
        return true;
    }
    return sendAll("0\r\n\r\n", 5);
}

bool HttpResponseWriter::sendHead(bool chunked, std::size_t contentLength) {
    std::string head = "HTTP/1.1 " + std::to_string(statusCode_) + " " +
                       reasonPhrase(statusCode_) + "\r\n";
    for (const auto& entry : headers_.entries()) {
        head += entry.first + ": " + entry.second + "\r\n";
    }
    if (chunked) {
        head += "Transfer-Encoding: chunked\r\n";
    } else {
        head += "Content-Length: " + std::to_string(contentLength) + "\r\n";
    }
    head += "Connection: close\r\n\r\n";

    headersSent_ = true;
    return sendAll(head.data(), head.size());
}

bool HttpResponseWriter::sendAll(const char* data, std::size_t size) {
    if (failed_) {
        return false;
    }
    if (!sendRaw(fd_, data, size)) {
        failed_ = true;
        return false;
    }
    return true;
}

// =============================================================================
// HttpServer
// =============================================================================

HttpServer::HttpServer(HttpServerConfig config,
                       HttpHandler handler,
                       std::shared_ptr<core::StructuredLogger> logger)
    : config_(std::move(config))
    , handler_(std::move(handler))
    , logger_(logger ? std::move(logger) : std::make_shared<core::StructuredLogger>()) {
}

HttpServer::~HttpServer() {
    stop();
}

core::Result<void, HttpServerError> HttpServer::start() {
    using VoidResult = core::Result<void, HttpServerError>;

    std::lock_guard<std::mutex> lifecycle(lifecycleMutex_);
    if (running_.load()) {
        return VoidResult::error(HttpServerError(HttpServerError::Code::AlreadyRunning,
                                                 "Server is already running"));
    }

    sockaddr_storage addr;
    std::memset(&addr, 0, sizeof(addr));
    socklen_t addrLen = 0;
    int family = AF_INET;

    auto* v4 = reinterpret_cast<sockaddr_in*>(&addr);
    auto* v6 = reinterpret_cast<sockaddr_in6*>(&addr);
    if (inet_pton(AF_INET, config_.bindAddress.c_str(), &v4->sin_addr) == 1) {
        v4->sin_family = AF_INET;
        v4->sin_port = htons(config_.port);
        addrLen = sizeof(sockaddr_in);
    } else if (inet_pton(AF_INET6, config_.bindAddress.c_str(), &v6->sin6_addr) == 1) {
        family = AF_INET6;
        v6->sin6_family = AF_INET6;
        v6->sin6_port = htons(config_.port);
        addrLen = sizeof(sockaddr_in6);
    } else {
        return VoidResult::error(HttpServerError(HttpServerError::Code::InvalidAddress,
                                                 "Invalid bind address: " + config_.bindAddress));
    }

    int fd = ::socket(family, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        return VoidResult::error(HttpServerError(HttpServerError::Code::SocketFailed,
            std::string("socket() failed: ") + std::strerror(errno)));
    }

    int opt = 1;
    setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), addrLen) < 0) {
        std::string message = "bind() to " + config_.bindAddress + ":" +
                              std::to_string(config_.port) + " failed: " + std::strerror(errno);
        ::close(fd);
        return VoidResult::error(HttpServerError(HttpServerError::Code::BindFailed, message));
    }

    if (::listen(fd, SOMAXCONN) < 0) {
        std::string message = std::string("listen() failed: ") + std::strerror(errno);
        ::close(fd);
        return VoidResult::error(HttpServerError(HttpServerError::Code::ListenFailed, message));
    }

    sockaddr_storage bound;
    socklen_t boundLen = sizeof(bound);
    boundPort_ = config_.port;
    if (getsockname(fd, reinterpret_cast<sockaddr*>(&bound), &boundLen) == 0) {
        boundPort_ = ntohs(bound.ss_family == AF_INET6
            ? reinterpret_cast<sockaddr_in6*>(&bound)->sin6_port
            : reinterpret_cast<sockaddr_in*>(&bound)->sin_port);
    }

    listenFd_ = fd;
    running_.store(true);
    acceptThread_ = std::thread(&HttpServer::acceptLoop, this);

    logger_->info("HTTP server listening on " + config_.bindAddress + ":" +
                  std::to_string(boundPort_), "Http");
    return VoidResult::success();
}

void HttpServer::stop() {
    std::lock_guard<std::mutex> lifecycle(lifecycleMutex_);
    if (!running_.exchange(false)) {
        return;
    }

    if (acceptThread_.joinable()) {
        acceptThread_.join();
    }
    if (listenFd_ >= 0) {
        ::close(listenFd_);
        listenFd_ = -1;
    }

    std::list<ClientConnection> remaining;
    {
        std::lock_guard<std::mutex> lock(connectionsMutex_);
        for (auto& conn : connections_) {
            ::shutdown(conn.fd, SHUT_RDWR);
        }
        remaining.swap(connections_);
    }

    for (auto& conn : remaining) {
        if (conn.thread.joinable()) {
            conn.thread.join();
        }
        ::close(conn.fd);
    }

    logger_->info("HTTP server stopped", "Http");
}

bool HttpServer::isRunning() const {
    return running_.load();
}

uint16_t HttpServer::port() const {
    return boundPort_;
}

std::size_t HttpServer::activeConnections() const {
    std::lock_guard<std::mutex> lock(connectionsMutex_);
    std::size_t count = 0;
    for (const auto& conn : connections_) {
        if (!conn.finished->load()) {
            ++count;
        }
    }
    return count;
}

void HttpServer::acceptLoop() {
    while (running_.load()) {
        pollfd pfd;
        pfd.fd = listenFd_;
        pfd.events = POLLIN;
        pfd.revents = 0;

        int rc = ::poll(&pfd, 1, ACCEPT_POLL_MS);
        reapFinishedConnections();
        if (rc <= 0) {
            continue;
        }

        sockaddr_storage peer;
        socklen_t peerLen = sizeof(peer);
        int fd = ::accept4(listenFd_, reinterpret_cast<sockaddr*>(&peer), &peerLen, SOCK_CLOEXEC);
        if (fd < 0) {
            if (errno != EINTR && errno != EAGAIN && errno != ECONNABORTED) {
                logger_->warning(std::string("accept() failed: ") + std::strerror(errno), "Http");
            }
            continue;
        }

        timeval sendTimeout = toTimeval(config_.sendTimeout);
        setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &sendTimeout, sizeof(sendTimeout));

        if (activeConnections() >= config_.maxConnections) {
            rejectBusy(fd);
            continue;
        }

        std::string clientIp = peerAddress(peer);
        std::lock_guard<std::mutex> lock(connectionsMutex_);
        connections_.emplace_back();
        ClientConnection& conn = connections_.back();
        conn.fd = fd;
        conn.clientIp = clientIp;
        conn.finished = std::make_shared<std::atomic<bool>>(false);
        auto finished = conn.finished;
        conn.thread = std::thread([this, fd, clientIp, finished]() {
            serveConnection(fd, clientIp);
            finished->store(true);
        });
    }
}

void HttpServer::serveConnection(int fd, const std::string& clientIp) {
    std::string received;
    size_t headEnd = std::string::npos;
    char block[4096];
    auto deadline = std::chrono::steady_clock::now() + config_.headerTimeout;

    while (headEnd == std::string::npos) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            sendSimpleResponse(fd, 408, "Request timeout\n");
            ::shutdown(fd, SHUT_WR);
            return;
        }

        pollfd pfd;
        pfd.fd = fd;
        pfd.events = POLLIN;
        pfd.revents = 0;
        int rc = ::poll(&pfd, 1, static_cast<int>(remaining));
        if (rc < 0 && errno == EINTR) {
            continue;
        }
        if (rc <= 0) {
            continue;
        }

        ssize_t n = ::recv(fd, block, sizeof(block), 0);
        if (n <= 0) {
            if (n < 0 && errno == EINTR) {
                continue;
            }
            return;  // client went away before sending a request
        }
        received.append(block, static_cast<size_t>(n));
        headEnd = received.find("\r\n\r\n");
        if (headEnd == std::string::npos && received.size() > config_.maxHeaderBytes) {
            sendSimpleResponse(fd, 431, "Request header too large\n");
            ::shutdown(fd, SHUT_WR);
            return;
        }
    }

    auto parsed = parseRequestHead(received.substr(0, headEnd));
    if (parsed.isError()) {
        int status = parsed.error().code == HttpParseError::Code::UnsupportedVersion ? 505 : 400;
        logger_->debug("Rejected request from " + clientIp + ": " + parsed.error().message, "Http");
        sendSimpleResponse(fd, status, parsed.error().message + "\n");
        ::shutdown(fd, SHUT_WR);
        return;
    }

    HttpRequest request = std::move(parsed).value();
    request.clientIp = clientIp;

    HttpResponseWriter writer(fd, request.method == "HEAD");
    try {
        handler_(request, writer);
    } catch (const std::exception& e) {
        logger_->error("Handler failed for " + request.method + " " + request.path +
                       ": " + e.what(), "Http");
    }

    if (!writer.headersSent()) {
        writer.setStatus(500);
        writer.setHeader("Content-Type", "text/plain");
        writer.send("Internal server error\n");
    }

    logger_->debug(request.method + " " + request.path + " from " + clientIp +
                   " -> " + std::to_string(writer.statusCode()) + " (" +
                   std::to_string(writer.bodyBytesSent()) + " bytes)", "Http");

    ::shutdown(fd, SHUT_WR);
}

void HttpServer::reapFinishedConnections() {
    std::lock_guard<std::mutex> lock(connectionsMutex_);
    for (auto it = connections_.begin(); it != connections_.end();) {
        if (it->finished->load()) {
            if (it->thread.joinable()) {
                it->thread.join();
            }
            ::close(it->fd);
            it = connections_.erase(it);
        } else {
            ++it;
        }
    }
}

void HttpServer::rejectBusy(int fd) {
    logger_->warning("Connection limit reached (" + std::to_string(config_.maxConnections) +
                     "), rejecting client", "Http");
    sendSimpleResponse(fd, 503, "Server busy\n");
    ::shutdown(fd, SHUT_WR);
    ::close(fd);
}

} // namespace net
} // namespace iptvmux
