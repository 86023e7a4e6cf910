// IptvMux - IPTV Stream Multiplexing Proxy
// Minimal HTTP/1.1 server
//
// Responsibilities:
// - Blocking accept loop on its own thread
// - One handler thread per client connection, bounded by maxConnections
// - Request head parsing and dispatch to a single handler function
// - Fixed-length and chunked responses, "Connection: close" semantics
// - Orderly stop: close the listener, shut open sockets down, join threads

#ifndef IPTVMUX_NET_HTTP_SERVER_HPP
#define IPTVMUX_NET_HTTP_SERVER_HPP

#include "iptvmux/core/result.hpp"
#include "iptvmux/core/structured_logger.hpp"
#include "iptvmux/net/http_types.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace iptvmux {
namespace net {

/**
 * @brief Server startup error.
 */
struct HttpServerError {
    enum class Code {
        AlreadyRunning,
        InvalidAddress,
        SocketFailed,
        BindFailed,
        ListenFailed
    };

    Code code = Code::SocketFailed;
    std::string message;

    HttpServerError() = default;
    HttpServerError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
};

/**
 * @brief Writes one response to a client socket.
 *
 * Either send() once, or beginChunked() followed by writeChunk() calls and
 * finishChunked(). Write failures (client gone, send timeout) are returned
 * as false and make every later call fail as well.
 */
class HttpResponseWriter {
public:
    HttpResponseWriter(int fd, bool headRequest);

    HttpResponseWriter(const HttpResponseWriter&) = delete;
    HttpResponseWriter& operator=(const HttpResponseWriter&) = delete;

    void setStatus(int statusCode);
    void setHeader(const std::string& name, std::string value);

    /**
     * @brief Send status, headers and a complete body.
     */
    bool send(const std::string& body);

    /**
     * @brief Send status and headers announcing a chunked body.
     */
    bool beginChunked();

    bool writeChunk(const uint8_t* data, std::size_t size);

    /**
     * @brief Send the terminating zero-length chunk.
     */
    bool finishChunked();

    int statusCode() const { return statusCode_; }
    bool headersSent() const { return headersSent_; }
    bool failed() const { return failed_; }
    uint64_t bodyBytesSent() const { return bodyBytes_; }

private:
    bool sendHead(bool chunked, std::size_t contentLength);
    bool sendAll(const char* data, std::size_t size);

    int fd_;
    bool headRequest_;
    int statusCode_ = 200;
    HttpHeaders headers_;
    bool headersSent_ = false;
    bool chunked_ = false;
    bool failed_ = false;
    uint64_t bodyBytes_ = 0;
};

/**
 * @brief Request handler. Runs on the connection's thread and may block.
 */
using HttpHandler = std::function<void(const HttpRequest& request, HttpResponseWriter& response)>;

/**
 * @brief Listener settings.
 */
struct HttpServerConfig {
    std::string bindAddress = "0.0.0.0";
    uint16_t port = 8080;                          ///< 0 picks an ephemeral port
    uint32_t maxConnections = 1024;
    std::chrono::milliseconds headerTimeout{10000};
    std::chrono::milliseconds sendTimeout{30000};  ///< Per send() on client sockets
    std::size_t maxHeaderBytes = 16 * 1024;
};

/**
 * @brief Thread-per-connection HTTP/1.1 server.
 *
 * ## Thread Safety
 * start() and stop() may be called from any thread; stop() is idempotent
 * and also runs from the destructor.
 */
class HttpServer {
public:
    HttpServer(HttpServerConfig config,
               HttpHandler handler,
               std::shared_ptr<core::StructuredLogger> logger);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /**
     * @brief Bind, listen and start the accept thread.
     */
    core::Result<void, HttpServerError> start();

    void stop();

    bool isRunning() const;

    /**
     * @brief Bound port, useful when configured with port 0.
     */
    uint16_t port() const;

    /**
     * @brief Number of connections currently being served.
     */
    std::size_t activeConnections() const;

private:
    struct ClientConnection {
        int fd = -1;
        std::string clientIp;
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> finished;
    };

    void acceptLoop();
    void serveConnection(int fd, const std::string& clientIp);
    void reapFinishedConnections();
    void rejectBusy(int fd);

    HttpServerConfig config_;
    HttpHandler handler_;
    std::shared_ptr<core::StructuredLogger> logger_;

    std::atomic<bool> running_{false};
    int listenFd_ = -1;
    uint16_t boundPort_ = 0;
    std::thread acceptThread_;

    mutable std::mutex connectionsMutex_;
    std::list<ClientConnection> connections_;

    std::mutex lifecycleMutex_;
};

} // namespace net
} // namespace iptvmux

#endif // IPTVMUX_NET_HTTP_SERVER_HPP
