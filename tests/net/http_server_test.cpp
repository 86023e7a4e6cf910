// IptvMux - IPTV Stream Multiplexing Proxy
// Tests for the HTTP server and response writer
//
// Tests cover:
// - Fixed-length and chunked responses on a socket pair
// - Request dispatch over loopback
// - Protocol error responses (400, 431, 500, 505)
// - Connection limit

#include <gtest/gtest.h>
#include "iptvmux/net/http_server.hpp"
#include "../support/test_helpers.hpp"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

namespace iptvmux {
namespace net {
namespace test {

using iptvmux::test::SocketPair;
using iptvmux::test::decodeChunkedBody;
using iptvmux::test::plainBody;
using iptvmux::test::httpGet;
using iptvmux::test::rawHttpExchange;
using iptvmux::test::statusOf;

// =============================================================================
// HttpResponseWriter
// =============================================================================

TEST(HttpResponseWriterTest, FixedLengthResponse) {
    SocketPair pair;
    ASSERT_TRUE(pair.valid());

    HttpResponseWriter writer(pair.writer(), false);
    writer.setStatus(404);
    writer.setHeader("Content-Type", "application/json");
    ASSERT_TRUE(writer.send("{\"error\":\"x\"}"));
    pair.closeWriter();

    std::string raw = pair.readAll();
    EXPECT_EQ(raw.find("HTTP/1.1 404 Not Found\r\n"), 0u);
    EXPECT_NE(raw.find("Content-Type: application/json\r\n"), std::string::npos);
    EXPECT_NE(raw.find("Content-Length: 13\r\n"), std::string::npos);
    EXPECT_NE(raw.find("Connection: close\r\n"), std::string::npos);
    EXPECT_EQ(plainBody(raw), "{\"error\":\"x\"}");
    EXPECT_EQ(writer.bodyBytesSent(), 13u);
    EXPECT_EQ(writer.statusCode(), 404);
}

TEST(HttpResponseWriterTest, ChunkedResponse) {
    SocketPair pair;
    HttpResponseWriter writer(pair.writer(), false);
    writer.setHeader("Content-Type", "video/mp2t");

    ASSERT_TRUE(writer.beginChunked());
    const std::string first = "abc";
    const std::string second = "defghijklmnopqrs";
    ASSERT_TRUE(writer.writeChunk(reinterpret_cast<const uint8_t*>(first.data()), first.size()));
    ASSERT_TRUE(writer.writeChunk(reinterpret_cast<const uint8_t*>(second.data()), second.size()));
    ASSERT_TRUE(writer.finishChunked());
    pair.closeWriter();

    std::string raw = pair.readAll();
    EXPECT_NE(raw.find("Transfer-Encoding: chunked\r\n"), std::string::npos);
    EXPECT_EQ(raw.find("Content-Length"), std::string::npos);
    EXPECT_NE(raw.find("\r\n3\r\nabc\r\n10\r\ndefghijklmnopqrs\r\n0\r\n\r\n"), std::string::npos);
    EXPECT_EQ(decodeChunkedBody(raw), "abcdefghijklmnopqrs");
    EXPECT_EQ(writer.bodyBytesSent(), 19u);
}

TEST(HttpResponseWriterTest, HeadRequestOmitsBody) {
    SocketPair pair;
    HttpResponseWriter writer(pair.writer(), true);
    ASSERT_TRUE(writer.send("hello"));
    pair.closeWriter();

    std::string raw = pair.readAll();
    EXPECT_NE(raw.find("Content-Length: 5\r\n"), std::string::npos);
    EXPECT_EQ(plainBody(raw), "");
}

TEST(HttpResponseWriterTest, HeadersOnlyOnce) {
    SocketPair pair;
    HttpResponseWriter writer(pair.writer(), false);

    ASSERT_TRUE(writer.send("one"));
    EXPECT_TRUE(writer.headersSent());
    EXPECT_FALSE(writer.send("two"));
    EXPECT_FALSE(writer.beginChunked());
}

TEST(HttpResponseWriterTest, WriteFailsAfterPeerCloses) {
    SocketPair pair;
    HttpResponseWriter writer(pair.writer(), false);
    ASSERT_TRUE(writer.beginChunked());
    pair.closeReader();

    const std::string data(1024, 'x');
    bool ok = true;
    for (int i = 0; i < 8 && ok; ++i) {
        ok = writer.writeChunk(reinterpret_cast<const uint8_t*>(data.data()), data.size());
    }
    EXPECT_FALSE(ok);
    EXPECT_TRUE(writer.failed());
    EXPECT_FALSE(writer.finishChunked());
}

// =============================================================================
// HttpServer
// =============================================================================

class HttpServerTest : public ::testing::Test {
protected:
    void startServer(HttpHandler handler, uint32_t maxConnections = 16) {
        HttpServerConfig config;
        config.bindAddress = "127.0.0.1";
        config.port = 0;
        config.maxConnections = maxConnections;
        config.maxHeaderBytes = 1024;
        server_ = std::make_unique<HttpServer>(config, std::move(handler),
                                               iptvmux::test::makeTestLogger());
        auto started = server_->start();
        ASSERT_TRUE(started.isSuccess()) << started.error().message;
        ASSERT_NE(server_->port(), 0);
    }

    void TearDown() override {
        if (server_) {
            server_->stop();
        }
    }

    std::unique_ptr<HttpServer> server_;
};

TEST_F(HttpServerTest, DispatchesRequestToHandler) {
    std::mutex mutex;
    HttpRequest seen;
    startServer([&](const HttpRequest& request, HttpResponseWriter& response) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            seen = request;
        }
        response.setHeader("Content-Type", "text/plain");
        response.send("pong");
    });

    std::string raw = rawHttpExchange(server_->port(),
        "GET /health?verbose=1 HTTP/1.1\r\nHost: localhost\r\nX-Test: yes\r\n\r\n");

    EXPECT_EQ(statusOf(raw), 200);
    EXPECT_EQ(plainBody(raw), "pong");

    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_EQ(seen.method, "GET");
    EXPECT_EQ(seen.path, "/health");
    EXPECT_EQ(seen.queryParam("verbose").value(), "1");
    EXPECT_EQ(seen.headers.get("x-test").value(), "yes");
    EXPECT_EQ(seen.clientIp, "127.0.0.1");
}

TEST_F(HttpServerTest, ServesChunkedBodies) {
    startServer([](const HttpRequest&, HttpResponseWriter& response) {
        response.beginChunked();
        for (int i = 0; i < 3; ++i) {
            std::string part = "part" + std::to_string(i);
            response.writeChunk(reinterpret_cast<const uint8_t*>(part.data()), part.size());
        }
        response.finishChunked();
    });

    std::string raw = httpGet(server_->port(), "/stream");

    EXPECT_EQ(statusOf(raw), 200);
    EXPECT_EQ(decodeChunkedBody(raw), "part0part1part2");
}

TEST_F(HttpServerTest, MalformedRequestGets400) {
    startServer([](const HttpRequest&, HttpResponseWriter& response) { response.send("x"); });

    EXPECT_EQ(statusOf(rawHttpExchange(server_->port(), "GARBAGE\r\n\r\n")), 400);
}

TEST_F(HttpServerTest, UnsupportedVersionGets505) {
    startServer([](const HttpRequest&, HttpResponseWriter& response) { response.send("x"); });

    EXPECT_EQ(statusOf(rawHttpExchange(server_->port(), "GET / HTTP/2.0\r\n\r\n")), 505);
}

TEST_F(HttpServerTest, OversizedHeaderGets431) {
    startServer([](const HttpRequest&, HttpResponseWriter& response) { response.send("x"); });

    std::string request = "GET / HTTP/1.1\r\nX-Padding: " + std::string(2048, 'a');
    EXPECT_EQ(statusOf(rawHttpExchange(server_->port(), request)), 431);
}

TEST_F(HttpServerTest, SilentHandlerGets500) {
    startServer([](const HttpRequest&, HttpResponseWriter&) {});

    EXPECT_EQ(statusOf(httpGet(server_->port(), "/")), 500);
}

TEST_F(HttpServerTest, ThrowingHandlerGets500) {
    startServer([](const HttpRequest&, HttpResponseWriter&) {
        throw std::runtime_error("boom");
    });

    EXPECT_EQ(statusOf(httpGet(server_->port(), "/")), 500);
}

TEST_F(HttpServerTest, RejectsClientsOverTheLimit) {
    std::mutex mutex;
    std::condition_variable cv;
    bool entered = false;
    bool release = false;

    startServer([&](const HttpRequest&, HttpResponseWriter& response) {
        std::unique_lock<std::mutex> lock(mutex);
        entered = true;
        cv.notify_all();
        cv.wait_for(lock, std::chrono::seconds(5), [&] { return release; });
        response.send("done");
    }, 1);

    std::string firstResponse;
    std::thread first([&] { firstResponse = httpGet(server_->port(), "/slow"); });
    bool handlerEntered = false;
    {
        std::unique_lock<std::mutex> lock(mutex);
        handlerEntered = cv.wait_for(lock, std::chrono::seconds(5), [&] { return entered; });
    }
    EXPECT_TRUE(handlerEntered);

    EXPECT_EQ(statusOf(httpGet(server_->port(), "/second")), 503);

    {
        std::lock_guard<std::mutex> lock(mutex);
        release = true;
    }
    cv.notify_all();
    first.join();
    EXPECT_EQ(statusOf(firstResponse), 200);
}

TEST_F(HttpServerTest, SecondStartFails) {
    startServer([](const HttpRequest&, HttpResponseWriter& response) { response.send("x"); });

    auto again = server_->start();
    ASSERT_TRUE(again.isError());
    EXPECT_EQ(again.error().code, HttpServerError::Code::AlreadyRunning);
}

TEST(HttpServerConfigTest, InvalidBindAddress) {
    HttpServerConfig config;
    config.bindAddress = "not-an-address";
    config.port = 0;
    HttpServer server(config, [](const HttpRequest&, HttpResponseWriter&) {}, nullptr);

    auto started = server.start();
    ASSERT_TRUE(started.isError());
    EXPECT_EQ(started.error().code, HttpServerError::Code::InvalidAddress);
    EXPECT_FALSE(server.isRunning());
}

} // namespace test
} // namespace net
} // namespace iptvmux
