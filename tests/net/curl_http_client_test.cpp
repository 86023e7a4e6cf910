// IptvMux - IPTV Stream Multiplexing Proxy
// Tests for the libcurl upstream client
//
// An in-process HttpServer on loopback plays the provider.

#include <gtest/gtest.h>
#include "iptvmux/net/http_server.hpp"
#include "iptvmux/net/curl_http_client.hpp"
#include "../support/test_helpers.hpp"

#include <atomic>
#include <mutex>
#include <string>
#include <thread>

namespace iptvmux {
namespace net {
namespace test {

namespace {

std::string readBody(IUpstreamResponse& response) {
    std::string body;
    uint8_t buf[7];
    while (true) {
        auto got = response.read(buf, sizeof(buf));
        if (got.isError() || got.value() == 0) {
            break;
        }
        body.append(reinterpret_cast<const char*>(buf), got.value());
    }
    return body;
}

} // anonymous namespace

class CurlHttpClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        HttpServerConfig config;
        config.bindAddress = "127.0.0.1";
        config.port = 0;
        server_ = std::make_unique<HttpServer>(
            config,
            [this](const HttpRequest& request, HttpResponseWriter& response) {
                handle(request, response);
            },
            iptvmux::test::makeTestLogger());
        ASSERT_TRUE(server_->start().isSuccess());
    }

    void TearDown() override {
        releaseSlow_ = true;
        server_->stop();
    }

    void handle(const HttpRequest& request, HttpResponseWriter& response) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            lastRequest_ = request;
            ++requestCount_;
        }

        if (request.path == "/fixed") {
            response.setHeader("Content-Type", "video/mp2t");
            response.send("0123456789abcdef");
        } else if (request.path == "/chunked") {
            response.beginChunked();
            for (int i = 0; i < 4; ++i) {
                std::string part = "chunk" + std::to_string(i) + ";";
                response.writeChunk(reinterpret_cast<const uint8_t*>(part.data()), part.size());
            }
            response.finishChunked();
        } else if (request.path == "/old") {
            response.setStatus(302);
            response.setHeader("Location", "/fixed");
            response.send("");
        } else if (request.path == "/loop") {
            response.setStatus(301);
            response.setHeader("Location", "/loop");
            response.send("");
        } else if (request.path == "/slow") {
            response.beginChunked();
            response.writeChunk(reinterpret_cast<const uint8_t*>("x"), 1);
            for (int i = 0; i < 1500 && !releaseSlow_; ++i) {
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
            response.finishChunked();
        } else {
            response.setStatus(404);
            response.send("missing");
        }
    }

    UpstreamRequest requestFor(const std::string& path) {
        UpstreamRequest request;
        request.url = "http://127.0.0.1:" + std::to_string(server_->port()) + path;
        request.userAgent = "IptvMuxTest/1.0";
        request.connectTimeout = std::chrono::milliseconds(2000);
        request.readTimeout = std::chrono::milliseconds(2000);
        return request;
    }

    HttpRequest lastRequest() {
        std::lock_guard<std::mutex> lock(mutex_);
        return lastRequest_;
    }

    CurlHttpClient client_;
    std::unique_ptr<HttpServer> server_;
    std::mutex mutex_;
    HttpRequest lastRequest_;
    int requestCount_ = 0;
    std::atomic<bool> releaseSlow_{false};
};

TEST_F(CurlHttpClientTest, ReadsFixedLengthBody) {
    auto opened = client_.open(requestFor("/fixed"));
    ASSERT_TRUE(opened.isSuccess()) << opened.error().toString();

    auto& response = *opened.value();
    EXPECT_EQ(response.statusCode(), 200);
    EXPECT_EQ(response.header("content-type").value(), "video/mp2t");
    EXPECT_EQ(readBody(response), "0123456789abcdef");

    uint8_t buf[4];
    auto after = response.read(buf, sizeof(buf));
    ASSERT_TRUE(after.isSuccess());
    EXPECT_EQ(after.value(), 0u);
}

TEST_F(CurlHttpClientTest, DecodesChunkedBody) {
    auto opened = client_.open(requestFor("/chunked"));
    ASSERT_TRUE(opened.isSuccess());

    EXPECT_EQ(readBody(*opened.value()), "chunk0;chunk1;chunk2;chunk3;");
}

TEST_F(CurlHttpClientTest, SendsHostUserAgentAndExtraHeaders) {
    UpstreamRequest request = requestFor("/fixed?token=abc");
    request.headers.add("X-Forwarded-For", "10.1.2.3");

    auto opened = client_.open(request);
    ASSERT_TRUE(opened.isSuccess());
    readBody(*opened.value());

    HttpRequest seen = lastRequest();
    EXPECT_EQ(seen.headers.get("Host").value(), "127.0.0.1:" + std::to_string(server_->port()));
    EXPECT_EQ(seen.headers.get("User-Agent").value(), "IptvMuxTest/1.0");
    EXPECT_EQ(seen.headers.get("X-Forwarded-For").value(), "10.1.2.3");
    EXPECT_EQ(seen.headers.get("Accept").value(), "*/*");
    EXPECT_EQ(seen.queryParam("token").value(), "abc");
}

TEST_F(CurlHttpClientTest, FollowsRedirects) {
    auto opened = client_.open(requestFor("/old"));
    ASSERT_TRUE(opened.isSuccess());

    EXPECT_EQ(opened.value()->statusCode(), 200);
    EXPECT_EQ(readBody(*opened.value()), "0123456789abcdef");
    EXPECT_EQ(lastRequest().path, "/fixed");
}

TEST_F(CurlHttpClientTest, StopsAtRedirectLimit) {
    UpstreamRequest request = requestFor("/loop");
    request.maxRedirects = 2;

    auto opened = client_.open(request);
    ASSERT_TRUE(opened.isError());
    EXPECT_EQ(opened.error().code, UpstreamError::Code::Protocol);

    std::lock_guard<std::mutex> lock(mutex_);
    EXPECT_EQ(requestCount_, 3);
}

TEST_F(CurlHttpClientTest, RedirectReturnedWhenFollowingDisabled) {
    UpstreamRequest request = requestFor("/old");
    request.maxRedirects = 0;

    auto opened = client_.open(request);
    ASSERT_TRUE(opened.isSuccess());

    EXPECT_EQ(opened.value()->statusCode(), 302);
    EXPECT_EQ(opened.value()->header("Location").value(), "/fixed");
    EXPECT_EQ(lastRequest().path, "/old");
}

TEST_F(CurlHttpClientTest, ErrorStatusIsAResponse) {
    auto opened = client_.open(requestFor("/nothing-here"));
    ASSERT_TRUE(opened.isSuccess());

    EXPECT_EQ(opened.value()->statusCode(), 404);
    EXPECT_EQ(readBody(*opened.value()), "missing");
}

TEST_F(CurlHttpClientTest, HeadHasNoBody) {
    UpstreamRequest request = requestFor("/fixed");
    request.method = "HEAD";

    auto opened = client_.open(request);
    ASSERT_TRUE(opened.isSuccess());

    EXPECT_EQ(lastRequest().method, "HEAD");
    uint8_t buf[16];
    auto got = opened.value()->read(buf, sizeof(buf));
    ASSERT_TRUE(got.isSuccess());
    EXPECT_EQ(got.value(), 0u);
}

TEST_F(CurlHttpClientTest, ReadTimesOutWhenUpstreamStalls) {
    UpstreamRequest request = requestFor("/slow");
    request.readTimeout = std::chrono::milliseconds(1000);

    auto opened = client_.open(request);
    ASSERT_TRUE(opened.isSuccess());

    uint8_t buf[16];
    auto first = opened.value()->read(buf, sizeof(buf));
    ASSERT_TRUE(first.isSuccess());
    EXPECT_EQ(first.value(), 1u);

    // The stall check works in whole seconds on a moving average.
    auto started = std::chrono::steady_clock::now();
    auto second = opened.value()->read(buf, sizeof(buf));
    auto elapsed = std::chrono::steady_clock::now() - started;

    ASSERT_TRUE(second.isError());
    EXPECT_EQ(second.error().code, UpstreamError::Code::Timeout);
    EXPECT_LT(elapsed, std::chrono::seconds(12));
}

TEST_F(CurlHttpClientTest, AbortUnblocksRead) {
    auto opened = client_.open(requestFor("/slow"));
    ASSERT_TRUE(opened.isSuccess());
    IUpstreamResponse* response = opened.value().get();

    uint8_t buf[16];
    ASSERT_TRUE(response->read(buf, sizeof(buf)).isSuccess());

    std::thread aborter([response] {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        response->abort();
    });
    auto blocked = response->read(buf, sizeof(buf));
    aborter.join();

    ASSERT_TRUE(blocked.isError());
    EXPECT_EQ(blocked.error().code, UpstreamError::Code::Cancelled);
}

TEST_F(CurlHttpClientTest, RefusedConnectionFails) {
    UpstreamRequest request;
    request.url = "http://127.0.0.1:1/live/a/b/1.ts";
    request.connectTimeout = std::chrono::milliseconds(1000);

    auto opened = client_.open(request);
    ASSERT_TRUE(opened.isError());
    EXPECT_EQ(opened.error().code, UpstreamError::Code::ConnectionFailed);
}

TEST_F(CurlHttpClientTest, CancelledBeforeConnectStopsOpen) {
    UpstreamRequest request = requestFor("/fixed");
    request.isCancelled = [] { return true; };

    auto opened = client_.open(request);
    ASSERT_TRUE(opened.isError());
    EXPECT_EQ(opened.error().code, UpstreamError::Code::Cancelled);
}

TEST_F(CurlHttpClientTest, InvalidUrlIsProtocolError) {
    UpstreamRequest request;
    request.url = "ftp://provider.example/file";

    auto opened = client_.open(request);
    ASSERT_TRUE(opened.isError());
    EXPECT_EQ(opened.error().code, UpstreamError::Code::Protocol);
}

TEST(CurlErrorMappingTest, ClassifiesTransferFailures) {
    EXPECT_EQ(upstreamErrorFromCurl(CURLE_OPERATION_TIMEDOUT, "t").code, UpstreamError::Code::Timeout);
    EXPECT_EQ(upstreamErrorFromCurl(CURLE_COULDNT_CONNECT, "c").code,
              UpstreamError::Code::ConnectionFailed);
    EXPECT_EQ(upstreamErrorFromCurl(CURLE_COULDNT_RESOLVE_HOST, "r").code,
              UpstreamError::Code::ConnectionFailed);
    EXPECT_EQ(upstreamErrorFromCurl(CURLE_SSL_CONNECT_ERROR, "s").code,
              UpstreamError::Code::ConnectionFailed);
    EXPECT_EQ(upstreamErrorFromCurl(CURLE_ABORTED_BY_CALLBACK, "a").code,
              UpstreamError::Code::Cancelled);
    EXPECT_EQ(upstreamErrorFromCurl(CURLE_TOO_MANY_REDIRECTS, "m").code,
              UpstreamError::Code::Protocol);
    EXPECT_EQ(upstreamErrorFromCurl(CURLE_UNSUPPORTED_PROTOCOL, "u").code,
              UpstreamError::Code::Protocol);

    UpstreamError timeout = upstreamErrorFromCurl(CURLE_OPERATION_TIMEDOUT, "no data for 1 s");
    EXPECT_EQ(timeout.toString(), "Upstream timeout: no data for 1 s");
}

} // namespace test
} // namespace net
} // namespace iptvmux
