// IptvMux - IPTV Stream Multiplexing Proxy
// Tests for the upstream reader
//
// Tests cover:
// - Chunk fan-out and content type adoption
// - Normal end, HTTP status failures, connect and read errors
// - Credential slot released exactly once, never for legacy credentials
// - Periodic activity reports

#include <gtest/gtest.h>
#include "iptvmux/streaming/upstream_reader.hpp"
#include "../support/fake_upstream_client.hpp"
#include "../support/recording_credential_store.hpp"
#include "../support/test_helpers.hpp"

#include <string>
#include <thread>
#include <vector>

namespace iptvmux {
namespace streaming {
namespace test {

using iptvmux::test::FakeUpstreamClient;
using iptvmux::test::RecordingCredentialStore;
using iptvmux::test::waitFor;

namespace {

std::string drain(StreamSubscriber& subscriber) {
    std::string out;
    Chunk chunk;
    while (subscriber.queue().pop(chunk, std::chrono::milliseconds(500)) == PopStatus::Chunk) {
        out.append(chunk->begin(), chunk->end());
    }
    return out;
}

} // anonymous namespace

class UpstreamReaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        client_ = std::make_shared<FakeUpstreamClient>();
        store_ = std::make_shared<RecordingCredentialStore>();
        clock_ = std::make_shared<core::ManualClock>();
        logger_ = iptvmux::test::makeTestLogger(&sink_);
    }

    void TearDown() override {
        if (stream_) {
            stream_->markInactive();
            stream_->abortUpstream();
        }
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    void createStream(core::CredentialId credentialId = 4,
                      core::StreamFormat format = core::StreamFormat::Ts) {
        SharedStreamParams params;
        params.key = core::StreamKey(1, "555", format);
        params.upstreamUrl = "http://provider.example/live/user/secret/555.ts";
        params.credentialId = credentialId;
        params.sessionToken = "token-555";
        params.userAgent = "okhttp/3.14.9";
        stream_ = std::make_shared<SharedStream>(params, clock_->now());
        subscriber_ = std::make_shared<StreamSubscriber>("sub", "10.0.0.9", 16, clock_->now());
        stream_->addSubscriber(subscriber_);
    }

    void startReader(std::size_t chunkSize = 1024) {
        UpstreamReaderConfig config;
        config.chunkSize = chunkSize;
        reader_ = std::make_shared<UpstreamReader>(stream_, client_, store_, clock_, logger_, config);
        auto reader = reader_;
        thread_ = std::thread([reader] { reader->run(); });
    }

    void runReaderToCompletion() {
        startReader();
        thread_.join();
    }

    std::shared_ptr<FakeUpstreamClient> client_;
    std::shared_ptr<RecordingCredentialStore> store_;
    std::shared_ptr<core::ManualClock> clock_;
    std::shared_ptr<iptvmux::test::CapturingLogSink> sink_;
    std::shared_ptr<core::StructuredLogger> logger_;

    std::shared_ptr<SharedStream> stream_;
    std::shared_ptr<StreamSubscriber> subscriber_;
    std::shared_ptr<UpstreamReader> reader_;
    std::thread thread_;
};

TEST_F(UpstreamReaderTest, DeliversBodyAndEnds) {
    createStream();
    client_->setContentType("video/MP2T; charset=binary");
    client_->setInitialChunks({"hello ", "world"}, true);

    runReaderToCompletion();

    EXPECT_EQ(reader_->state(), ReaderState::Completed);
    EXPECT_EQ(drain(*subscriber_), "hello world");
    EXPECT_FALSE(stream_->isActive());
    EXPECT_EQ(stream_->connectionState(), ConnectionState::Connected);
    EXPECT_EQ(stream_->contentType(), "video/MP2T; charset=binary");
    EXPECT_EQ(stream_->bytesReceived(), 11u);
    EXPECT_TRUE(stream_->error().empty());
    EXPECT_EQ(store_->released(), std::vector<std::string>{"token-555"});
}

TEST_F(UpstreamReaderTest, SendsUrlAndUserAgent) {
    createStream();
    client_->setInitialChunks({}, true);

    runReaderToCompletion();

    auto requests = client_->requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].url, "http://provider.example/live/user/secret/555.ts");
    EXPECT_EQ(requests[0].userAgent, "okhttp/3.14.9");
    EXPECT_EQ(requests[0].method, "GET");
}

TEST_F(UpstreamReaderTest, PasswordNeverLogged) {
    createStream();
    client_->setStatus(403);

    runReaderToCompletion();

    ASSERT_FALSE(sink_->entries().empty());
    for (const auto& entry : sink_->entries()) {
        EXPECT_EQ(entry.message.find("secret"), std::string::npos) << entry.message;
    }
}

TEST_F(UpstreamReaderTest, ErrorStatusFailsStream) {
    createStream();
    client_->setStatus(403);

    runReaderToCompletion();

    EXPECT_EQ(reader_->state(), ReaderState::Failed);
    EXPECT_EQ(stream_->connectionState(), ConnectionState::Failed);
    ASSERT_TRUE(stream_->errorInfo().has_value());
    EXPECT_EQ(stream_->errorInfo()->code, net::UpstreamError::Code::HttpStatus);
    EXPECT_EQ(stream_->errorInfo()->httpStatus, 403);
    EXPECT_TRUE(subscriber_->queue().isClosed());
    EXPECT_EQ(store_->released().size(), 1u);
}

TEST_F(UpstreamReaderTest, ConnectErrorFailsStream) {
    createStream();
    client_->setOpenError(net::UpstreamError(net::UpstreamError::Code::Timeout, "connect timed out"));

    runReaderToCompletion();

    EXPECT_EQ(reader_->state(), ReaderState::Failed);
    EXPECT_EQ(stream_->errorInfo()->code, net::UpstreamError::Code::Timeout);
    EXPECT_TRUE(sink_->contains("connect timed out"));
    EXPECT_EQ(store_->released().size(), 1u);
}

TEST_F(UpstreamReaderTest, ReadErrorAfterDataFailsStream) {
    createStream();
    startReader();
    ASSERT_TRUE(client_->waitForOpenCount(1, std::chrono::seconds(2)));

    client_->pushChunk("partial");
    client_->failAll(net::UpstreamError(net::UpstreamError::Code::ConnectionFailed, "reset by peer"));
    thread_.join();

    EXPECT_EQ(reader_->state(), ReaderState::Failed);
    EXPECT_EQ(drain(*subscriber_), "partial");
    EXPECT_NE(stream_->error().find("reset by peer"), std::string::npos);
}

TEST_F(UpstreamReaderTest, ForcedCloseIsNotAnError) {
    createStream();
    startReader();
    ASSERT_TRUE(client_->waitForOpenCount(1, std::chrono::seconds(2)));
    ASSERT_EQ(stream_->waitUntilConnected(std::chrono::seconds(2)), ConnectionState::Connected);

    stream_->markInactive();
    stream_->abortUpstream();
    thread_.join();

    EXPECT_EQ(reader_->state(), ReaderState::Completed);
    EXPECT_TRUE(stream_->error().empty());
    EXPECT_EQ(store_->released().size(), 1u);
}

TEST_F(UpstreamReaderTest, SlotReleasedOnceWhenAlreadyClaimed) {
    createStream();
    client_->setInitialChunks({"x"}, true);
    ASSERT_TRUE(stream_->claimCredentialRelease());

    runReaderToCompletion();

    EXPECT_TRUE(store_->released().empty());
}

TEST_F(UpstreamReaderTest, LegacyCredentialIsNeverReleased) {
    createStream(core::LEGACY_CREDENTIAL_ID);
    client_->setInitialChunks({"legacy"}, true);

    runReaderToCompletion();

    EXPECT_EQ(drain(*subscriber_), "legacy");
    EXPECT_TRUE(store_->released().empty());
    EXPECT_EQ(store_->activityUpdates.load(), 0);
}

TEST_F(UpstreamReaderTest, ReportsActivityAtMostOncePerInterval) {
    createStream();
    startReader();
    ASSERT_TRUE(client_->waitForOpenCount(1, std::chrono::seconds(2)));

    client_->pushChunk("a");
    ASSERT_TRUE(waitFor([this] { return stream_->bytesReceived() == 1; }));
    EXPECT_EQ(store_->activityUpdates.load(), 0);

    clock_->advance(std::chrono::seconds(2));
    client_->pushChunk("b");
    ASSERT_TRUE(waitFor([this] { return stream_->bytesReceived() == 2; }));
    client_->pushChunk("c");
    ASSERT_TRUE(waitFor([this] { return stream_->bytesReceived() == 3; }));

    EXPECT_EQ(store_->activityUpdates.load(), 1);
}

TEST_F(UpstreamReaderTest, SplitsBodyIntoConfiguredChunkSize) {
    createStream();
    client_->setInitialChunks({"abcdefghij"}, true);

    startReader(4);
    thread_.join();

    std::vector<std::size_t> sizes;
    Chunk chunk;
    while (subscriber_->queue().pop(chunk, std::chrono::milliseconds(50)) == PopStatus::Chunk) {
        sizes.push_back(chunk->size());
    }
    EXPECT_EQ(sizes, (std::vector<std::size_t>{4, 4, 2}));
}

TEST(ReaderStateTest, Names) {
    EXPECT_EQ(readerStateToString(ReaderState::Connecting), "connecting");
    EXPECT_EQ(readerStateToString(ReaderState::Streaming), "streaming");
    EXPECT_EQ(readerStateToString(ReaderState::Failed), "failed");
}

} // namespace test
} // namespace streaming
} // namespace iptvmux
