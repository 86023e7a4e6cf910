// IptvMux - IPTV Stream Multiplexing Proxy
// Upstream Reader Implementation

#include "iptvmux/streaming/upstream_reader.hpp"
#include "iptvmux/core/url.hpp"

#include <exception>
#include <vector>

namespace iptvmux {
namespace streaming {

std::string readerStateToString(ReaderState state) {
    switch (state) {
        case ReaderState::Connecting: return "connecting";
        case ReaderState::Streaming: return "streaming";
        case ReaderState::Completed: return "completed";
        case ReaderState::Failed: return "failed";
        default: return "unknown";
    }
}

UpstreamReader::UpstreamReader(std::shared_ptr<SharedStream> stream,
                               std::shared_ptr<net::IUpstreamClient> client,
                               std::shared_ptr<admission::ICredentialStore> credentialStore,
                               std::shared_ptr<core::IClock> clock,
                               std::shared_ptr<core::StructuredLogger> logger,
                               UpstreamReaderConfig config)
    : stream_(std::move(stream))
    , client_(std::move(client))
    , credentialStore_(std::move(credentialStore))
    , clock_(std::move(clock))
    , logger_(std::move(logger))
    , config_(config) {
    if (config_.chunkSize == 0) {
        config_.chunkSize = 65536;
    }
}

void UpstreamReader::run() {
    lastActivityReport_ = clock_->now();

    // Outlives the try block so the abort handler never sees a dead response.
    std::unique_ptr<net::IUpstreamResponse> response;

    try {
        net::UpstreamRequest request;
        request.url = stream_->upstreamUrl();
        request.userAgent = stream_->userAgent();
        request.connectTimeout = config_.connectTimeout;
        request.readTimeout = config_.readTimeout;
        request.maxRedirects = config_.maxRedirects;
        std::shared_ptr<SharedStream> stream = stream_;
        request.isCancelled = [stream] { return !stream->isActive(); };

        logger_->debug("Opening upstream " + core::maskUrlCredentials(request.url) +
                       " for " + stream_->keyString(), "Upstream");

        auto opened = client_->open(request);
        if (opened.isError()) {
            fail(opened.error());
        } else {
            response = std::move(opened).value();
            int status = response->statusCode();
            if (status < 200 || status >= 300) {
                fail(net::UpstreamError(net::UpstreamError::Code::HttpStatus,
                                        "upstream answered " + std::to_string(status), status));
            } else {
                auto contentType = response->header("Content-Type");
                if (contentType && !contentType->empty()) {
                    stream_->setContentType(*contentType);
                }

                net::IUpstreamResponse* raw = response.get();
                stream_->setAbortHandler([raw] { raw->abort(); });
                state_.store(ReaderState::Streaming);
                stream_->markConnected();
                logger_->logStreamEvent(core::StreamEventType::StreamConnected, logContext(),
                                        "content type " + stream_->contentType());

                // A close that raced with the handshake missed the handler.
                if (!stream_->isActive()) {
                    response->abort();
                }

                readLoop(*response);
            }
        }
    } catch (const std::exception& e) {
        fail(net::UpstreamError(net::UpstreamError::Code::Protocol,
                                std::string("reader exception: ") + e.what()));
    }

    stream_->setAbortHandler(nullptr);
    response.reset();
    finish();
}

void UpstreamReader::readLoop(net::IUpstreamResponse& response) {
    std::vector<uint8_t> buffer(config_.chunkSize);

    while (stream_->isActive()) {
        auto result = response.read(buffer.data(), buffer.size());
        if (result.isError()) {
            fail(result.error());
            return;
        }

        std::size_t bytes = result.value();
        if (bytes == 0) {
            state_.store(ReaderState::Completed);
            stream_->markInactive();
            logger_->info("Upstream ended for " + stream_->keyString() + " after " +
                          std::to_string(stream_->bytesReceived()) + " bytes", "Upstream");
            return;
        }

        core::TimePoint now = clock_->now();
        Chunk chunk = std::make_shared<const std::vector<uint8_t>>(
            buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(bytes));
        stream_->recordChunk(bytes, now);

        FanOutResult fanOut = stream_->fanOut(chunk, now);
        for (const auto& dropped : fanOut.dropped) {
            core::LogContext ctx = logContext();
            ctx.subscriberId = dropped->id();
            ctx.clientIP = dropped->clientIp();
            ctx.errorCode = core::ErrorCode::SubscriberDropped;
            logger_->logStreamEvent(core::StreamEventType::SubscriberDropped, ctx,
                                    "subscriber queue full");
        }

        reportActivity(now);
    }

    // Marked inactive from outside: forced close or shutdown.
    state_.store(ReaderState::Completed);
}

void UpstreamReader::fail(const net::UpstreamError& error) {
    if (!stream_->isActive() || error.code == net::UpstreamError::Code::Cancelled) {
        // Forced close aborted the connection; nothing to report.
        state_.store(ReaderState::Completed);
        stream_->markInactive();
        return;
    }

    state_.store(ReaderState::Failed);
    stream_->markFailed(error);

    core::LogContext ctx = logContext();
    ctx.errorCode = error.toErrorCode();
    logger_->errorWithContext("Upstream failed for " +
                              core::maskUrlCredentials(stream_->upstreamUrl()) + ": " +
                              error.toString(), ctx, "Upstream");
}

void UpstreamReader::finish() {
    stream_->markInactive();
    std::size_t ended = stream_->closeAllSubscribers();
    if (ended > 0) {
        logger_->debug("Ended " + std::to_string(ended) + " subscribers of " +
                       stream_->keyString(), "Upstream");
    }

    if (stream_->claimCredentialRelease() && credentialStore_ &&
        stream_->credentialId() != core::LEGACY_CREDENTIAL_ID) {
        credentialStore_->releaseConnection(stream_->sessionToken());
    }
}

void UpstreamReader::reportActivity(core::TimePoint now) {
    if (!credentialStore_ || stream_->credentialId() == core::LEGACY_CREDENTIAL_ID) {
        return;
    }
    if (now - lastActivityReport_ < config_.activityReportInterval) {
        return;
    }
    lastActivityReport_ = now;
    credentialStore_->updateActivity(stream_->sessionToken());
}

core::LogContext UpstreamReader::logContext() const {
    core::LogContext ctx;
    ctx.streamKey = stream_->keyString();
    ctx.sessionToken = stream_->sessionToken();
    ctx.accountId = stream_->accountId();
    return ctx;
}

} // namespace streaming
} // namespace iptvmux
