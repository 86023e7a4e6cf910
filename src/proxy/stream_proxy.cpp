// IptvMux - IPTV Stream Multiplexing Proxy
// Stream Proxy Implementation

#include "iptvmux/proxy/stream_proxy.hpp"
#include "iptvmux/admission/connection_lease.hpp"
#include "iptvmux/core/json_writer.hpp"
#include "iptvmux/core/secure_token.hpp"
#include "iptvmux/core/url.hpp"

#include <thread>

namespace iptvmux {
namespace proxy {

// =============================================================================
// Helpers
// =============================================================================

HttpFailure statusForUpstreamError(const net::UpstreamError& error) {
    using Code = net::UpstreamError::Code;

    switch (error.code) {
        case Code::Timeout:
            return HttpFailure(504, "Gateway Timeout - Upstream server did not respond in time");
        case Code::ConnectionFailed:
            return HttpFailure(502, "Bad Gateway - Could not connect to upstream server");
        case Code::HttpStatus:
            if (error.httpStatus == 404) {
                return HttpFailure(404, "Stream not found on upstream server");
            }
            if (error.httpStatus == 401 || error.httpStatus == 403) {
                return HttpFailure(403, "Upstream authentication failed (HTTP " +
                                   std::to_string(error.httpStatus) + ") - check credentials");
            }
            if (error.httpStatus == 407) {
                return HttpFailure(502, "Upstream proxy authentication failed - check IPTV credentials");
            }
            return HttpFailure(502, "Upstream error: HTTP " + std::to_string(error.httpStatus));
        case Code::Protocol:
        case Code::Cancelled:
        default:
            return HttpFailure(502, "Bad Gateway - " + error.toString());
    }
}

void sendJsonError(net::HttpResponseWriter& response, int status, const std::string& message) {
    core::JsonWriter json;
    json.beginObject();
    json.field("error", message);
    json.field("status", status);
    json.endObject();

    response.setStatus(status);
    response.setHeader("Content-Type", "application/json");
    response.send(json.str());
}

StreamProxyConfig StreamProxyConfig::fromConfig(const core::Configuration& config) {
    StreamProxyConfig result;
    result.connectTimeout = std::chrono::seconds(config.multiplexer.connectTimeoutSeconds);
    result.idleReleasePause = std::chrono::milliseconds(config.multiplexer.idleReleasePauseMs);
    result.defaultUserAgent = config.upstream.defaultUserAgent;
    return result;
}

// =============================================================================
// StreamProxy
// =============================================================================

StreamProxy::StreamProxy(StreamProxyConfig config,
                         std::shared_ptr<admission::IAccountStore> accounts,
                         std::shared_ptr<admission::ICredentialStore> credentials,
                         std::shared_ptr<streaming::StreamRegistry> registry,
                         std::shared_ptr<core::StructuredLogger> logger)
    : config_(std::move(config))
    , accounts_(std::move(accounts))
    , credentials_(std::move(credentials))
    , registry_(std::move(registry))
    , logger_(logger ? std::move(logger) : std::make_shared<core::StructuredLogger>()) {
}

core::Result<OpenedStream, HttpFailure> StreamProxy::open(core::AccountId accountId,
                                                          const std::string& streamId,
                                                          core::StreamFormat format,
                                                          const std::string& clientIp) {
    using OpenResult = core::Result<OpenedStream, HttpFailure>;

    core::StreamKey key(accountId, streamId, format);
    core::LogContext ctx;
    ctx.streamKey = key.toString();
    ctx.clientIP = clientIp;
    ctx.accountId = accountId;

    auto account = accounts_->getAccount(accountId);
    if (!account) {
        ctx.errorCode = core::ErrorCode::AccountNotFound;
        logger_->warningWithContext("Stream request failed: account " + std::to_string(accountId) +
                                    " not found", ctx, "Proxy");
        return OpenResult::error(HttpFailure(404, "Account not found"));
    }
    if (!account->enabled) {
        ctx.errorCode = core::ErrorCode::AccountDisabled;
        logger_->warningWithContext("Stream request failed: account " + std::to_string(accountId) +
                                    " is disabled", ctx, "Proxy");
        return OpenResult::error(HttpFailure(403, "Account is disabled"));
    }

    if (registry_->getActiveStream(key)) {
        auto joined = registry_->join(key, clientIp);
        if (joined.isSuccess()) {
            OpenedStream opened;
            opened.subscription = std::move(joined).value();
            opened.joined = true;
            return awaitConnected(std::move(opened));
        }
        // The stream ended in between; fall through to a fresh one.
    }

    return create(*account, streamId, format, clientIp);
}

core::Result<OpenedStream, HttpFailure> StreamProxy::create(const admission::Account& account,
                                                            const std::string& streamId,
                                                            core::StreamFormat format,
                                                            const std::string& clientIp) {
    using OpenResult = core::Result<OpenedStream, HttpFailure>;

    std::optional<admission::Credential> credential;
    std::string acquireError;
    admission::ConnectionLease lease;

    auto tryAcquire = [&]() {
        credential = credentials_->getAvailableCredential(account.id);
        if (!credential) {
            acquireError = "No available connections. All streams are in use.";
            return false;
        }
        auto token = credentials_->acquireConnection(credential->id, streamId, clientIp);
        if (token.isError()) {
            acquireError = "Could not acquire connection: " + token.error().message;
            return false;
        }
        lease = admission::ConnectionLease(credentials_, std::move(token).value());
        return true;
    };

    core::LogContext ctx;
    ctx.streamKey = core::StreamKey(account.id, streamId, format).toString();
    ctx.clientIP = clientIp;
    ctx.accountId = account.id;
    ctx.errorCode = core::ErrorCode::NoAvailableSlots;

    if (!tryAcquire()) {
        std::size_t idle = registry_->getIdleStreamCount(account.id);
        if (idle == 0) {
            logger_->warningWithContext("Stream request failed for account " +
                                        std::to_string(account.id) + ": " + acquireError,
                                        ctx, "Proxy");
            return OpenResult::error(HttpFailure(503, acquireError));
        }

        std::size_t released = registry_->releaseIdleStreamsForAccount(account.id);
        logger_->info("Released " + std::to_string(released) + " idle streams of account " +
                      std::to_string(account.id) + " to free a credential", "Proxy");
        std::this_thread::sleep_for(config_.idleReleasePause);

        if (!tryAcquire()) {
            logger_->warningWithContext("Stream request failed for account " +
                                        std::to_string(account.id) +
                                        " after releasing idle streams: " + acquireError,
                                        ctx, "Proxy");
            return OpenResult::error(HttpFailure(503, acquireError));
        }
    }

    streaming::SubscribeRequest request;
    request.accountId = account.id;
    request.streamId = streamId;
    request.format = format;
    request.upstreamUrl = core::buildUpstreamUrl(account.server, credential->username,
                                                 credential->password, streamId, format);
    request.credentialId = credential->id;
    request.sessionToken = lease.token();
    request.clientIp = clientIp;
    request.userAgent = account.userAgent.empty() ? config_.defaultUserAgent : account.userAgent;

    logger_->info("Proxying stream " + streamId + " for account " + std::to_string(account.id) +
                  " using credential " + std::to_string(credential->id) + " (session " +
                  core::tokenPrefix(lease.token()) + ") via " +
                  core::maskUrlCredentials(request.upstreamUrl), "Proxy");

    auto subscribed = registry_->subscribe(request);
    if (subscribed.isError()) {
        // The lease returns the slot on scope exit.
        logger_->error("Subscribe failed for " + request.key().toString() + ": " +
                       subscribed.error().message, "Proxy");
        return OpenResult::error(HttpFailure(503, subscribed.error().message));
    }

    OpenedStream opened;
    opened.subscription = std::move(subscribed).value();
    opened.joined = !opened.subscription.created;
    if (opened.subscription.created) {
        // The stream owns the slot from here on.
        lease.dismiss();
    }
    // Otherwise another request created the stream first and the lease
    // returns our unused slot when it goes out of scope.

    return awaitConnected(std::move(opened));
}

core::Result<OpenedStream, HttpFailure> StreamProxy::awaitConnected(OpenedStream opened) {
    using OpenResult = core::Result<OpenedStream, HttpFailure>;

    const auto& stream = opened.subscription.stream;
    streaming::ConnectionState state =
        stream->waitUntilConnected(config_.connectTimeout + config_.connectGrace);

    if (state == streaming::ConnectionState::Connected) {
        return OpenResult::success(std::move(opened));
    }

    registry_->unsubscribe(stream, opened.subscription.subscriber);

    if (state == streaming::ConnectionState::Pending) {
        return OpenResult::error(HttpFailure(504,
            "Gateway Timeout - Upstream server did not respond in time"));
    }

    auto error = stream->errorInfo();
    if (!error) {
        return OpenResult::error(HttpFailure(502, "Bad Gateway - Upstream stream closed"));
    }
    return OpenResult::error(statusForUpstreamError(*error));
}

void StreamProxy::handle(const net::HttpRequest& request,
                         net::HttpResponseWriter& response,
                         core::AccountId accountId,
                         const std::string& streamId,
                         core::StreamFormat format) {
    logger_->info("Stream request: account=" + std::to_string(accountId) + ", stream=" + streamId +
                  ", format=" + core::streamFormatToString(format) + ", client=" + request.clientIp,
                  "Proxy");

    auto opened = open(accountId, streamId, format, request.clientIp);
    if (opened.isError()) {
        sendJsonError(response, opened.error().status, opened.error().message);
        return;
    }

    OpenedStream session = std::move(opened).value();
    const auto& stream = session.subscription.stream;
    const auto& subscriber = session.subscription.subscriber;
    streaming::ChunkStream chunks = registry_->streamChunks(stream, subscriber);

    response.setStatus(200);
    response.setHeader("Content-Type", stream->contentType());
    response.setHeader("Cache-Control", "no-cache, no-store, must-revalidate");
    response.setHeader("Pragma", "no-cache");
    response.setHeader("Expires", "0");
    response.setHeader("X-Stream-Shared", session.joined ? "joined" : "created");
    response.setHeader("X-Subscriber-Id", subscriber->id().substr(0, core::TOKEN_LOG_PREFIX));

    if (!response.beginChunked()) {
        return;
    }

    bool clientGone = false;
    while (auto chunk = chunks.next()) {
        if (!response.writeChunk((*chunk)->data(), (*chunk)->size())) {
            clientGone = true;
            break;
        }
    }
    chunks.close();

    if (!clientGone) {
        response.finishChunked();
    }

    core::LogContext ctx;
    ctx.streamKey = stream->keyString();
    ctx.clientIP = request.clientIp;
    ctx.subscriberId = subscriber->id();
    ctx.accountId = accountId;
    logger_->infoWithContext(std::string(clientGone ? "Client disconnected" : "Stream ended") +
                             " after " + std::to_string(subscriber->bytesSent()) + " bytes",
                             ctx, "Proxy");
}

} // namespace proxy
} // namespace iptvmux
