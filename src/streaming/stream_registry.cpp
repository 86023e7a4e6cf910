// IptvMux - IPTV Stream Multiplexing Proxy
// Stream Registry Implementation

#include "iptvmux/streaming/stream_registry.hpp"
#include "iptvmux/core/secure_token.hpp"
#include "iptvmux/core/url.hpp"

#include <algorithm>
#include <exception>

namespace iptvmux {
namespace streaming {

namespace {

double secondsBetween(core::TimePoint from, core::TimePoint to) {
    if (to <= from) {
        return 0.0;
    }
    return std::chrono::duration<double>(to - from).count();
}

// Idle age counts from the older of the last upstream byte and the moment the
// last viewer left, so a stalled upstream is not kept alive by a recent leave.
core::TimePoint idleReference(const SharedStream& stream) {
    return std::min(stream.lastActivity(), stream.idleSince());
}

} // anonymous namespace

// =============================================================================
// StreamRegistryConfig
// =============================================================================

StreamRegistryConfig StreamRegistryConfig::fromConfig(const core::MultiplexerConfig& multiplexer,
                                                      const core::UpstreamConfig& upstream) {
    StreamRegistryConfig config;
    config.chunkSize = multiplexer.chunkSize;
    config.subscriberQueueDepth = multiplexer.subscriberQueueDepth;
    config.connectTimeout = std::chrono::seconds(multiplexer.connectTimeoutSeconds);
    config.readTimeout = std::chrono::seconds(multiplexer.readTimeoutSeconds);
    config.idleTimeout = std::chrono::seconds(multiplexer.idleTimeoutSeconds);
    config.subscriberWait = std::chrono::seconds(multiplexer.subscriberWaitSeconds);
    config.reclaimInterval = std::chrono::milliseconds(multiplexer.reclaimIntervalMs);
    config.maxRedirects = upstream.maxRedirects;
    return config;
}

// =============================================================================
// Construction and lifecycle
// =============================================================================

StreamRegistry::StreamRegistry(StreamRegistryConfig config,
                               std::shared_ptr<net::IUpstreamClient> upstreamClient,
                               std::shared_ptr<admission::ICredentialStore> credentialStore,
                               std::shared_ptr<core::IClock> clock,
                               std::shared_ptr<core::StructuredLogger> logger)
    : config_(config)
    , upstreamClient_(std::move(upstreamClient))
    , credentialStore_(std::move(credentialStore))
    , clock_(clock ? std::move(clock) : std::make_shared<core::SteadyClock>())
    , logger_(logger ? std::move(logger) : std::make_shared<core::StructuredLogger>()) {
}

StreamRegistry::~StreamRegistry() {
    stop();
}

void StreamRegistry::start() {
    std::lock_guard<std::mutex> lifecycle(lifecycleMutex_);
    if (running_.load()) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(reclaimMutex_);
        reclaimStop_ = false;
    }
    stopped_.store(false);
    running_.store(true);
    reclaimThread_ = std::thread(&StreamRegistry::reclaimLoop, this);

    logger_->info("Stream registry started (idle timeout " +
                  std::to_string(config_.idleTimeout.count()) + " ms)", "Multiplexer");
}

void StreamRegistry::stop() {
    std::lock_guard<std::mutex> lifecycle(lifecycleMutex_);
    stopped_.store(true);

    if (running_.exchange(false)) {
        {
            std::lock_guard<std::mutex> lock(reclaimMutex_);
            reclaimStop_ = true;
        }
        reclaimCv_.notify_all();
    }
    if (reclaimThread_.joinable()) {
        reclaimThread_.join();
    }

    std::vector<std::shared_ptr<SharedStream>> remaining;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : streams_) {
            remaining.push_back(entry.second);
            entry.second->markInactive();
        }
        streams_.clear();
    }

    for (const auto& stream : remaining) {
        finishClose(stream, "registry stopped");
    }
    reapReaders(true);

    if (!remaining.empty()) {
        logger_->info("Stream registry stopped, closed " + std::to_string(remaining.size()) +
                      " streams", "Multiplexer");
    }
}

// =============================================================================
// Subscriptions
// =============================================================================

core::Result<Subscription, StreamRegistryError> StreamRegistry::subscribe(const SubscribeRequest& request) {
    using SubscribeResult = core::Result<Subscription, StreamRegistryError>;

    if (request.streamId.empty() || request.upstreamUrl.empty()) {
        return SubscribeResult::error(StreamRegistryError(
            StreamRegistryError::Code::InvalidArgument, "stream id and upstream URL are required"));
    }
    if (stopped_.load()) {
        return SubscribeResult::error(StreamRegistryError(
            StreamRegistryError::Code::RegistryStopped, "stream registry is stopped"));
    }

    core::TimePoint now = clock_->now();
    core::StreamKey key = request.key();

    auto subscriber = newSubscriber(request.clientIp, now);
    if (subscriber.isError()) {
        return SubscribeResult::error(subscriber.error());
    }

    Subscription subscription;
    subscription.subscriber = std::move(subscriber).value();

    std::shared_ptr<SharedStream> replaced;
    std::size_t subscriberCount = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        // stop() raises the flag before it empties the map under this lock.
        if (stopped_.load()) {
            return SubscribeResult::error(StreamRegistryError(
                StreamRegistryError::Code::RegistryStopped, "stream registry is stopped"));
        }
        auto it = streams_.find(key);
        if (it != streams_.end() && it->second->isActive()) {
            subscription.stream = it->second;
        } else {
            if (it != streams_.end()) {
                replaced = it->second;
            }

            SharedStreamParams params;
            params.key = key;
            params.upstreamUrl = request.upstreamUrl;
            params.credentialId = request.credentialId;
            params.sessionToken = request.sessionToken;
            params.userAgent = request.userAgent;

            subscription.stream = std::make_shared<SharedStream>(std::move(params), now);
            subscription.created = true;
            streams_[key] = subscription.stream;
        }

        // Attached under the registry lock so a concurrent sweep cannot
        // close a stream between lookup and attach, and before the reader
        // starts so the creator sees the first chunk.
        subscription.stream->addSubscriber(subscription.subscriber);
        subscriberCount = subscription.stream->subscriberCount();
        if (subscription.created) {
            launchReader(subscription.stream);
        }
    }

    if (replaced) {
        finishClose(replaced, "replaced by a new stream");
    }

    logJoined(subscription, subscriberCount);
    return SubscribeResult::success(std::move(subscription));
}

core::Result<Subscription, StreamRegistryError> StreamRegistry::join(const core::StreamKey& key,
                                                                     const std::string& clientIp) {
    using JoinResult = core::Result<Subscription, StreamRegistryError>;

    if (stopped_.load()) {
        return JoinResult::error(StreamRegistryError(
            StreamRegistryError::Code::RegistryStopped, "stream registry is stopped"));
    }

    auto subscriber = newSubscriber(clientIp, clock_->now());
    if (subscriber.isError()) {
        return JoinResult::error(subscriber.error());
    }

    Subscription subscription;
    subscription.subscriber = std::move(subscriber).value();

    std::size_t subscriberCount = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = streams_.find(key);
        if (it == streams_.end() || !it->second->isActive()) {
            return JoinResult::error(StreamRegistryError(
                StreamRegistryError::Code::StreamNotActive, "no active stream " + key.toString()));
        }
        subscription.stream = it->second;
        subscription.stream->addSubscriber(subscription.subscriber);
        subscriberCount = subscription.stream->subscriberCount();
    }

    logJoined(subscription, subscriberCount);
    return JoinResult::success(std::move(subscription));
}

std::shared_ptr<SharedStream> StreamRegistry::getActiveStream(const core::StreamKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = streams_.find(key);
    if (it == streams_.end() || !it->second->isActive()) {
        return nullptr;
    }
    return it->second;
}

void StreamRegistry::unsubscribe(const std::shared_ptr<SharedStream>& stream,
                                 const std::shared_ptr<StreamSubscriber>& subscriber) {
    if (!stream || !subscriber) {
        return;
    }

    subscriber->deactivate();
    if (!stream->removeSubscriber(subscriber->id(), clock_->now())) {
        return;
    }

    core::LogContext ctx = streamContext(*stream);
    ctx.clientIP = subscriber->clientIp();
    ctx.subscriberId = subscriber->id();
    logger_->logStreamEvent(core::StreamEventType::SubscriberLeft, ctx,
                            "remaining " + std::to_string(stream->subscriberCount()) +
                            ", bytes " + std::to_string(subscriber->bytesSent()));
}

ChunkStream StreamRegistry::streamChunks(std::shared_ptr<SharedStream> stream,
                                         std::shared_ptr<StreamSubscriber> subscriber) {
    return ChunkStream(this, std::move(stream), std::move(subscriber), clock_,
                       config_.subscriberWait);
}

// =============================================================================
// Reclamation
// =============================================================================

std::size_t StreamRegistry::releaseIdleStreamsForAccount(core::AccountId accountId,
                                                         std::optional<core::CredentialId> credentialId,
                                                         std::size_t maxToRelease) {
    std::vector<std::shared_ptr<SharedStream>> victims;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::shared_ptr<SharedStream>> idle;
        for (const auto& entry : streams_) {
            const auto& stream = entry.second;
            if (stream->accountId() != accountId || !stream->isActive() ||
                stream->subscriberCount() != 0) {
                continue;
            }
            if (credentialId && stream->credentialId() != *credentialId) {
                continue;
            }
            idle.push_back(stream);
        }

        std::sort(idle.begin(), idle.end(),
                  [](const std::shared_ptr<SharedStream>& a, const std::shared_ptr<SharedStream>& b) {
                      return a->lastActivity() < b->lastActivity();
                  });

        for (std::size_t i = 0; i < idle.size() && victims.size() < maxToRelease; ++i) {
            detachLocked(idle[i]);
            victims.push_back(idle[i]);
        }
    }

    for (const auto& stream : victims) {
        finishClose(stream, "released to free a credential");
    }
    return victims.size();
}

std::size_t StreamRegistry::getIdleStreamCount(core::AccountId accountId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t count = 0;
    for (const auto& entry : streams_) {
        const auto& stream = entry.second;
        if (stream->accountId() == accountId && stream->isActive() &&
            stream->subscriberCount() == 0) {
            ++count;
        }
    }
    return count;
}

std::size_t StreamRegistry::reclaimOnce() {
    reapReaders(false);

    core::TimePoint now = clock_->now();
    std::vector<std::pair<std::shared_ptr<SharedStream>, std::string>> victims;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = streams_.begin(); it != streams_.end();) {
            const std::shared_ptr<SharedStream> stream = it->second;
            if (!stream->isActive()) {
                victims.emplace_back(stream, "upstream ended");
            } else if (stream->subscriberCount() == 0 &&
                       now - idleReference(*stream) > config_.idleTimeout) {
                stream->markInactive();
                victims.emplace_back(stream, "idle for " +
                    std::to_string(static_cast<long long>(secondsBetween(idleReference(*stream), now))) + "s");
            } else {
                ++it;
                continue;
            }
            it = streams_.erase(it);
        }
    }

    for (const auto& victim : victims) {
        finishClose(victim.first, victim.second);
    }
    return victims.size();
}

// =============================================================================
// Diagnostics
// =============================================================================

RegistryStats StreamRegistry::getStats() const {
    core::TimePoint now = clock_->now();
    RegistryStats stats;

    std::lock_guard<std::mutex> lock(mutex_);
    stats.activeStreams = streams_.size();
    for (const auto& entry : streams_) {
        const SharedStream& stream = *entry.second;

        StreamInfo info;
        info.streamKey = stream.keyString();
        info.accountId = stream.accountId();
        info.streamId = stream.streamId();
        info.format = stream.format();
        info.credentialId = stream.credentialId();
        info.subscribers = stream.subscriberCount();
        info.bytesReceived = stream.bytesReceived();
        info.isActive = stream.isActive();
        info.contentType = stream.contentType();
        info.uptimeSeconds = secondsBetween(stream.startedAt(), now);
        info.idleSeconds = secondsBetween(stream.lastActivity(), now);
        info.error = stream.error();

        stats.totalSubscribers += info.subscribers;
        stats.streams.push_back(std::move(info));
    }

    std::sort(stats.streams.begin(), stats.streams.end(),
              [](const StreamInfo& a, const StreamInfo& b) { return a.streamKey < b.streamKey; });
    return stats;
}

// =============================================================================
// Private helpers
// =============================================================================

core::Result<std::shared_ptr<StreamSubscriber>, StreamRegistryError> StreamRegistry::newSubscriber(
    const std::string& clientIp, core::TimePoint now) const
{
    using SubscriberResult = core::Result<std::shared_ptr<StreamSubscriber>, StreamRegistryError>;

    auto subscriberId = core::generateSecureToken(core::SUBSCRIBER_ID_BYTES);
    if (subscriberId.isError()) {
        return SubscriberResult::error(StreamRegistryError(
            StreamRegistryError::Code::TokenGenerationFailed, subscriberId.error().message));
    }
    return SubscriberResult::success(std::make_shared<StreamSubscriber>(
        std::move(subscriberId).value(), clientIp, config_.subscriberQueueDepth, now));
}

void StreamRegistry::logJoined(const Subscription& subscription, std::size_t subscriberCount) const {
    core::LogContext ctx = streamContext(*subscription.stream);
    ctx.clientIP = subscription.subscriber->clientIp();
    ctx.subscriberId = subscription.subscriber->id();
    if (subscription.created) {
        logger_->logStreamEvent(core::StreamEventType::StreamCreated, ctx,
                                core::maskUrlCredentials(subscription.stream->upstreamUrl()));
    }
    logger_->logStreamEvent(core::StreamEventType::SubscriberJoined, ctx,
                            (subscription.created ? "created" : "joined") +
                            std::string(", total ") + std::to_string(subscriberCount));
}

void StreamRegistry::launchReader(const std::shared_ptr<SharedStream>& stream) {
    UpstreamReaderConfig readerConfig;
    readerConfig.chunkSize = config_.chunkSize;
    readerConfig.connectTimeout = config_.connectTimeout;
    readerConfig.readTimeout = config_.readTimeout;
    readerConfig.maxRedirects = config_.maxRedirects;

    auto reader = std::make_shared<UpstreamReader>(stream, upstreamClient_, credentialStore_,
                                                   clock_, logger_, readerConfig);
    auto finished = std::make_shared<std::atomic<bool>>(false);
    std::shared_ptr<core::StructuredLogger> logger = logger_;

    ReaderHandle handle;
    handle.stream = stream;
    handle.finished = finished;
    handle.thread = std::thread([reader, finished, logger, stream]() {
        try {
            reader->run();
        } catch (const std::exception& e) {
            logger->error("Reader of " + stream->keyString() + " terminated: " + e.what(),
                          "Multiplexer");
        }
        finished->store(true);
    });

    std::lock_guard<std::mutex> lock(readersMutex_);
    readers_.push_back(std::move(handle));
}

void StreamRegistry::detachLocked(const std::shared_ptr<SharedStream>& stream) {
    auto it = streams_.find(stream->key());
    if (it != streams_.end() && it->second == stream) {
        streams_.erase(it);
    }
    stream->markInactive();
}

void StreamRegistry::finishClose(const std::shared_ptr<SharedStream>& stream, const std::string& reason) {
    stream->markInactive();
    stream->abortUpstream();
    std::size_t ended = stream->closeAllSubscribers();

    core::LogContext ctx = streamContext(*stream);
    logger_->logStreamEvent(core::StreamEventType::StreamClosed, ctx,
                            reason + ", subscribers ended " + std::to_string(ended) +
                            ", bytes " + std::to_string(stream->bytesReceived()));

    if (stream->claimCredentialRelease() && credentialStore_ &&
        stream->credentialId() != core::LEGACY_CREDENTIAL_ID) {
        credentialStore_->releaseConnection(stream->sessionToken());
    }
}

void StreamRegistry::reapReaders(bool all) {
    std::vector<ReaderHandle> done;
    {
        std::lock_guard<std::mutex> lock(readersMutex_);
        if (all) {
            done.swap(readers_);
        } else {
            for (auto it = readers_.begin(); it != readers_.end();) {
                if (it->finished->load()) {
                    done.push_back(std::move(*it));
                    it = readers_.erase(it);
                } else {
                    ++it;
                }
            }
        }
    }

    if (all) {
        // Wall time: readers block on the network, not on the injected clock.
        auto deadline = std::chrono::steady_clock::now() + config_.shutdownJoinTimeout;
        for (const auto& handle : done) {
            while (!handle.finished->load() && std::chrono::steady_clock::now() < deadline) {
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
        }
    }

    std::size_t detached = 0;
    for (auto& handle : done) {
        if (!handle.thread.joinable()) {
            continue;
        }
        if (handle.finished->load()) {
            handle.thread.join();
        } else {
            // The thread owns everything it touches; it exits on its own
            // once the blocked upstream call returns.
            handle.thread.detach();
            ++detached;
        }
    }

    if (detached > 0) {
        logger_->warning("Detached " + std::to_string(detached) +
                         " upstream readers still blocked after " +
                         std::to_string(config_.shutdownJoinTimeout.count()) + " ms",
                         "Multiplexer");
    }
}

void StreamRegistry::reclaimLoop() {
    while (true) {
        {
            std::unique_lock<std::mutex> lock(reclaimMutex_);
            reclaimCv_.wait_for(lock, config_.reclaimInterval, [this] { return reclaimStop_; });
            if (reclaimStop_) {
                break;
            }
        }

        try {
            std::size_t closed = reclaimOnce();
            if (closed > 0) {
                logger_->debug("Reclaimed " + std::to_string(closed) + " streams", "Multiplexer");
            }
        } catch (const std::exception& e) {
            logger_->error(std::string("Reclamation sweep failed: ") + e.what(), "Multiplexer");
        }
    }
}

core::LogContext StreamRegistry::streamContext(const SharedStream& stream) const {
    core::LogContext ctx;
    ctx.streamKey = stream.keyString();
    ctx.accountId = stream.accountId();
    ctx.sessionToken = stream.sessionToken();
    return ctx;
}

} // namespace streaming
} // namespace iptvmux
