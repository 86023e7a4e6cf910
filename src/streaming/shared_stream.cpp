// IptvMux - IPTV Stream Multiplexing Proxy
// Shared Stream Implementation

#include "iptvmux/streaming/shared_stream.hpp"

namespace iptvmux {
namespace streaming {

// =============================================================================
// StreamSubscriber
// =============================================================================

StreamSubscriber::StreamSubscriber(std::string id, std::string clientIp,
                                   std::size_t queueDepth, core::TimePoint now)
    : id_(std::move(id))
    , clientIp_(std::move(clientIp))
    , joinedAt_(now)
    , lastRead_(now.time_since_epoch().count())
    , queue_(queueDepth) {
}

core::TimePoint StreamSubscriber::lastRead() const {
    return core::TimePoint(core::Duration(lastRead_.load()));
}

void StreamSubscriber::recordRead(std::size_t bytes, core::TimePoint now) {
    bytesSent_.fetch_add(bytes);
    lastRead_.store(now.time_since_epoch().count());
}

bool StreamSubscriber::deactivate() {
    return active_.exchange(false);
}

// =============================================================================
// SharedStream
// =============================================================================

SharedStream::SharedStream(SharedStreamParams params, core::TimePoint now)
    : params_(std::move(params))
    , startedAt_(now)
    , contentType_(core::defaultContentType(params_.key.format))
    , lastActivity_(now.time_since_epoch().count())
    , idleSince_(now.time_since_epoch().count()) {
}

std::string SharedStream::contentType() const {
    std::lock_guard<std::mutex> lock(contentTypeMutex_);
    return contentType_;
}

void SharedStream::setContentType(std::string contentType) {
    std::lock_guard<std::mutex> lock(contentTypeMutex_);
    contentType_ = std::move(contentType);
}

core::TimePoint SharedStream::lastActivity() const {
    return core::TimePoint(core::Duration(lastActivity_.load()));
}

core::TimePoint SharedStream::idleSince() const {
    return core::TimePoint(core::Duration(idleSince_.load()));
}

void SharedStream::recordChunk(std::size_t bytes, core::TimePoint now) {
    bytesReceived_.fetch_add(bytes);
    lastActivity_.store(now.time_since_epoch().count());
}

bool SharedStream::markInactive() {
    bool transitioned = active_.exchange(false);
    if (transitioned) {
        // Taking the state lock orders the flag change before the wakeup.
        std::lock_guard<std::mutex> lock(stateMutex_);
        stateCv_.notify_all();
    }
    return transitioned;
}

bool SharedStream::setError(net::UpstreamError error) {
    std::lock_guard<std::mutex> lock(errorMutex_);
    if (error_) {
        return false;
    }
    error_ = std::move(error);
    return true;
}

std::optional<net::UpstreamError> SharedStream::errorInfo() const {
    std::lock_guard<std::mutex> lock(errorMutex_);
    return error_;
}

std::string SharedStream::error() const {
    std::lock_guard<std::mutex> lock(errorMutex_);
    return error_ ? error_->toString() : std::string();
}

void SharedStream::addSubscriber(std::shared_ptr<StreamSubscriber> subscriber) {
    std::lock_guard<std::mutex> lock(subscribersMutex_);
    const std::string id = subscriber->id();
    subscribers_[id] = std::move(subscriber);
}

bool SharedStream::removeSubscriber(const std::string& subscriberId, core::TimePoint now) {
    std::lock_guard<std::mutex> lock(subscribersMutex_);
    if (subscribers_.erase(subscriberId) == 0) {
        return false;
    }
    if (subscribers_.empty()) {
        idleSince_.store(now.time_since_epoch().count());
    }
    return true;
}

std::size_t SharedStream::subscriberCount() const {
    std::lock_guard<std::mutex> lock(subscribersMutex_);
    return subscribers_.size();
}

std::vector<std::shared_ptr<StreamSubscriber>> SharedStream::subscribers() const {
    std::lock_guard<std::mutex> lock(subscribersMutex_);
    std::vector<std::shared_ptr<StreamSubscriber>> result;
    result.reserve(subscribers_.size());
    for (const auto& entry : subscribers_) {
        result.push_back(entry.second);
    }
    return result;
}

FanOutResult SharedStream::fanOut(const Chunk& chunk, core::TimePoint now) {
    FanOutResult result;
    std::lock_guard<std::mutex> lock(subscribersMutex_);

    for (auto it = subscribers_.begin(); it != subscribers_.end();) {
        const auto& subscriber = it->second;
        if (subscriber->queue().tryPush(chunk)) {
            ++result.delivered;
            ++it;
            continue;
        }

        // Full (or already closed) queue: evict without waiting.
        subscriber->deactivate();
        subscriber->queue().close();
        result.dropped.push_back(subscriber);
        it = subscribers_.erase(it);
    }

    if (!result.dropped.empty() && subscribers_.empty()) {
        idleSince_.store(now.time_since_epoch().count());
    }
    return result;
}

std::size_t SharedStream::closeAllSubscribers() {
    std::map<std::string, std::shared_ptr<StreamSubscriber>> detached;
    {
        std::lock_guard<std::mutex> lock(subscribersMutex_);
        detached.swap(subscribers_);
    }

    for (auto& entry : detached) {
        entry.second->queue().close();
    }
    return detached.size();
}

bool SharedStream::claimCredentialRelease() {
    return !credentialReleaseClaimed_.exchange(true);
}

void SharedStream::setAbortHandler(std::function<void()> handler) {
    std::lock_guard<std::mutex> lock(upstreamMutex_);
    abortHandler_ = std::move(handler);
}

void SharedStream::abortUpstream() {
    std::lock_guard<std::mutex> lock(upstreamMutex_);
    if (abortHandler_) {
        abortHandler_();
    }
}

ConnectionState SharedStream::connectionState() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return state_;
}

void SharedStream::markConnected() {
    std::lock_guard<std::mutex> lock(stateMutex_);
    if (state_ == ConnectionState::Pending) {
        state_ = ConnectionState::Connected;
    }
    stateCv_.notify_all();
}

void SharedStream::markFailed(net::UpstreamError error) {
    setError(std::move(error));
    markInactive();

    std::lock_guard<std::mutex> lock(stateMutex_);
    if (state_ == ConnectionState::Pending) {
        state_ = ConnectionState::Failed;
    }
    stateCv_.notify_all();
}

ConnectionState SharedStream::waitUntilConnected(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(stateMutex_);
    stateCv_.wait_for(lock, timeout, [this] {
        return state_ != ConnectionState::Pending || !active_.load();
    });

    if (state_ == ConnectionState::Pending && !active_.load()) {
        return ConnectionState::Failed;
    }
    return state_;
}

} // namespace streaming
} // namespace iptvmux
