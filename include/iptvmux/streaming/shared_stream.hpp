// IptvMux - IPTV Stream Multiplexing Proxy
// Shared Stream - One upstream connection and the subscribers it feeds
//
// Responsibilities:
// - StreamSubscriber: one client's bounded delivery queue and counters
// - SharedStream: upstream identity, byte counters, activity timestamps,
//   terminal active flag and the first recorded upstream error
// - Subscriber map guarded by a per-stream lock, independent of the
//   registry lock, so fan-out on one stream never blocks another
// - Fan-out with slow-consumer eviction
// - Connection state for callers waiting on the upstream handshake
// - Released-once guard for the stream's credential slot

#ifndef IPTVMUX_STREAMING_SHARED_STREAM_HPP
#define IPTVMUX_STREAMING_SHARED_STREAM_HPP

#include "iptvmux/core/types.hpp"
#include "iptvmux/net/upstream_client.hpp"
#include "iptvmux/streaming/chunk_queue.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace iptvmux {
namespace streaming {

// =============================================================================
// StreamSubscriber
// =============================================================================

/**
 * @brief One client attachment to a SharedStream.
 *
 * Owned jointly by the stream's subscriber map and by the delivering
 * ChunkStream. The active flag goes false exactly once.
 */
class StreamSubscriber {
public:
    StreamSubscriber(std::string id, std::string clientIp,
                     std::size_t queueDepth, core::TimePoint now);

    StreamSubscriber(const StreamSubscriber&) = delete;
    StreamSubscriber& operator=(const StreamSubscriber&) = delete;

    const std::string& id() const { return id_; }
    const std::string& clientIp() const { return clientIp_; }
    core::TimePoint joinedAt() const { return joinedAt_; }
    core::TimePoint lastRead() const;
    uint64_t bytesSent() const { return bytesSent_.load(); }

    /**
     * @brief Account for a chunk handed to the client.
     */
    void recordRead(std::size_t bytes, core::TimePoint now);

    bool isActive() const { return active_.load(); }

    /**
     * @brief Clear the active flag.
     * @return true only for the call that performed the transition
     */
    bool deactivate();

    ChunkQueue& queue() { return queue_; }

private:
    const std::string id_;
    const std::string clientIp_;
    const core::TimePoint joinedAt_;
    std::atomic<core::Duration::rep> lastRead_;
    std::atomic<uint64_t> bytesSent_{0};
    std::atomic<bool> active_{true};
    ChunkQueue queue_;
};

// =============================================================================
// SharedStream
// =============================================================================

/**
 * @brief Upstream connection progress as seen by waiting callers.
 */
enum class ConnectionState {
    Pending,    ///< Reader still connecting
    Connected,  ///< Upstream answered with a 2xx status
    Failed      ///< Reader gave up or the stream was closed first
};

/**
 * @brief Identity of the upstream resource a stream is charged against.
 */
struct SharedStreamParams {
    core::StreamKey key;
    std::string upstreamUrl;            ///< Contains credentials, log masked only
    core::CredentialId credentialId = 0;
    std::string sessionToken;
    std::string userAgent;
};

/**
 * @brief Result of distributing one chunk.
 */
struct FanOutResult {
    std::size_t delivered = 0;
    std::vector<std::shared_ptr<StreamSubscriber>> dropped;  ///< Evicted slow consumers
};

/**
 * @brief One upstream connection shared by any number of subscribers.
 *
 * Exactly one SharedStream consumes one credential connection slot,
 * whatever its subscriber count. isActive() going false is terminal.
 *
 * ## Thread Safety
 * All methods are thread-safe. Subscriber operations take the stream's
 * own lock; counters and flags are atomics.
 */
class SharedStream {
public:
    SharedStream(SharedStreamParams params, core::TimePoint now);

    SharedStream(const SharedStream&) = delete;
    SharedStream& operator=(const SharedStream&) = delete;

    // -------------------------------------------------------------------------
    // Identity
    // -------------------------------------------------------------------------

    const core::StreamKey& key() const { return params_.key; }
    std::string keyString() const { return params_.key.toString(); }
    core::AccountId accountId() const { return params_.key.accountId; }
    const std::string& streamId() const { return params_.key.streamId; }
    core::StreamFormat format() const { return params_.key.format; }
    const std::string& upstreamUrl() const { return params_.upstreamUrl; }
    core::CredentialId credentialId() const { return params_.credentialId; }
    const std::string& sessionToken() const { return params_.sessionToken; }
    const std::string& userAgent() const { return params_.userAgent; }

    // -------------------------------------------------------------------------
    // Byte and activity state
    // -------------------------------------------------------------------------

    std::string contentType() const;
    void setContentType(std::string contentType);

    core::TimePoint startedAt() const { return startedAt_; }
    core::TimePoint lastActivity() const;

    /**
     * @brief When the subscriber map last became empty (creation time if
     *        it never did). Meaningful only while subscriberCount() is 0.
     */
    core::TimePoint idleSince() const;

    uint64_t bytesReceived() const { return bytesReceived_.load(); }

    /**
     * @brief Account for one upstream chunk.
     */
    void recordChunk(std::size_t bytes, core::TimePoint now);

    bool isActive() const { return active_.load(); }

    /**
     * @brief Clear the active flag and wake connection waiters.
     * @return true only for the call that performed the transition
     */
    bool markInactive();

    /**
     * @brief Record the terminating error. Only the first call has effect.
     */
    bool setError(net::UpstreamError error);

    std::optional<net::UpstreamError> errorInfo() const;

    /**
     * @brief Rendered error, empty while none is recorded.
     */
    std::string error() const;

    // -------------------------------------------------------------------------
    // Subscribers
    // -------------------------------------------------------------------------

    void addSubscriber(std::shared_ptr<StreamSubscriber> subscriber);

    /**
     * @brief Remove by id.
     * @return false if the subscriber was not present
     */
    bool removeSubscriber(const std::string& subscriberId, core::TimePoint now);

    std::size_t subscriberCount() const;

    std::vector<std::shared_ptr<StreamSubscriber>> subscribers() const;

    /**
     * @brief Offer a chunk to every subscriber without blocking.
     *
     * A subscriber whose queue is full is deactivated, removed and has
     * its queue closed.
     */
    FanOutResult fanOut(const Chunk& chunk, core::TimePoint now);

    /**
     * @brief Close every subscriber queue and clear the map.
     * @return Number of subscribers that were attached
     */
    std::size_t closeAllSubscribers();

    // -------------------------------------------------------------------------
    // Upstream control
    // -------------------------------------------------------------------------

    /**
     * @brief Claim the duty of releasing the credential slot.
     * @return true for exactly one caller over the stream's lifetime
     */
    bool claimCredentialRelease();

    /**
     * @brief Install the callback that aborts the in-flight upstream read.
     *
     * Pass nullptr before the upstream response is destroyed.
     */
    void setAbortHandler(std::function<void()> handler);

    void abortUpstream();

    ConnectionState connectionState() const;

    /**
     * @brief Upstream answered; wake waiters.
     */
    void markConnected();

    /**
     * @brief Upstream failed: record the error, deactivate, wake waiters.
     */
    void markFailed(net::UpstreamError error);

    /**
     * @brief Block until connected, failed or closed, or until timeout.
     * @return Pending only on timeout
     */
    ConnectionState waitUntilConnected(std::chrono::milliseconds timeout) const;

private:
    const SharedStreamParams params_;
    const core::TimePoint startedAt_;

    mutable std::mutex contentTypeMutex_;
    std::string contentType_;

    std::atomic<core::Duration::rep> lastActivity_;
    std::atomic<core::Duration::rep> idleSince_;
    std::atomic<uint64_t> bytesReceived_{0};
    std::atomic<bool> active_{true};
    std::atomic<bool> credentialReleaseClaimed_{false};

    mutable std::mutex errorMutex_;
    std::optional<net::UpstreamError> error_;

    mutable std::mutex subscribersMutex_;
    std::map<std::string, std::shared_ptr<StreamSubscriber>> subscribers_;

    std::mutex upstreamMutex_;
    std::function<void()> abortHandler_;

    mutable std::mutex stateMutex_;
    mutable std::condition_variable stateCv_;
    ConnectionState state_ = ConnectionState::Pending;
};

} // namespace streaming
} // namespace iptvmux

#endif // IPTVMUX_STREAMING_SHARED_STREAM_HPP
