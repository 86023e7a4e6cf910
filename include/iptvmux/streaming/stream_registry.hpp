// IptvMux - IPTV Stream Multiplexing Proxy
// Stream Registry - Multiplexes client subscriptions onto shared upstreams
//
// Responsibilities:
// - Map stream keys (account, stream, format) to active SharedStreams
// - Create a stream and start exactly one UpstreamReader per key
// - Attach and detach subscribers and hand out their chunk sequences
// - Release idle streams on demand to free credential slots
// - Background reclamation of idle and dead streams
// - Diagnostic snapshots for operators
//
// Locking: one registry lock guards the stream map; each SharedStream has its
// own subscriber lock. The registry lock is never taken while holding a
// stream lock.

#ifndef IPTVMUX_STREAMING_STREAM_REGISTRY_HPP
#define IPTVMUX_STREAMING_STREAM_REGISTRY_HPP

#include "iptvmux/admission/credential_store.hpp"
#include "iptvmux/core/clock.hpp"
#include "iptvmux/core/config_manager.hpp"
#include "iptvmux/core/result.hpp"
#include "iptvmux/core/structured_logger.hpp"
#include "iptvmux/core/types.hpp"
#include "iptvmux/net/upstream_client.hpp"
#include "iptvmux/streaming/chunk_stream.hpp"
#include "iptvmux/streaming/shared_stream.hpp"
#include "iptvmux/streaming/upstream_reader.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace iptvmux {
namespace streaming {

// =============================================================================
// Configuration
// =============================================================================

/**
 * @brief Registry timing and sizing.
 */
struct StreamRegistryConfig {
    std::size_t chunkSize = 65536;
    std::size_t subscriberQueueDepth = 50;
    std::chrono::milliseconds connectTimeout{60000};
    std::chrono::milliseconds readTimeout{120000};
    std::chrono::milliseconds idleTimeout{30000};      ///< Zero-subscriber grace period
    std::chrono::milliseconds subscriberWait{5000};    ///< One queue wait in ChunkStream
    std::chrono::milliseconds reclaimInterval{1000};
    std::chrono::milliseconds shutdownJoinTimeout{5000}; ///< stop() detaches readers still blocked after this
    uint32_t maxRedirects = 5;

    static StreamRegistryConfig fromConfig(const core::MultiplexerConfig& multiplexer,
                                           const core::UpstreamConfig& upstream);
};

// =============================================================================
// Requests and results
// =============================================================================

/**
 * @brief Registry failure.
 */
struct StreamRegistryError {
    enum class Code {
        InvalidArgument,        ///< Empty stream id or upstream URL
        StreamNotActive,        ///< join() found no active stream
        RegistryStopped,        ///< stop() was called
        TokenGenerationFailed   ///< No randomness for the subscriber id
    };

    Code code = Code::InvalidArgument;
    std::string message;

    StreamRegistryError() = default;
    StreamRegistryError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
};

/**
 * @brief Parameters of subscribe().
 *
 * credentialId and sessionToken are charged to the stream only when this
 * call creates it.
 */
struct SubscribeRequest {
    core::AccountId accountId = 0;
    std::string streamId;
    core::StreamFormat format = core::StreamFormat::Ts;
    std::string upstreamUrl;
    core::CredentialId credentialId = 0;
    std::string sessionToken;
    std::string clientIp;
    std::string userAgent;

    core::StreamKey key() const {
        return core::StreamKey{accountId, streamId, format};
    }
};

/**
 * @brief A subscriber attached to its stream.
 */
struct Subscription {
    std::shared_ptr<SharedStream> stream;
    std::shared_ptr<StreamSubscriber> subscriber;
    bool created = false;   ///< This call created the stream and its reader
};

/**
 * @brief Diagnostic view of one stream.
 */
struct StreamInfo {
    std::string streamKey;
    core::AccountId accountId = 0;
    std::string streamId;
    core::StreamFormat format = core::StreamFormat::Ts;
    core::CredentialId credentialId = 0;
    std::size_t subscribers = 0;
    uint64_t bytesReceived = 0;
    bool isActive = false;
    std::string contentType;
    double uptimeSeconds = 0.0;
    double idleSeconds = 0.0;       ///< Since the last upstream chunk
    std::string error;
};

/**
 * @brief Diagnostic snapshot of the registry.
 */
struct RegistryStats {
    std::size_t activeStreams = 0;      ///< Streams in the registry map
    std::size_t totalSubscribers = 0;
    std::vector<StreamInfo> streams;
};

// =============================================================================
// StreamRegistry
// =============================================================================

/**
 * @brief Multiplexer of client subscriptions onto shared upstream streams.
 *
 * Constructed once by the server and passed to request handlers. Each
 * SharedStream gets its own reader thread; one reclamation thread runs
 * between start() and stop().
 *
 * ## Usage Example
 * @code
 * StreamRegistry registry(config, upstreamClient, credentialStore, clock, logger);
 * registry.start();
 *
 * auto sub = registry.subscribe(request);
 * if (sub.isSuccess()) {
 *     ChunkStream chunks = registry.streamChunks(sub.value().stream,
 *                                                sub.value().subscriber);
 *     while (auto chunk = chunks.next()) { ... }
 * }
 *
 * registry.stop();
 * @endcode
 */
class StreamRegistry {
public:
    StreamRegistry(StreamRegistryConfig config,
                   std::shared_ptr<net::IUpstreamClient> upstreamClient,
                   std::shared_ptr<admission::ICredentialStore> credentialStore,
                   std::shared_ptr<core::IClock> clock,
                   std::shared_ptr<core::StructuredLogger> logger);
    ~StreamRegistry();

    StreamRegistry(const StreamRegistry&) = delete;
    StreamRegistry& operator=(const StreamRegistry&) = delete;

    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------

    /**
     * @brief Start the reclamation thread. Idempotent.
     */
    void start();

    /**
     * @brief Stop reclamation, force-close every stream and join the reader
     *        threads. Readers still blocked after shutdownJoinTimeout are
     *        detached and finish on their own. Idempotent.
     */
    void stop();

    bool isRunning() const { return running_.load(); }

    // -------------------------------------------------------------------------
    // Subscriptions
    // -------------------------------------------------------------------------

    /**
     * @brief Join the active stream of the request's key, or create it.
     *
     * Never waits for the upstream; failures surface later through the
     * stream's connection state and error.
     */
    core::Result<Subscription, StreamRegistryError> subscribe(const SubscribeRequest& request);

    /**
     * @brief Attach to the active stream of a key without ever creating one.
     *
     * Used by callers holding no credential slot.
     */
    core::Result<Subscription, StreamRegistryError> join(const core::StreamKey& key,
                                                         const std::string& clientIp);

    /**
     * @brief Active stream of a key, or nullptr.
     */
    std::shared_ptr<SharedStream> getActiveStream(const core::StreamKey& key) const;

    /**
     * @brief Detach a subscriber. The stream itself stays until reclaimed.
     */
    void unsubscribe(const std::shared_ptr<SharedStream>& stream,
                     const std::shared_ptr<StreamSubscriber>& subscriber);

    /**
     * @brief Chunk sequence of a subscriber; unsubscribes when it ends.
     */
    ChunkStream streamChunks(std::shared_ptr<SharedStream> stream,
                             std::shared_ptr<StreamSubscriber> subscriber);

    // -------------------------------------------------------------------------
    // Reclamation
    // -------------------------------------------------------------------------

    /**
     * @brief Force-close the account's least recently active idle streams.
     *
     * @param accountId Account whose streams are considered
     * @param credentialId Restrict to streams charged to this credential
     * @param maxToRelease Upper bound on closed streams
     * @return Number of closed streams
     */
    std::size_t releaseIdleStreamsForAccount(core::AccountId accountId,
                                             std::optional<core::CredentialId> credentialId = std::nullopt,
                                             std::size_t maxToRelease = 1);

    /**
     * @brief Active streams of the account with no subscribers.
     */
    std::size_t getIdleStreamCount(core::AccountId accountId) const;

    /**
     * @brief One reclamation sweep: close dead streams and streams idle past
     *        the idle timeout, join finished reader threads.
     *
     * A stream with no subscribers is idle from the earlier of its last
     * upstream chunk and the moment its last subscriber left.
     * @return Number of closed streams
     */
    std::size_t reclaimOnce();

    // -------------------------------------------------------------------------
    // Diagnostics
    // -------------------------------------------------------------------------

    RegistryStats getStats() const;

    const StreamRegistryConfig& config() const { return config_; }

private:
    struct ReaderHandle {
        std::shared_ptr<SharedStream> stream;
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> finished;
    };

    core::Result<std::shared_ptr<StreamSubscriber>, StreamRegistryError> newSubscriber(
        const std::string& clientIp, core::TimePoint now) const;
    void logJoined(const Subscription& subscription, std::size_t subscriberCount) const;
    void launchReader(const std::shared_ptr<SharedStream>& stream);

    // Requires mutex_. Removes the stream from the map and deactivates it.
    void detachLocked(const std::shared_ptr<SharedStream>& stream);

    // Aborts the upstream, ends subscribers and returns the credential slot.
    void finishClose(const std::shared_ptr<SharedStream>& stream, const std::string& reason);

    void reapReaders(bool all);
    void reclaimLoop();

    core::LogContext streamContext(const SharedStream& stream) const;

    const StreamRegistryConfig config_;
    std::shared_ptr<net::IUpstreamClient> upstreamClient_;
    std::shared_ptr<admission::ICredentialStore> credentialStore_;
    std::shared_ptr<core::IClock> clock_;
    std::shared_ptr<core::StructuredLogger> logger_;

    mutable std::mutex mutex_;
    std::unordered_map<core::StreamKey, std::shared_ptr<SharedStream>, core::StreamKeyHash> streams_;

    std::mutex readersMutex_;
    std::vector<ReaderHandle> readers_;

    std::mutex lifecycleMutex_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stopped_{false};
    std::mutex reclaimMutex_;
    std::condition_variable reclaimCv_;
    bool reclaimStop_ = false;
    std::thread reclaimThread_;
};

} // namespace streaming
} // namespace iptvmux

#endif // IPTVMUX_STREAMING_STREAM_REGISTRY_HPP
