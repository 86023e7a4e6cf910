// IptvMux - IPTV Stream Multiplexing Proxy
// Chunk Stream - Pull-based body of one subscriber

#ifndef IPTVMUX_STREAMING_CHUNK_STREAM_HPP
#define IPTVMUX_STREAMING_CHUNK_STREAM_HPP

#include "iptvmux/core/clock.hpp"
#include "iptvmux/streaming/shared_stream.hpp"

#include <chrono>
#include <memory>
#include <optional>

namespace iptvmux {
namespace streaming {

class StreamRegistry;

/**
 * @brief Single-use sequence of the chunks delivered to one subscriber.
 *
 * next() blocks up to the subscriber wait for each chunk. On a wait
 * timeout it keeps waiting while both the stream and the subscriber are
 * active, and ends otherwise. Destroying or closing the sequence
 * unsubscribes, exactly once.
 *
 * The owning StreamRegistry must outlive every ChunkStream it created.
 *
 * ## Usage Example
 * @code
 * ChunkStream chunks = registry.streamChunks(sub.stream, sub.subscriber);
 * while (auto chunk = chunks.next()) {
 *     if (!writer.writeChunk((*chunk)->data(), (*chunk)->size())) {
 *         break;
 *     }
 * }
 * @endcode
 */
class ChunkStream {
public:
    ChunkStream() = default;
    ChunkStream(StreamRegistry* registry,
                std::shared_ptr<SharedStream> stream,
                std::shared_ptr<StreamSubscriber> subscriber,
                std::shared_ptr<core::IClock> clock,
                std::chrono::milliseconds wait);
    ~ChunkStream();

    ChunkStream(const ChunkStream&) = delete;
    ChunkStream& operator=(const ChunkStream&) = delete;
    ChunkStream(ChunkStream&& other) noexcept;
    ChunkStream& operator=(ChunkStream&& other) noexcept;

    /**
     * @brief Next chunk, or std::nullopt once the sequence has ended.
     */
    std::optional<Chunk> next();

    /**
     * @brief End the sequence and unsubscribe. Idempotent.
     */
    void close();

    bool isOpen() const { return registry_ != nullptr; }

private:
    StreamRegistry* registry_ = nullptr;
    std::shared_ptr<SharedStream> stream_;
    std::shared_ptr<StreamSubscriber> subscriber_;
    std::shared_ptr<core::IClock> clock_;
    std::chrono::milliseconds wait_{5000};
};

} // namespace streaming
} // namespace iptvmux

#endif // IPTVMUX_STREAMING_CHUNK_STREAM_HPP
