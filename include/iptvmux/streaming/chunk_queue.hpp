// IptvMux - IPTV Stream Multiplexing Proxy
// Chunk Queue - Bounded per-subscriber delivery queue
//
// Responsibilities:
// - Hold at most a fixed number of upstream chunks for one subscriber
// - Non-blocking push so one slow subscriber never stalls the fan-out
// - Blocking pop with timeout for the delivering client thread
// - End-of-stream signalling that survives a full queue

#ifndef IPTVMUX_STREAMING_CHUNK_QUEUE_HPP
#define IPTVMUX_STREAMING_CHUNK_QUEUE_HPP

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <vector>

namespace iptvmux {
namespace streaming {

/**
 * @brief One upstream read, shared immutably by every subscriber queue.
 */
using Chunk = std::shared_ptr<const std::vector<uint8_t>>;

/**
 * @brief Outcome of ChunkQueue::pop().
 */
enum class PopStatus {
    Chunk,    ///< A chunk was dequeued
    End,      ///< The queue is closed and drained
    Timeout   ///< Nothing arrived within the wait
};

/**
 * @brief Bounded FIFO of chunks with an end marker.
 *
 * close() plays the role of the end sentinel. It never fails, even when
 * the queue is full, and chunks already queued are still delivered before
 * pop() reports End.
 *
 * ## Thread Safety
 * Any number of producers and consumers.
 */
class ChunkQueue {
public:
    explicit ChunkQueue(std::size_t capacity);

    ChunkQueue(const ChunkQueue&) = delete;
    ChunkQueue& operator=(const ChunkQueue&) = delete;

    /**
     * @brief Enqueue without blocking.
     * @return false if the queue is full or closed
     */
    bool tryPush(Chunk chunk);

    /**
     * @brief Wait up to timeout for the next chunk.
     */
    PopStatus pop(Chunk& out, std::chrono::milliseconds timeout);

    /**
     * @brief Mark end of stream and wake all waiters. Idempotent.
     */
    void close();

    bool isClosed() const;
    std::size_t size() const;
    std::size_t capacity() const { return capacity_; }

private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Chunk> chunks_;
    bool closed_ = false;
};

} // namespace streaming
} // namespace iptvmux

#endif // IPTVMUX_STREAMING_CHUNK_QUEUE_HPP
