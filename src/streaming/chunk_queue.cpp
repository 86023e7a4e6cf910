// IptvMux - IPTV Stream Multiplexing Proxy
// Chunk Queue Implementation

#include "iptvmux/streaming/chunk_queue.hpp"

namespace iptvmux {
namespace streaming {

ChunkQueue::ChunkQueue(std::size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {
}

bool ChunkQueue::tryPush(Chunk chunk) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || chunks_.size() >= capacity_) {
            return false;
        }
        chunks_.push_back(std::move(chunk));
    }
    cv_.notify_one();
    return true;
}

PopStatus ChunkQueue::pop(Chunk& out, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return !chunks_.empty() || closed_; });

    if (!chunks_.empty()) {
        out = std::move(chunks_.front());
        chunks_.pop_front();
        return PopStatus::Chunk;
    }
    return closed_ ? PopStatus::End : PopStatus::Timeout;
}

void ChunkQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool ChunkQueue::isClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

std::size_t ChunkQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return chunks_.size();
}

} // namespace streaming
} // namespace iptvmux
