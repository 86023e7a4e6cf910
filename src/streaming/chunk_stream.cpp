// IptvMux - IPTV Stream Multiplexing Proxy
// Chunk Stream Implementation

#include "iptvmux/streaming/chunk_stream.hpp"
#include "iptvmux/streaming/stream_registry.hpp"

namespace iptvmux {
namespace streaming {

ChunkStream::ChunkStream(StreamRegistry* registry,
                         std::shared_ptr<SharedStream> stream,
                         std::shared_ptr<StreamSubscriber> subscriber,
                         std::shared_ptr<core::IClock> clock,
                         std::chrono::milliseconds wait)
    : registry_(registry)
    , stream_(std::move(stream))
    , subscriber_(std::move(subscriber))
    , clock_(std::move(clock))
    , wait_(wait) {
}

ChunkStream::~ChunkStream() {
    close();
}

ChunkStream::ChunkStream(ChunkStream&& other) noexcept
    : registry_(other.registry_)
    , stream_(std::move(other.stream_))
    , subscriber_(std::move(other.subscriber_))
    , clock_(std::move(other.clock_))
    , wait_(other.wait_) {
    other.registry_ = nullptr;
}

ChunkStream& ChunkStream::operator=(ChunkStream&& other) noexcept {
    if (this != &other) {
        close();
        registry_ = other.registry_;
        stream_ = std::move(other.stream_);
        subscriber_ = std::move(other.subscriber_);
        clock_ = std::move(other.clock_);
        wait_ = other.wait_;
        other.registry_ = nullptr;
    }
    return *this;
}

std::optional<Chunk> ChunkStream::next() {
    if (!isOpen()) {
        return std::nullopt;
    }

    while (true) {
        Chunk chunk;
        PopStatus status = subscriber_->queue().pop(chunk, wait_);

        if (status == PopStatus::Chunk) {
            subscriber_->recordRead(chunk->size(), clock_->now());
            return chunk;
        }
        if (status == PopStatus::End) {
            close();
            return std::nullopt;
        }
        if (!stream_->isActive() || !subscriber_->isActive()) {
            close();
            return std::nullopt;
        }
    }
}

void ChunkStream::close() {
    if (registry_ == nullptr) {
        return;
    }
    StreamRegistry* registry = registry_;
    registry_ = nullptr;
    registry->unsubscribe(stream_, subscriber_);
}

} // namespace streaming
} // namespace iptvmux
