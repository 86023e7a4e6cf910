// IptvMux - IPTV Stream Multiplexing Proxy
// Tests for the bounded per-subscriber chunk queue

#include <gtest/gtest.h>
#include "iptvmux/streaming/chunk_queue.hpp"

#include <string>
#include <thread>

namespace iptvmux {
namespace streaming {
namespace test {

namespace {

Chunk makeChunk(const std::string& text) {
    return std::make_shared<const std::vector<uint8_t>>(text.begin(), text.end());
}

std::string text(const Chunk& chunk) {
    return std::string(chunk->begin(), chunk->end());
}

constexpr std::chrono::milliseconds kShortWait{20};

} // anonymous namespace

TEST(ChunkQueueTest, PopsInPushOrder) {
    ChunkQueue queue(4);
    ASSERT_TRUE(queue.tryPush(makeChunk("a")));
    ASSERT_TRUE(queue.tryPush(makeChunk("b")));

    Chunk out;
    ASSERT_EQ(queue.pop(out, kShortWait), PopStatus::Chunk);
    EXPECT_EQ(text(out), "a");
    ASSERT_EQ(queue.pop(out, kShortWait), PopStatus::Chunk);
    EXPECT_EQ(text(out), "b");
    EXPECT_EQ(queue.size(), 0u);
}

TEST(ChunkQueueTest, FullQueueRejectsWithoutBlocking) {
    ChunkQueue queue(2);
    EXPECT_TRUE(queue.tryPush(makeChunk("1")));
    EXPECT_TRUE(queue.tryPush(makeChunk("2")));
    EXPECT_FALSE(queue.tryPush(makeChunk("3")));
    EXPECT_EQ(queue.size(), 2u);
}

TEST(ChunkQueueTest, ZeroCapacityHoldsOne) {
    ChunkQueue queue(0);
    EXPECT_EQ(queue.capacity(), 1u);
    EXPECT_TRUE(queue.tryPush(makeChunk("only")));
    EXPECT_FALSE(queue.tryPush(makeChunk("more")));
}

TEST(ChunkQueueTest, EmptyPopTimesOut) {
    ChunkQueue queue(1);
    Chunk out;
    EXPECT_EQ(queue.pop(out, kShortWait), PopStatus::Timeout);
}

TEST(ChunkQueueTest, CloseDrainsBeforeEnd) {
    ChunkQueue queue(4);
    queue.tryPush(makeChunk("last"));
    queue.close();

    EXPECT_TRUE(queue.isClosed());
    EXPECT_FALSE(queue.tryPush(makeChunk("late")));

    Chunk out;
    ASSERT_EQ(queue.pop(out, kShortWait), PopStatus::Chunk);
    EXPECT_EQ(text(out), "last");
    EXPECT_EQ(queue.pop(out, kShortWait), PopStatus::End);
}

TEST(ChunkQueueTest, CloseWakesBlockedConsumer) {
    ChunkQueue queue(1);
    PopStatus status = PopStatus::Timeout;

    std::thread consumer([&] {
        Chunk out;
        status = queue.pop(out, std::chrono::seconds(5));
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    queue.close();
    consumer.join();

    EXPECT_EQ(status, PopStatus::End);
}

TEST(ChunkQueueTest, PushWakesBlockedConsumer) {
    ChunkQueue queue(1);
    std::string received;

    std::thread consumer([&] {
        Chunk out;
        if (queue.pop(out, std::chrono::seconds(5)) == PopStatus::Chunk) {
            received = text(out);
        }
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    queue.tryPush(makeChunk("wake"));
    consumer.join();

    EXPECT_EQ(received, "wake");
}

} // namespace test
} // namespace streaming
} // namespace iptvmux
