// IptvMux - IPTV Stream Multiplexing Proxy
// Common type definitions

#ifndef IPTVMUX_CORE_TYPES_HPP
#define IPTVMUX_CORE_TYPES_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace iptvmux {
namespace core {

// Identifiers
using AccountId = int64_t;
using CredentialId = int64_t;

// Credential id of the implicit single credential stored on an account
// that has no credential list of its own.
constexpr CredentialId LEGACY_CREDENTIAL_ID = 0;

// All lifecycle timestamps are taken from a monotonic clock.
using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration = Clock::duration;

/**
 * @brief Container format requested by a client.
 */
enum class StreamFormat : uint8_t {
    Ts,    ///< MPEG transport stream
    M3u8   ///< HLS playlist
};

/**
 * @brief Lower case extension used in URLs and stream keys ("ts", "m3u8").
 */
const char* streamFormatToString(StreamFormat format);

/**
 * @brief Parse an extension (case-insensitive).
 */
std::optional<StreamFormat> parseStreamFormat(const std::string& str);

/**
 * @brief Content type assumed until the upstream reports its own.
 */
const char* defaultContentType(StreamFormat format);

/**
 * @brief Identifies one distinct upstream resource.
 *
 * Two clients asking for the same key share one upstream connection.
 * Rendered as "{account}:{stream}:{format}".
 */
struct StreamKey {
    AccountId accountId = 0;
    std::string streamId;
    StreamFormat format = StreamFormat::Ts;

    StreamKey() = default;
    StreamKey(AccountId account, std::string stream, StreamFormat fmt)
        : accountId(account), streamId(std::move(stream)), format(fmt) {}

    [[nodiscard]] std::string toString() const {
        return std::to_string(accountId) + ":" + streamId + ":" +
               streamFormatToString(format);
    }

    bool operator==(const StreamKey& other) const {
        return accountId == other.accountId &&
               streamId == other.streamId &&
               format == other.format;
    }

    bool operator!=(const StreamKey& other) const {
        return !(*this == other);
    }

    bool operator<(const StreamKey& other) const {
        if (accountId != other.accountId) return accountId < other.accountId;
        if (streamId != other.streamId) return streamId < other.streamId;
        return format < other.format;
    }
};

/**
 * @brief Hash functor so StreamKey can key unordered containers.
 */
struct StreamKeyHash {
    std::size_t operator()(const StreamKey& key) const noexcept {
        std::size_t h = std::hash<AccountId>{}(key.accountId);
        h ^= std::hash<std::string>{}(key.streamId) + 0x9e3779b9 + (h << 6) + (h >> 2);
        h ^= std::hash<int>{}(static_cast<int>(key.format)) + 0x9e3779b9 + (h << 6) + (h >> 2);
        return h;
    }
};

} // namespace core
} // namespace iptvmux

#endif // IPTVMUX_CORE_TYPES_HPP
