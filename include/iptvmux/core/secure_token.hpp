// IptvMux - IPTV Stream Multiplexing Proxy
// Random token generation for subscriber ids and session tokens

#ifndef IPTVMUX_CORE_SECURE_TOKEN_HPP
#define IPTVMUX_CORE_SECURE_TOKEN_HPP

#include "iptvmux/core/error_codes.hpp"
#include "iptvmux/core/result.hpp"

#include <cstddef>
#include <string>

namespace iptvmux {
namespace core {

// Subscriber ids are 128-bit, session tokens 256-bit.
constexpr std::size_t SUBSCRIBER_ID_BYTES = 16;
constexpr std::size_t SESSION_TOKEN_BYTES = 32;

// Number of leading characters of a token that may appear in logs and headers.
constexpr std::size_t TOKEN_LOG_PREFIX = 8;

/**
 * @brief Generate a cryptographically random token.
 *
 * Uses OpenSSL RAND_bytes.
 *
 * @param byteCount Number of random bytes
 * @return Lower case hex string of 2 * byteCount characters
 */
Result<std::string, Error> generateSecureToken(std::size_t byteCount);

/**
 * @brief Truncate a token for logging ("0123abcd...").
 */
std::string tokenPrefix(const std::string& token);

} // namespace core
} // namespace iptvmux

#endif // IPTVMUX_CORE_SECURE_TOKEN_HPP
