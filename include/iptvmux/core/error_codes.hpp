// IptvMux - IPTV Stream Multiplexing Proxy
// Process-wide error codes used for log context and diagnostics

#ifndef IPTVMUX_CORE_ERROR_CODES_HPP
#define IPTVMUX_CORE_ERROR_CODES_HPP

#include <cstdint>
#include <string>

namespace iptvmux {
namespace core {

/**
 * @brief Error codes shared by all IptvMux layers.
 *
 * Module specific error structs (ConfigError, UpstreamError, ...) carry
 * their own finer grained codes; this enumeration is what ends up in
 * structured log records as "error_code".
 */
enum class ErrorCode : uint32_t {
    // General (0-99)
    Success = 0,
    Unknown = 1,
    InvalidArgument = 2,
    Cancelled = 3,

    // Upstream (300-399)
    UpstreamTimeout = 300,
    UpstreamConnectionFailed = 301,
    UpstreamHttpStatus = 302,
    UpstreamProtocolError = 303,

    // Streams (400-499)
    SubscriberDropped = 402,

    // Admission (500-599)
    AccountNotFound = 500,
    AccountDisabled = 501,
    NoAvailableSlots = 504,
};

/**
 * @brief Human readable name for an error code.
 */
inline const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::Unknown: return "Unknown error";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::Cancelled: return "Cancelled";
        case ErrorCode::UpstreamTimeout: return "Upstream timeout";
        case ErrorCode::UpstreamConnectionFailed: return "Upstream connection failed";
        case ErrorCode::UpstreamHttpStatus: return "Upstream HTTP error";
        case ErrorCode::UpstreamProtocolError: return "Upstream protocol error";
        case ErrorCode::SubscriberDropped: return "Subscriber dropped";
        case ErrorCode::AccountNotFound: return "Account not found";
        case ErrorCode::AccountDisabled: return "Account disabled";
        case ErrorCode::NoAvailableSlots: return "No available connection slots";
        default: return "Unknown error code";
    }
}

/**
 * @brief Generic error with code, message and optional context.
 */
struct Error {
    ErrorCode code;
    std::string message;
    std::string context;

    Error(ErrorCode c = ErrorCode::Unknown,
          std::string msg = "",
          std::string ctx = "")
        : code(c)
        , message(std::move(msg))
        , context(std::move(ctx)) {}

    [[nodiscard]] std::string toString() const {
        std::string result = errorCodeToString(code);
        if (!message.empty()) {
            result += ": " + message;
        }
        if (!context.empty()) {
            result += " [" + context + "]";
        }
        return result;
    }
};

} // namespace core
} // namespace iptvmux

#endif // IPTVMUX_CORE_ERROR_CODES_HPP
