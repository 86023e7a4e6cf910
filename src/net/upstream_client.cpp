// IptvMux - IPTV Stream Multiplexing Proxy
// Upstream error classification

#include "iptvmux/net/upstream_client.hpp"

namespace iptvmux {
namespace net {

std::string UpstreamError::toString() const {
    switch (code) {
        case Code::Timeout:
            return "Upstream timeout: " + message;
        case Code::ConnectionFailed:
            return "Connection error: " + message;
        case Code::HttpStatus:
            return "HTTP error: " + std::to_string(httpStatus);
        case Code::Protocol:
            return "Protocol error: " + message;
        case Code::Cancelled:
            return "Cancelled: " + message;
        default:
            return message;
    }
}

core::ErrorCode UpstreamError::toErrorCode() const {
    switch (code) {
        case Code::Timeout:
            return core::ErrorCode::UpstreamTimeout;
        case Code::ConnectionFailed:
            return core::ErrorCode::UpstreamConnectionFailed;
        case Code::HttpStatus:
            return core::ErrorCode::UpstreamHttpStatus;
        case Code::Protocol:
            return core::ErrorCode::UpstreamProtocolError;
        case Code::Cancelled:
            return core::ErrorCode::Cancelled;
        default:
            return core::ErrorCode::Unknown;
    }
}

} // namespace net
} // namespace iptvmux
