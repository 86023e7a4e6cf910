// IptvMux - IPTV Stream Multiplexing Proxy
// Common type helpers

#include "iptvmux/core/types.hpp"

#include <algorithm>
#include <cctype>

namespace iptvmux {
namespace core {

const char* streamFormatToString(StreamFormat format) {
    switch (format) {
        case StreamFormat::Ts:
            return "ts";
        case StreamFormat::M3u8:
            return "m3u8";
        default:
            return "ts";
    }
}

std::optional<StreamFormat> parseStreamFormat(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "ts") {
        return StreamFormat::Ts;
    }
    if (lower == "m3u8") {
        return StreamFormat::M3u8;
    }
    return std::nullopt;
}

const char* defaultContentType(StreamFormat format) {
    switch (format) {
        case StreamFormat::M3u8:
            return "application/x-mpegURL";
        case StreamFormat::Ts:
        default:
            return "video/mp2t";
    }
}

} // namespace core
} // namespace iptvmux
