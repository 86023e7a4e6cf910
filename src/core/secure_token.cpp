// IptvMux - IPTV Stream Multiplexing Proxy
// Random token generation

#include "iptvmux/core/secure_token.hpp"

#include <openssl/err.h>
#include <openssl/rand.h>

#include <vector>

namespace iptvmux {
namespace core {

Result<std::string, Error> generateSecureToken(std::size_t byteCount) {
    if (byteCount == 0) {
        return Result<std::string, Error>::error(
            Error(ErrorCode::InvalidArgument, "Token length must be positive"));
    }

    std::vector<unsigned char> bytes(byteCount);
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        char buf[256];
        ERR_error_string_n(ERR_get_error(), buf, sizeof(buf));
        return Result<std::string, Error>::error(
            Error(ErrorCode::Unknown, "RAND_bytes failed", buf));
    }

    static const char hexDigits[] = "0123456789abcdef";
    std::string token;
    token.reserve(byteCount * 2);
    for (unsigned char b : bytes) {
        token.push_back(hexDigits[b >> 4]);
        token.push_back(hexDigits[b & 0x0F]);
    }
    return Result<std::string, Error>::success(std::move(token));
}

std::string tokenPrefix(const std::string& token) {
    if (token.size() <= TOKEN_LOG_PREFIX) {
        return token;
    }
    return token.substr(0, TOKEN_LOG_PREFIX) + "...";
}

} // namespace core
} // namespace iptvmux
