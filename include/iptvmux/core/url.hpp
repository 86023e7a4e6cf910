// IptvMux - IPTV Stream Multiplexing Proxy
// URL helpers
//
// Responsibilities:
// - Split absolute http/https URLs into their components
// - Build provider stream URLs from account and credential data
// - Mask embedded passwords before a URL reaches a log line

#ifndef IPTVMUX_CORE_URL_HPP
#define IPTVMUX_CORE_URL_HPP

#include "iptvmux/core/error_codes.hpp"
#include "iptvmux/core/result.hpp"
#include "iptvmux/core/types.hpp"

#include <cstdint>
#include <string>

namespace iptvmux {
namespace core {

/**
 * @brief Components of an absolute URL.
 */
struct Url {
    std::string scheme;    ///< "http" or "https" (lower case)
    std::string userInfo;  ///< "user:password" without '@', may be empty
    std::string host;      ///< Host name or address, brackets stripped for IPv6
    uint16_t port = 0;     ///< Explicit port or scheme default
    std::string target;    ///< Path plus query, always starts with '/'

    [[nodiscard]] bool isTls() const { return scheme == "https"; }

    /**
     * @brief Value for the Host request header.
     *
     * Omits the port when it is the scheme default.
     */
    [[nodiscard]] std::string hostHeader() const;
};

/**
 * @brief Parse an absolute http or https URL.
 */
Result<Url, Error> parseUrl(const std::string& url);

/**
 * @brief Resolve a Location header against the URL that produced it.
 */
Result<Url, Error> resolveRedirect(const Url& base, const std::string& location);

/**
 * @brief Provider URL "{server}/live/{user}/{password}/{stream}.{fmt}".
 *
 * A server without scheme is prefixed with "http://".
 */
std::string buildUpstreamUrl(const std::string& server,
                             const std::string& username,
                             const std::string& password,
                             const std::string& streamId,
                             StreamFormat format);

/**
 * @brief Replace embedded passwords with "***".
 *
 * Masks the password of "user:password@" userinfo and the password segment
 * of "/live/{user}/{password}/" provider paths.
 */
std::string maskUrlCredentials(const std::string& url);

} // namespace core
} // namespace iptvmux

#endif // IPTVMUX_CORE_URL_HPP
