// IptvMux - IPTV Stream Multiplexing Proxy
// HTTP/1.1 message primitives shared by the upstream client and the server
//
// Responsibilities:
// - Case-insensitive header collection
// - Request head parsing (request line, headers, query string)
// - Response head parsing for the upstream client
// - Percent decoding and reason phrases

#ifndef IPTVMUX_NET_HTTP_TYPES_HPP
#define IPTVMUX_NET_HTTP_TYPES_HPP

#include "iptvmux/core/result.hpp"

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace iptvmux {
namespace net {

/**
 * @brief Compare two strings ignoring ASCII case.
 */
bool iequals(const std::string& a, const std::string& b);

/**
 * @brief Lower case copy of a string.
 */
std::string toLower(const std::string& str);

/**
 * @brief Copy without leading and trailing spaces and tabs.
 */
std::string trim(const std::string& str);

/**
 * @brief Decode %XX escapes, and '+' as space when plusAsSpace is set.
 *
 * Malformed escapes are kept verbatim.
 */
std::string urlDecode(const std::string& str, bool plusAsSpace = false);

/**
 * @brief Parse "a=1&b=2" into a map. Later duplicates win.
 */
std::map<std::string, std::string> parseQueryString(const std::string& query);

/**
 * @brief Standard reason phrase for a status code ("OK", "Not Found", ...).
 */
const char* reasonPhrase(int statusCode);

/**
 * @brief Ordered header list with case-insensitive lookup.
 */
class HttpHeaders {
public:
    using Entry = std::pair<std::string, std::string>;

    /**
     * @brief Append a header, keeping existing values of the same name.
     */
    void add(std::string name, std::string value);

    /**
     * @brief Replace every header of this name with a single value.
     */
    void set(const std::string& name, std::string value);

    /**
     * @brief First value of the named header.
     */
    std::optional<std::string> get(const std::string& name) const;

    bool contains(const std::string& name) const;

    void remove(const std::string& name);

    const std::vector<Entry>& entries() const { return entries_; }
    bool empty() const { return entries_.empty(); }

private:
    std::vector<Entry> entries_;
};

/**
 * @brief Error raised while parsing an HTTP message head.
 */
struct HttpParseError {
    enum class Code {
        Malformed,
        UnsupportedVersion,
        TooLarge
    };

    Code code = Code::Malformed;
    std::string message;

    HttpParseError() = default;
    HttpParseError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
};

/**
 * @brief Parsed request received by the HTTP server.
 */
struct HttpRequest {
    std::string method;                          ///< Upper case as sent
    std::string target;                          ///< Raw request target
    std::string path;                            ///< Percent-decoded path
    std::map<std::string, std::string> query;    ///< Decoded query parameters
    std::string version;                         ///< "HTTP/1.0" or "HTTP/1.1"
    HttpHeaders headers;
    std::string clientIp;                        ///< Peer address

    std::optional<std::string> queryParam(const std::string& name) const;
};

/**
 * @brief Status line and headers of an upstream response.
 */
struct HttpResponseHead {
    int statusCode = 0;
    std::string reason;
    std::string version;
    HttpHeaders headers;
};

/**
 * @brief Parse a request head.
 *
 * @param head Request line and header lines, CRLF separated, without the
 *             terminating empty line
 */
core::Result<HttpRequest, HttpParseError> parseRequestHead(const std::string& head);

/**
 * @brief Parse a response head.
 *
 * @param head Status line and header lines, CRLF separated, without the
 *             terminating empty line
 */
core::Result<HttpResponseHead, HttpParseError> parseResponseHead(const std::string& head);

} // namespace net
} // namespace iptvmux

#endif // IPTVMUX_NET_HTTP_TYPES_HPP
