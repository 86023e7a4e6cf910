// IptvMux - IPTV Stream Multiplexing Proxy
// HTTP/1.1 message primitives implementation

#include "iptvmux/net/http_types.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace iptvmux {
namespace net {

namespace {

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::vector<std::string> splitLines(const std::string& head) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start <= head.size()) {
        size_t end = head.find("\r\n", start);
        if (end == std::string::npos) {
            end = head.size();
        }
        lines.push_back(head.substr(start, end - start));
        start = end + 2;
    }
    return lines;
}

bool isTokenChar(unsigned char c) {
    return std::isalnum(c) || std::string("!#$%&'*+-.^_`|~").find(static_cast<char>(c)) != std::string::npos;
}

// Header lines after the first; obsolete line folding is rejected.
core::Result<void, HttpParseError> parseHeaderLines(const std::vector<std::string>& lines,
                                                    HttpHeaders& headers) {
    for (size_t i = 1; i < lines.size(); ++i) {
        const std::string& line = lines[i];
        if (line.empty()) {
            continue;
        }
        size_t colon = line.find(':');
        if (colon == std::string::npos || colon == 0) {
            return core::Result<void, HttpParseError>::error(
                HttpParseError(HttpParseError::Code::Malformed, "Malformed header line"));
        }
        std::string name = line.substr(0, colon);
        if (!std::all_of(name.begin(), name.end(),
                         [](unsigned char c) { return isTokenChar(c); })) {
            return core::Result<void, HttpParseError>::error(
                HttpParseError(HttpParseError::Code::Malformed, "Invalid header name: " + name));
        }
        headers.add(std::move(name), trim(line.substr(colon + 1)));
    }
    return core::Result<void, HttpParseError>::success();
}

} // anonymous namespace

// =============================================================================
// String helpers
// =============================================================================

bool iequals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

std::string toLower(const std::string& str) {
    std::string out;
    out.reserve(str.size());
    for (unsigned char c : str) {
        out.push_back(static_cast<char>(std::tolower(c)));
    }
    return out;
}

std::string trim(const std::string& str) {
    size_t begin = str.find_first_not_of(" \t");
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = str.find_last_not_of(" \t");
    return str.substr(begin, end - begin + 1);
}

std::string urlDecode(const std::string& str, bool plusAsSpace) {
    std::string out;
    out.reserve(str.size());
    for (size_t i = 0; i < str.size(); ++i) {
        char c = str[i];
        if (c == '%' && i + 2 < str.size()) {
            int hi = hexValue(str[i + 1]);
            int lo = hexValue(str[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        if (c == '+' && plusAsSpace) {
            out.push_back(' ');
        } else {
            out.push_back(c);
        }
    }
    return out;
}

std::map<std::string, std::string> parseQueryString(const std::string& query) {
    std::map<std::string, std::string> params;
    size_t start = 0;
    while (start < query.size()) {
        size_t amp = query.find('&', start);
        if (amp == std::string::npos) {
            amp = query.size();
        }
        std::string pair = query.substr(start, amp - start);
        if (!pair.empty()) {
            size_t eq = pair.find('=');
            if (eq == std::string::npos) {
                params[urlDecode(pair, true)] = "";
            } else {
                params[urlDecode(pair.substr(0, eq), true)] = urlDecode(pair.substr(eq + 1), true);
            }
        }
        start = amp + 1;
    }
    return params;
}

const char* reasonPhrase(int statusCode) {
    switch (statusCode) {
        case 200: return "OK";
        case 204: return "No Content";
        case 301: return "Moved Permanently";
        case 302: return "Found";
        case 304: return "Not Modified";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 408: return "Request Timeout";
        case 413: return "Payload Too Large";
        case 431: return "Request Header Fields Too Large";
        case 500: return "Internal Server Error";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        case 504: return "Gateway Timeout";
        case 505: return "HTTP Version Not Supported";
        default: return "Unknown";
    }
}

// =============================================================================
// HttpHeaders
// =============================================================================

void HttpHeaders::add(std::string name, std::string value) {
    entries_.emplace_back(std::move(name), std::move(value));
}

void HttpHeaders::set(const std::string& name, std::string value) {
    remove(name);
    entries_.emplace_back(name, std::move(value));
}

std::optional<std::string> HttpHeaders::get(const std::string& name) const {
    for (const auto& entry : entries_) {
        if (iequals(entry.first, name)) {
            return entry.second;
        }
    }
    return std::nullopt;
}

bool HttpHeaders::contains(const std::string& name) const {
    return get(name).has_value();
}

void HttpHeaders::remove(const std::string& name) {
    entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                  [&name](const Entry& e) { return iequals(e.first, name); }),
                   entries_.end());
}

// =============================================================================
// Message heads
// =============================================================================

std::optional<std::string> HttpRequest::queryParam(const std::string& name) const {
    auto it = query.find(name);
    if (it == query.end()) {
        return std::nullopt;
    }
    return it->second;
}

core::Result<HttpRequest, HttpParseError> parseRequestHead(const std::string& head) {
    using ResultType = core::Result<HttpRequest, HttpParseError>;

    std::vector<std::string> lines = splitLines(head);
    const std::string& requestLine = lines.front();

    size_t firstSpace = requestLine.find(' ');
    size_t secondSpace = firstSpace == std::string::npos
        ? std::string::npos : requestLine.find(' ', firstSpace + 1);
    if (firstSpace == std::string::npos || secondSpace == std::string::npos ||
        requestLine.find(' ', secondSpace + 1) != std::string::npos) {
        return ResultType::error(
            HttpParseError(HttpParseError::Code::Malformed, "Malformed request line"));
    }

    HttpRequest request;
    request.method = requestLine.substr(0, firstSpace);
    request.target = requestLine.substr(firstSpace + 1, secondSpace - firstSpace - 1);
    request.version = requestLine.substr(secondSpace + 1);

    if (request.method.empty() ||
        !std::all_of(request.method.begin(), request.method.end(),
                     [](unsigned char c) { return std::isupper(c) != 0; })) {
        return ResultType::error(
            HttpParseError(HttpParseError::Code::Malformed, "Invalid method"));
    }
    if (request.target.empty() || request.target[0] != '/') {
        return ResultType::error(
            HttpParseError(HttpParseError::Code::Malformed, "Request target must be origin-form"));
    }
    if (request.version != "HTTP/1.1" && request.version != "HTTP/1.0") {
        return ResultType::error(
            HttpParseError(HttpParseError::Code::UnsupportedVersion,
                           "Unsupported version: " + request.version));
    }

    size_t question = request.target.find('?');
    if (question != std::string::npos) {
        request.path = urlDecode(request.target.substr(0, question));
        request.query = parseQueryString(request.target.substr(question + 1));
    } else {
        request.path = urlDecode(request.target);
    }

    auto headers = parseHeaderLines(lines, request.headers);
    if (headers.isError()) {
        return ResultType::error(headers.error());
    }
    return ResultType::success(std::move(request));
}

core::Result<HttpResponseHead, HttpParseError> parseResponseHead(const std::string& head) {
    using ResultType = core::Result<HttpResponseHead, HttpParseError>;

    std::vector<std::string> lines = splitLines(head);
    const std::string& statusLine = lines.front();

    // "HTTP/1.1 200 OK", reason phrase optional
    if (statusLine.compare(0, 5, "HTTP/") != 0) {
        return ResultType::error(
            HttpParseError(HttpParseError::Code::Malformed, "Malformed status line"));
    }
    size_t firstSpace = statusLine.find(' ');
    if (firstSpace == std::string::npos || firstSpace + 4 > statusLine.size()) {
        return ResultType::error(
            HttpParseError(HttpParseError::Code::Malformed, "Malformed status line"));
    }

    HttpResponseHead response;
    response.version = statusLine.substr(0, firstSpace);
    std::string code = statusLine.substr(firstSpace + 1, 3);
    if (!std::all_of(code.begin(), code.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return ResultType::error(
            HttpParseError(HttpParseError::Code::Malformed, "Invalid status code"));
    }
    response.statusCode = std::atoi(code.c_str());
    if (firstSpace + 4 < statusLine.size()) {
        response.reason = trim(statusLine.substr(firstSpace + 4));
    }

    auto headers = parseHeaderLines(lines, response.headers);
    if (headers.isError()) {
        return ResultType::error(headers.error());
    }
    return ResultType::success(std::move(response));
}

} // namespace net
} // namespace iptvmux
