// IptvMux - IPTV Stream Multiplexing Proxy
// URL helpers implementation

#include "iptvmux/core/url.hpp"

#include <algorithm>
#include <cctype>

namespace iptvmux {
namespace core {

namespace {

std::string toLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

uint16_t defaultPort(const std::string& scheme) {
    return scheme == "https" ? 443 : 80;
}

Result<Url, Error> invalidUrl(const std::string& reason, const std::string& url) {
    return Result<Url, Error>::error(
        Error(ErrorCode::InvalidArgument, reason, maskUrlCredentials(url)));
}

} // anonymous namespace

std::string Url::hostHeader() const {
    std::string h = host.find(':') != std::string::npos ? "[" + host + "]" : host;
    if (port != defaultPort(scheme)) {
        h += ":" + std::to_string(port);
    }
    return h;
}

Result<Url, Error> parseUrl(const std::string& url) {
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos || schemeEnd == 0) {
        return invalidUrl("URL has no scheme", url);
    }

    Url result;
    result.scheme = toLower(url.substr(0, schemeEnd));
    if (result.scheme != "http" && result.scheme != "https") {
        return invalidUrl("Unsupported URL scheme: " + result.scheme, url);
    }

    std::string rest = url.substr(schemeEnd + 3);
    auto hashPos = rest.find('#');
    if (hashPos != std::string::npos) {
        rest.erase(hashPos);
    }

    auto authorityEnd = rest.find_first_of("/?");
    std::string authority = rest.substr(0, authorityEnd);
    if (authorityEnd == std::string::npos) {
        result.target = "/";
    } else if (rest[authorityEnd] == '?') {
        result.target = "/" + rest.substr(authorityEnd);
    } else {
        result.target = rest.substr(authorityEnd);
    }

    auto at = authority.rfind('@');
    if (at != std::string::npos) {
        result.userInfo = authority.substr(0, at);
        authority = authority.substr(at + 1);
    }

    std::string portStr;
    if (!authority.empty() && authority[0] == '[') {
        auto close = authority.find(']');
        if (close == std::string::npos) {
            return invalidUrl("Unterminated IPv6 address", url);
        }
        result.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') {
                return invalidUrl("Unexpected characters after IPv6 address", url);
            }
            portStr = authority.substr(close + 2);
        }
    } else {
        auto colon = authority.rfind(':');
        if (colon != std::string::npos) {
            result.host = authority.substr(0, colon);
            portStr = authority.substr(colon + 1);
        } else {
            result.host = authority;
        }
    }

    if (result.host.empty()) {
        return invalidUrl("URL has no host", url);
    }

    if (portStr.empty()) {
        result.port = defaultPort(result.scheme);
    } else {
        if (portStr.size() > 5 ||
            !std::all_of(portStr.begin(), portStr.end(),
                         [](unsigned char c) { return std::isdigit(c) != 0; })) {
            return invalidUrl("Invalid port: " + portStr, url);
        }
        unsigned long port = std::stoul(portStr);
        if (port == 0 || port > 65535) {
            return invalidUrl("Port out of range: " + portStr, url);
        }
        result.port = static_cast<uint16_t>(port);
    }

    return Result<Url, Error>::success(std::move(result));
}

Result<Url, Error> resolveRedirect(const Url& base, const std::string& location) {
    if (location.empty()) {
        return Result<Url, Error>::error(
            Error(ErrorCode::InvalidArgument, "Empty redirect location"));
    }
    if (location.find("://") != std::string::npos) {
        return parseUrl(location);
    }
    if (location.compare(0, 2, "//") == 0) {
        return parseUrl(base.scheme + ":" + location);
    }

    Url next = base;
    if (location[0] == '/') {
        next.target = location;
    } else {
        std::string path = base.target.substr(0, base.target.find('?'));
        auto slash = path.rfind('/');
        next.target = path.substr(0, slash + 1) + location;
    }
    return Result<Url, Error>::success(std::move(next));
}

std::string buildUpstreamUrl(const std::string& server,
                             const std::string& username,
                             const std::string& password,
                             const std::string& streamId,
                             StreamFormat format) {
    std::string base = server;
    if (base.find("://") == std::string::npos) {
        base = "http://" + base;
    }
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    return base + "/live/" + username + "/" + password + "/" + streamId + "." +
           streamFormatToString(format);
}

std::string maskUrlCredentials(const std::string& url) {
    std::string masked = url;

    auto schemeEnd = masked.find("://");
    std::size_t authorityStart = schemeEnd == std::string::npos ? 0 : schemeEnd + 3;
    auto authorityEnd = masked.find_first_of("/?#", authorityStart);
    if (authorityEnd == std::string::npos) {
        authorityEnd = masked.size();
    }

    auto at = masked.rfind('@', authorityEnd);
    if (at != std::string::npos && at >= authorityStart) {
        auto colon = masked.find(':', authorityStart);
        if (colon != std::string::npos && colon < at) {
            masked.replace(colon + 1, at - colon - 1, "***");
            authorityEnd = masked.find_first_of("/?#", authorityStart);
            if (authorityEnd == std::string::npos) {
                authorityEnd = masked.size();
            }
        }
    }

    auto live = masked.find("/live/", authorityEnd);
    if (live != std::string::npos) {
        std::size_t userStart = live + 6;
        auto userEnd = masked.find('/', userStart);
        if (userEnd != std::string::npos) {
            std::size_t passStart = userEnd + 1;
            auto passEnd = masked.find('/', passStart);
            if (passEnd != std::string::npos && passEnd > passStart) {
                masked.replace(passStart, passEnd - passStart, "***");
            }
        }
    }

    return masked;
}

} // namespace core
} // namespace iptvmux
