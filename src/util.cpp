#include "util.hpp"
#include "version.hpp"

#include <cctype>
#include <stdexcept>

namespace dockapi {

namespace {

const char kHex[] = "0123456789ABCDEF";

bool isUnreserved(unsigned char ch) {
    return std::isalnum(ch) || ch == '-' || ch == '_' || ch == '.' || ch == '~';
}

bool isPathSafe(unsigned char ch) {
    if (isUnreserved(ch)) return true;
    switch (ch) {
        case '/': case '$': case '&': case '+': case ',':
        case ':': case ';': case '=': case '@':
            return true;
        default:
            return false;
    }
}

void appendEscaped(std::string& out, unsigned char ch) {
    out += '%';
    out += kHex[ch >> 4];
    out += kHex[ch & 0x0F];
}

std::string queryEscape(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        const auto ch = static_cast<unsigned char>(c);
        if (isUnreserved(ch)) {
            out += c;
        } else if (ch == ' ') {
            out += '+';
        } else {
            appendEscaped(out, ch);
        }
    }
    return out;
}

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool equalsIgnoreCase(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

std::string collapseSlashes(const std::string& path) {
    std::string out;
    out.reserve(path.size());
    for (char c : path) {
        if (c == '/' && !out.empty() && out.back() == '/') continue;
        out += c;
    }
    return out;
}

} // namespace

HostAddress parseHostUrl(const std::string& host) {
    auto schemeEnd = host.find("://");
    if (schemeEnd == std::string::npos || schemeEnd == 0 ||
        schemeEnd + 3 == host.size()) {
        throw std::invalid_argument("unable to parse host `" + host + "`");
    }

    HostAddress addr;
    addr.scheme = host.substr(0, schemeEnd);
    const std::string rest = host.substr(schemeEnd + 3);

    if (!isNetworkScheme(addr.scheme)) {
        addr.host = rest;
        return addr;
    }

    // --- authority / base path ---
    auto pathStart = rest.find('/');
    if (pathStart == std::string::npos) {
        addr.host = rest;
    } else {
        addr.host = rest.substr(0, pathStart);
        addr.path = unescapePath(rest.substr(pathStart));
    }

    if (addr.host.empty()) {
        throw std::invalid_argument("unable to parse host `" + host +
                                    "` (empty authority)");
    }
    return addr;
}

bool isNetworkScheme(const std::string& scheme) {
    return scheme == "tcp" || scheme == "http" || scheme == "https";
}

void splitAuthority(const std::string& authority,
                    const std::string& defaultPort,
                    std::string& hostOut,
                    std::string& portOut)
{
    if (!authority.empty() && authority[0] == '[') {
        auto close = authority.find(']');
        if (close == std::string::npos) {
            throw std::invalid_argument("Invalid IPv6 authority: " + authority);
        }
        hostOut = authority.substr(1, close - 1);
        portOut = (close + 1 < authority.size() && authority[close + 1] == ':')
                      ? authority.substr(close + 2)
                      : defaultPort;
        return;
    }

    auto colon = authority.rfind(':');
    if (colon == std::string::npos) {
        hostOut = authority;
        portOut = defaultPort;
    } else {
        hostOut = authority.substr(0, colon);
        portOut = authority.substr(colon + 1);
    }
    if (portOut.empty()) portOut = defaultPort;
}

std::string unescapePath(const std::string& path) {
    std::string out;
    out.reserve(path.size());
    for (std::size_t i = 0; i < path.size(); ++i) {
        if (path[i] != '%') {
            out += path[i];
            continue;
        }
        const int hi = i + 2 < path.size() ? hexValue(path[i + 1]) : -1;
        const int lo = i + 2 < path.size() ? hexValue(path[i + 2]) : -1;
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument("Invalid escape in path: " + path);
        }
        out += static_cast<char>((hi << 4) | lo);
        i += 2;
    }
    return out;
}

std::string escapePath(const std::string& path) {
    std::string out;
    out.reserve(path.size());
    for (char c : path) {
        const auto ch = static_cast<unsigned char>(c);
        if (isPathSafe(ch)) {
            out += c;
        } else {
            appendEscaped(out, ch);
        }
    }
    return out;
}

std::string encodeQuery(const QueryValues& query) {
    std::string out;
    for (const auto& [key, values] : query) {
        const auto escapedKey = queryEscape(key);
        for (const auto& value : values) {
            if (!out.empty()) out += '&';
            out += escapedKey;
            out += '=';
            out += queryEscape(value);
        }
    }
    return out;
}

std::string buildApiPath(const std::string& version,
                         const std::string& path,
                         const QueryValues& query,
                         const std::string& basePath)
{
    std::string raw = basePath;
    const auto bare = normalizeVersion(version);
    if (!bare.empty()) {
        raw += "/v" + bare;
    }
    raw += path;

    std::string target = escapePath(collapseSlashes(raw));
    if (target.empty()) target = "/";

    const auto encoded = encodeQuery(query);
    if (!encoded.empty()) {
        target += '?';
        target += encoded;
    }
    return target;
}

std::optional<std::string> resolveRedirectTarget(const std::string& currentTarget,
                                                 const std::string& location,
                                                 const std::string& authority)
{
    if (location.empty()) {
        throw std::runtime_error("Redirect response without a Location header");
    }

    auto schemeEnd = location.find("://");
    if (schemeEnd != std::string::npos) {
        const auto authorityStart = schemeEnd + 3;
        auto pathStart = location.find_first_of("/?", authorityStart);
        const auto target = location.substr(0, pathStart).substr(authorityStart);
        if (!equalsIgnoreCase(target, authority)) {
            return std::nullopt;
        }
        if (pathStart == std::string::npos) return std::string("/");
        if (location[pathStart] == '?') return "/" + location.substr(pathStart);
        return location.substr(pathStart);
    }

    // Scheme-relative reference ("//host/path") names an authority too.
    if (location.compare(0, 2, "//") == 0) {
        return resolveRedirectTarget(currentTarget, "x:" + location, authority);
    }

    if (location[0] == '/') return location;

    // Relative reference: replace the last segment of the current path.
    auto pathEnd = currentTarget.find('?');
    const auto currentPath = currentTarget.substr(0, pathEnd);
    auto lastSlash = currentPath.rfind('/');
    if (lastSlash == std::string::npos) return "/" + location;
    return currentPath.substr(0, lastSlash + 1) + location;
}

} // namespace dockapi
