#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace dockapi {

/// Query parameters; a key may repeat.  Encoded in key order.
using QueryValues = std::map<std::string, std::vector<std::string>>;

/// Decomposed daemon host string.
struct HostAddress {
    std::string scheme;   // "unix", "npipe", "tcp", ...
    std::string host;     // authority, or the socket/pipe path verbatim
    std::string path;     // base path, network schemes only
};

/// Parse a daemon host string of the form "scheme://rest".
///
/// For "tcp", "http" and "https" the remainder is split into authority and
/// base path at the first '/'.  The base path is percent-decoded.  For every other scheme the remainder is kept
/// whole as the host, so "unix:///var/run/docker.sock" yields the host
/// "/var/run/docker.sock".
/// Throws std::invalid_argument when there is no "://" or nothing after it.
HostAddress parseHostUrl(const std::string& host);

/// True for schemes whose host is a network authority.
bool isNetworkScheme(const std::string& scheme);

/// Split "host:port" (or "[v6]:port").  @p defaultPort is used when absent.
void splitAuthority(const std::string& authority,
                    const std::string& defaultPort,
                    std::string& hostOut,
                    std::string& portOut);

/// Decode %XX escapes.  Throws std::invalid_argument on a malformed escape.
std::string unescapePath(const std::string& path);

/// Percent-encode a URL path.  '/' and the sub-delimiters allowed in a path
/// segment are kept.
std::string escapePath(const std::string& path);

/// application/x-www-form-urlencoded encoding of @p query.
std::string encodeQuery(const QueryValues& query);

/// Build the request target sent on the wire:
///   basePath + "/v" + version + path [+ "?" + query]
/// A leading 'v' on @p version is accepted.  An empty version omits the
/// "/v" segment.
std::string buildApiPath(const std::string& version,
                         const std::string& path,
                         const QueryValues& query = {},
                         const std::string& basePath = "");

/// Resolve a redirect Location against the target that produced it.
/// An absolute URL resolves to its path and query only when its authority
/// matches @p authority (case-insensitively); otherwise it points at another
/// peer and std::nullopt is returned.
std::optional<std::string> resolveRedirectTarget(const std::string& currentTarget,
                                                 const std::string& location,
                                                 const std::string& authority);

} // namespace dockapi
