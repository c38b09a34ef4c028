#pragma once

#include <map>
#include <optional>
#include <string>

namespace dockapi {

/// Header names are matched case-insensitively by headerValue() (mapping.hpp).
using HeaderMap = std::map<std::string, std::string>;

struct HttpRequest {
    std::string method = "GET";
    std::string target = "/";    // already versioned and escaped
    HeaderMap   headers;
    std::string body;
};

struct HttpResponse {
    unsigned int status = 0;
    HeaderMap    headers;
    std::string  body;
};

/// What the daemon reports in answer to /_ping.
struct PingResult {
    std::optional<std::string> apiVersion;   // "Api-Version"; absent on old daemons
    std::string                osType;       // "OSType"
    bool                       experimental = false;
    std::string                builderVersion;
};

/// One filesystem change inside a container, relative to its image.
struct ContainerChange {
    enum class Kind { Modified = 0, Added = 1, Deleted = 2 };

    std::string path;
    Kind        kind = Kind::Modified;
};

} // namespace dockapi
