#include "redirect.hpp"

namespace dockapi {

RedirectError::RedirectError(const std::string& method,
                             const std::string& url,
                             unsigned int status)
    : std::runtime_error(method + " \"" + url +
                         "\": unexpected redirect in response")
    , mMethod(method)
    , mUrl(url)
    , mStatus(status) {}

RedirectDecision RedirectPolicy::decide(const std::string& method,
                                        const std::string& location,
                                        unsigned int status)
{
    RedirectDecision decision;
    if (method == "GET" || method == "HEAD") {
        decision.follow = true;
        return decision;
    }
    decision.error.emplace(method, location, status);
    return decision;
}

bool RedirectPolicy::isRedirectStatus(unsigned int status) {
    switch (status) {
        case 301: case 302: case 303: case 307: case 308:
            return true;
        default:
            return false;
    }
}

} // namespace dockapi
