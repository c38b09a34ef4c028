#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace dockapi {

/// A redirect was refused because replaying the request could change state
/// on a resource other than the one the caller addressed.
class RedirectError : public std::runtime_error {
public:
    RedirectError(const std::string& method,
                  const std::string& url,
                  unsigned int status);

    const std::string& method() const { return mMethod; }
    const std::string& url() const { return mUrl; }
    unsigned int status() const { return mStatus; }

private:
    std::string  mMethod;
    std::string  mUrl;
    unsigned int mStatus;
};

struct RedirectDecision {
    bool                         follow = false;
    std::optional<RedirectError> error;     // set when follow is false
};

/// Decides, per redirect hop and before any body is re-sent, whether the
/// request may be replayed against the new location.  Only GET and HEAD are
/// followed.
class RedirectPolicy {
public:
    /// @param method    Method of the original request.
    /// @param location  Redirect target, reported in the error.
    /// @param status    Redirect status code, reported in the error.
    static RedirectDecision decide(const std::string& method,
                                   const std::string& location,
                                   unsigned int status = 301);

    static bool isRedirectStatus(unsigned int status);
};

} // namespace dockapi
