#pragma once

#include "config.hpp"
#include "context.hpp"
#include "models.hpp"
#include "negotiator.hpp"
#include "transport.hpp"
#include "util.hpp"

#include <atomic>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace dockapi {

/// Non-2xx reply from the daemon.
class ApiError : public std::runtime_error {
public:
    ApiError(unsigned int status, const std::string& message)
        : std::runtime_error("Error response from daemon (HTTP " +
                             std::to_string(status) + "): " + message)
        , mStatus(status)
        , mMessage(message) {}

    unsigned int status() const { return mStatus; }
    const std::string& message() const { return mMessage; }

private:
    unsigned int mStatus;
    std::string  mMessage;
};

/// Client for a daemon's versioned REST API.
///
/// Every request is addressed as  basePath + "/v" + version + path.  When
/// negotiation is enabled and no version is pinned, the first request pings
/// the daemon and uses the resolved version.  Safe to share between threads.
class Client {
public:
    /// @throws std::invalid_argument if options.host cannot be parsed.
    explicit Client(const ClientOptions& options);

    /// Use @p transport instead of opening sockets.  Redirects it returns
    /// are still subject to RedirectPolicy.
    Client(const ClientOptions& options,
           std::shared_ptr<RoundTripper> transport);

    /// Version requests are currently addressed with (bare "1.xx" form).
    std::string clientVersion() const;

    const HostAddress& hostAddress() const { return mAddress; }

    /// Ping the daemon and lock in the negotiated version.  Failures leave
    /// the version unchanged.  No-op when pinned or already negotiated.
    void negotiateApiVersion(const RequestContext& ctx);

    /// Apply an already obtained ping result.
    void negotiateApiVersionPing(const PingResult& ping);

    /// HEAD /_ping, falling back to GET.  Not versioned.
    PingResult ping(const RequestContext& ctx);

    /// Send a request to @p path (e.g. "/containers/json").
    /// @throws ApiError on a non-2xx status, RedirectError when a redirect
    ///         is refused, std::runtime_error on network errors.
    HttpResponse send(const RequestContext& ctx,
                      const std::string& method,
                      const std::string& path,
                      const QueryValues& query = {},
                      const std::string& body = "",
                      const HeaderMap& headers = {});

    /// GET /containers/{name}/changes
    std::vector<ContainerChange> containerChanges(const RequestContext& ctx,
                                                  const std::string& name);

    void setVerbose(bool v);

private:
    ClientOptions                 mOptions;
    HostAddress                   mAddress;
    std::shared_ptr<RoundTripper> mTransport;
    VersionNegotiator             mNegotiator;
    std::atomic<bool>             mVerbose{false};

    HttpResponse doPing(const RequestContext& ctx, const std::string& method);
    std::string  apiPath(const RequestContext& ctx,
                         const std::string& path,
                         const QueryValues& query);
};

} // namespace dockapi
