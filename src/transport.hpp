#pragma once

#include "context.hpp"
#include "models.hpp"
#include "util.hpp"

#ifdef DOCKAPI_HAS_SSL
#include <boost/asio/ssl/context.hpp>
#endif

#include <atomic>
#include <memory>
#include <string>

namespace dockapi {

/// Sends one HTTP request and returns the response, without following
/// redirects.  Substituted in tests.
class RoundTripper {
public:
    virtual ~RoundTripper() = default;

    /// @throws std::runtime_error on network / timeout errors,
    ///         CancelledError when @p ctx is done.
    virtual HttpResponse roundTrip(const RequestContext& ctx,
                                   const HttpRequest& request) = 0;
};

/// Connection settings for TLS-secured TCP.
struct TlsOptions {
    bool        enabled = false;
    bool        verify  = true;
    std::string certPath;   // directory holding ca.pem, cert.pem, key.pem
};

#ifdef DOCKAPI_HAS_SSL
/// Apply @p tls to a client SSL context.  With verification on, the peer
/// certificate must chain to a trusted root and match @p hostName.
void configureTlsContext(boost::asio::ssl::context& sslCtx,
                         const TlsOptions& tls,
                         const std::string& hostName);
#endif

/// Round tripper built on Boost.Beast.  Opens one connection per request
/// over a Unix socket, plain TCP or TLS, depending on the host scheme.
class BeastRoundTripper : public RoundTripper {
public:
    /// Pseudo host sent in the Host header over socket and pipe transports.
    static constexpr const char* kDummyHost = "api.moby.localhost";

    /// @throws std::runtime_error if TLS is requested but was not compiled in.
    BeastRoundTripper(const HostAddress& address,
                      const TlsOptions& tls = {},
                      int timeoutMs = 30000);

    HttpResponse roundTrip(const RequestContext& ctx,
                           const HttpRequest& request) override;

    void setVerbose(bool v) { mVerbose = v; }

private:
    HostAddress mAddress;
    TlsOptions  mTls;
    std::string mHost;
    std::string mPort;
    int         mTimeoutMs;
    std::atomic<bool> mVerbose{false};
    bool        mUseSsl  = false;

    HttpResponse doUnixRequest(const RequestContext& ctx, const HttpRequest& request);
    HttpResponse doTcpRequest(const RequestContext& ctx, const HttpRequest& request);
    HttpResponse doTlsRequest(const RequestContext& ctx, const HttpRequest& request);
};

/// Follows redirects returned by the wrapped round tripper, consulting
/// RedirectPolicy on every hop before the request is replayed.
///
/// The wrapped round tripper is bound to one peer, so a redirect to another
/// authority is never followed: the 3xx response is returned as-is.
class RedirectingTransport : public RoundTripper {
public:
    static constexpr int kMaxRedirects = 10;

    /// @param authority  Authority of the peer @p inner talks to, as it
    ///                   would appear in an absolute Location.
    RedirectingTransport(std::shared_ptr<RoundTripper> inner,
                         std::string authority,
                         int maxRedirects = kMaxRedirects);

    /// @throws RedirectError when the policy refuses a hop.
    HttpResponse roundTrip(const RequestContext& ctx,
                           const HttpRequest& request) override;

    void setVerbose(bool v) { mVerbose = v; }

private:
    std::shared_ptr<RoundTripper> mInner;
    std::string                   mAuthority;
    int                           mMaxRedirects;
    std::atomic<bool>             mVerbose{false};
};

} // namespace dockapi
