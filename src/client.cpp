#include "client.hpp"
#include "mapping.hpp"

#include <boost/beast/http/error.hpp>
#include <boost/system/system_error.hpp>

#include <iostream>

namespace dockapi {

namespace {

bool isSuccess(unsigned int status) {
    return status >= 200 && status < 300;
}

// True when the peer answered but the reply could not be parsed as HTTP.
bool isProtocolError(const boost::system::error_code& ec) {
    namespace http = boost::beast::http;
    return ec.category() ==
           http::make_error_code(http::error::end_of_stream).category();
}

std::string peerAuthority(const HostAddress& address) {
    return isNetworkScheme(address.scheme) ? address.host
                                           : BeastRoundTripper::kDummyHost;
}

std::shared_ptr<RoundTripper> makeTransport(const ClientOptions& options,
                                            const HostAddress& address)
{
    TlsOptions tls;
    tls.enabled  = options.tls;
    tls.verify   = options.tlsVerify;
    tls.certPath = options.certPath;

    auto rt = std::make_shared<BeastRoundTripper>(address, tls,
                                                  options.timeoutMs);
    rt->setVerbose(options.verbose);
    return rt;
}

} // namespace

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

Client::Client(const ClientOptions& options)
    : Client(options, nullptr) {}

Client::Client(const ClientOptions& options,
               std::shared_ptr<RoundTripper> transport)
    : mOptions(options)
    , mAddress(parseHostUrl(options.host))
    , mNegotiator(options.apiVersion, options.negotiate)
{
    if (!transport) {
        transport = makeTransport(mOptions, mAddress);
    }
    auto redirecting = std::make_shared<RedirectingTransport>(
        std::move(transport), peerAuthority(mAddress));
    redirecting->setVerbose(options.verbose);
    mTransport = std::move(redirecting);

    setVerbose(options.verbose);

    if (mVerbose) {
        std::cerr << "[Client] Host " << mAddress.scheme << "://"
                  << mAddress.host << mAddress.path << ", API version "
                  << mNegotiator.effectiveVersion().str() << " ("
                  << toString(mNegotiator.state()) << ")\n";
    }
}

void Client::setVerbose(bool v) {
    mVerbose = v;
    mNegotiator.setVerbose(v);
}

// ---------------------------------------------------------------------------
// Version negotiation
// ---------------------------------------------------------------------------

std::string Client::clientVersion() const {
    return mNegotiator.effectiveVersion().str();
}

void Client::negotiateApiVersion(const RequestContext& ctx) {
    mNegotiator.negotiate(ctx, [this](const RequestContext& pingCtx) {
        return ping(pingCtx);
    });
}

void Client::negotiateApiVersionPing(const PingResult& ping) {
    mNegotiator.negotiateWithPing(ping);
}

// ---------------------------------------------------------------------------
// Ping
// ---------------------------------------------------------------------------

HttpResponse Client::doPing(const RequestContext& ctx,
                            const std::string& method)
{
    HttpRequest req;
    req.method = method;
    req.target = buildApiPath("", "/_ping", {}, mAddress.path);
    req.headers["Cache-Control"] = "no-cache";
    req.headers["Pragma"]        = "no-cache";
    return mTransport->roundTrip(ctx, req);
}

PingResult Client::ping(const RequestContext& ctx) {
    try {
        auto resp = doPing(ctx, "HEAD");
        if (isSuccess(resp.status)) {
            return parsePingHeaders(resp.headers);
        }
        if (mVerbose) {
            std::cerr << "[Client] HEAD /_ping returned HTTP " << resp.status
                      << ", retrying with GET\n";
        }
    } catch (const boost::system::system_error& e) {
        // Connection failures would only fail again over GET.
        if (!isProtocolError(e.code())) throw;
        if (mVerbose) {
            std::cerr << "[Client] HEAD /_ping failed: " << e.what()
                      << ", retrying with GET\n";
        }
    }

    auto resp = doPing(ctx, "GET");
    if (!isSuccess(resp.status)) {
        throw ApiError(resp.status, extractErrorMessage(resp.body));
    }
    return parsePingHeaders(resp.headers);
}

// ---------------------------------------------------------------------------
// Requests
// ---------------------------------------------------------------------------

std::string Client::apiPath(const RequestContext& ctx,
                            const std::string& path,
                            const QueryValues& query)
{
    // Negotiation runs before addressing so the first request can use it.
    if (mNegotiator.needsNegotiation()) {
        negotiateApiVersion(ctx);
    }
    return buildApiPath(mNegotiator.effectiveVersion().str(), path, query,
                        mAddress.path);
}

HttpResponse Client::send(const RequestContext& ctx,
                          const std::string& method,
                          const std::string& path,
                          const QueryValues& query,
                          const std::string& body,
                          const HeaderMap& headers)
{
    HttpRequest req;
    req.method  = method;
    req.target  = apiPath(ctx, path, query);
    req.headers = headers;
    req.body    = body;
    if (!body.empty() && headerValue(req.headers, "Content-Type").empty()) {
        req.headers["Content-Type"] = "application/json";
    }

    if (mVerbose) {
        std::cerr << "[Client] " << method << " " << req.target << "\n";
    }

    auto resp = mTransport->roundTrip(ctx, req);
    if (!isSuccess(resp.status)) {
        throw ApiError(resp.status, extractErrorMessage(resp.body));
    }
    return resp;
}

std::vector<ContainerChange> Client::containerChanges(const RequestContext& ctx,
                                                      const std::string& name)
{
    if (name.empty()) {
        throw std::invalid_argument("container name must not be empty");
    }
    auto resp = send(ctx, "GET", "/containers/" + name + "/changes");
    return parseContainerChanges(resp.body);
}

} // namespace dockapi
