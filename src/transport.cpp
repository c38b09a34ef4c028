#include "transport.hpp"
#include "mapping.hpp"
#include "redirect.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/local/stream_protocol.hpp>

#ifdef DOCKAPI_HAS_SSL
#include <boost/beast/ssl.hpp>
#include <boost/asio/ssl.hpp>
#endif

#include <chrono>
#include <cstdint>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <utility>

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
using tcp       = net::ip::tcp;
using local     = net::local::stream_protocol;

namespace dockapi {

namespace {

const char* const kUserAgent = "dockapi/1.0";

// Write @p request on an already connected stream and read the reply.
template <class Stream>
HttpResponse exchange(Stream& stream,
                      const HttpRequest& request,
                      const std::string& hostHeader,
                      std::chrono::milliseconds timeout)
{
    const auto verb = http::string_to_verb(request.method);
    if (verb == http::verb::unknown) {
        throw std::invalid_argument("Unsupported HTTP method: " + request.method);
    }

    // Build request.
    http::request<http::string_body> req{verb, request.target, 11};
    req.set(http::field::host, hostHeader);
    req.set(http::field::user_agent, kUserAgent);
    for (const auto& [name, value] : request.headers) {
        req.set(name, value);
    }
    req.body() = request.body;
    req.prepare_payload();

    // Send.
    beast::get_lowest_layer(stream).expires_after(timeout);
    http::write(stream, req);

    // Receive.  HEAD replies carry a Content-Length but no body.
    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(std::numeric_limits<std::uint64_t>::max());
    if (verb == http::verb::head) {
        parser.skip(true);
    }
    beast::get_lowest_layer(stream).expires_after(timeout);
    http::read(stream, buffer, parser);

    auto& res = parser.get();
    HttpResponse response;
    response.status = res.result_int();
    for (const auto& field : res) {
        const auto name  = field.name_string();
        const auto value = field.value();
        response.headers[std::string(name.data(), name.size())] =
            std::string(value.data(), value.size());
    }
    response.body = std::move(res.body());
    return response;
}

} // namespace

#ifdef DOCKAPI_HAS_SSL
void configureTlsContext(net::ssl::context& sslCtx,
                         const TlsOptions& tls,
                         const std::string& hostName)
{
    namespace ssl = net::ssl;

    if (tls.verify) {
        sslCtx.set_default_verify_paths();
        sslCtx.set_verify_mode(ssl::verify_peer);
        sslCtx.set_verify_callback(ssl::host_name_verification(hostName));
    } else {
        sslCtx.set_verify_mode(ssl::verify_none);
    }
    if (!tls.certPath.empty()) {
        if (tls.verify) {
            sslCtx.load_verify_file(tls.certPath + "/ca.pem");
        }
        sslCtx.use_certificate_chain_file(tls.certPath + "/cert.pem");
        sslCtx.use_private_key_file(tls.certPath + "/key.pem",
                                    ssl::context::pem);
    }
}
#endif

// ---------------------------------------------------------------------------
// BeastRoundTripper
// ---------------------------------------------------------------------------

BeastRoundTripper::BeastRoundTripper(const HostAddress& address,
                                     const TlsOptions& tls,
                                     int timeoutMs)
    : mAddress(address)
    , mTls(tls)
    , mTimeoutMs(timeoutMs)
{
    if (mAddress.scheme == "https") {
        mUseSsl = true;
    } else if (mAddress.scheme == "tcp") {
        mUseSsl = mTls.enabled;
    }

    if (isNetworkScheme(mAddress.scheme)) {
        std::string defaultPort;
        if (mAddress.scheme == "http") {
            defaultPort = "80";
        } else if (mAddress.scheme == "https") {
            defaultPort = "443";
        } else {
            defaultPort = mUseSsl ? "2376" : "2375";
        }
        splitAuthority(mAddress.host, defaultPort, mHost, mPort);
    }

    if (mUseSsl) {
#ifndef DOCKAPI_HAS_SSL
        throw std::runtime_error(
            "TLS connection requested but SSL support was not compiled in. "
            "Rebuild with OpenSSL to enable TLS.");
#endif
    }
}

HttpResponse BeastRoundTripper::roundTrip(const RequestContext& ctx,
                                          const HttpRequest& request)
{
    ctx.check();

    if (mVerbose) {
        std::cerr << "[Transport] " << request.method << " "
                  << mAddress.scheme << "://" << mAddress.host
                  << request.target << "\n";
    }

    HttpResponse response;
    if (mAddress.scheme == "unix") {
        response = doUnixRequest(ctx, request);
    } else if (mAddress.scheme == "npipe") {
        throw std::runtime_error(
            "named pipe transport is not supported on this platform: " +
            mAddress.host);
    } else if (isNetworkScheme(mAddress.scheme)) {
        response = mUseSsl ? doTlsRequest(ctx, request)
                           : doTcpRequest(ctx, request);
    } else {
        throw std::invalid_argument("unsupported protocol scheme \"" +
                                    mAddress.scheme + "\"");
    }

    // A reply that arrives after cancellation is discarded.
    ctx.check();

    if (mVerbose) {
        std::cerr << "[Transport] HTTP " << response.status << "\n";
    }
    return response;
}

// ---------------------------------------------------------------------------
// Unix domain socket
// ---------------------------------------------------------------------------

HttpResponse BeastRoundTripper::doUnixRequest(const RequestContext& ctx,
                                              const HttpRequest& request)
{
    const auto timeout = ctx.clamp(std::chrono::milliseconds(mTimeoutMs));

    net::io_context ioc;
    beast::basic_stream<local> stream(ioc);

    stream.expires_after(timeout);
    stream.connect(local::endpoint(mAddress.host));

    auto response = exchange(stream, request, kDummyHost, timeout);

    // Graceful shutdown (non-critical errors are swallowed).
    beast::error_code ec;
    stream.socket().shutdown(local::socket::shutdown_both, ec);

    return response;
}

// ---------------------------------------------------------------------------
// Plain TCP
// ---------------------------------------------------------------------------

HttpResponse BeastRoundTripper::doTcpRequest(const RequestContext& ctx,
                                             const HttpRequest& request)
{
    const auto timeout = ctx.clamp(std::chrono::milliseconds(mTimeoutMs));

    net::io_context ioc;
    tcp::resolver   resolver(ioc);
    beast::tcp_stream stream(ioc);

    // Resolve + connect with timeout.
    auto const results = resolver.resolve(mHost, mPort);
    stream.expires_after(timeout);
    stream.connect(results);

    auto response = exchange(stream, request, mAddress.host, timeout);

    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);

    return response;
}

// ---------------------------------------------------------------------------
// TLS (compiled only when OpenSSL is available)
// ---------------------------------------------------------------------------

HttpResponse BeastRoundTripper::doTlsRequest(const RequestContext& ctx,
                                             const HttpRequest& request)
{
#ifdef DOCKAPI_HAS_SSL
    namespace ssl = net::ssl;

    const auto timeout = ctx.clamp(std::chrono::milliseconds(mTimeoutMs));

    net::io_context ioc;
    ssl::context    sslCtx(ssl::context::tlsv12_client);
    configureTlsContext(sslCtx, mTls, mHost);

    tcp::resolver resolver(ioc);
    beast::ssl_stream<beast::tcp_stream> stream(ioc, sslCtx);

    // SNI hostname.
    if (!SSL_set_tlsext_host_name(stream.native_handle(), mHost.c_str())) {
        throw std::runtime_error("Failed to set SNI hostname");
    }

    auto const results = resolver.resolve(mHost, mPort);
    beast::get_lowest_layer(stream).expires_after(timeout);
    beast::get_lowest_layer(stream).connect(results);

    stream.handshake(ssl::stream_base::client);

    auto response = exchange(stream, request, mAddress.host, timeout);

    beast::error_code ec;
    stream.shutdown(ec);

    return response;
#else
    (void)ctx;
    (void)request;
    throw std::runtime_error("TLS not supported: built without OpenSSL");
#endif
}

// ---------------------------------------------------------------------------
// RedirectingTransport
// ---------------------------------------------------------------------------

RedirectingTransport::RedirectingTransport(std::shared_ptr<RoundTripper> inner,
                                           std::string authority,
                                           int maxRedirects)
    : mInner(std::move(inner))
    , mAuthority(std::move(authority))
    , mMaxRedirects(maxRedirects)
{
    if (!mInner) {
        throw std::invalid_argument("RedirectingTransport needs a round tripper");
    }
}

HttpResponse RedirectingTransport::roundTrip(const RequestContext& ctx,
                                             const HttpRequest& request)
{
    HttpRequest current = request;

    for (int hop = 0;; ++hop) {
        auto response = mInner->roundTrip(ctx, current);
        if (!RedirectPolicy::isRedirectStatus(response.status)) {
            return response;
        }

        const auto location = headerValue(response.headers, "Location");
        if (location.empty()) {
            return response;
        }

        // Decide before anything is re-sent.
        auto decision = RedirectPolicy::decide(request.method, location,
                                               response.status);
        if (!decision.follow) {
            if (mVerbose) {
                std::cerr << "[Transport] Refusing redirect of "
                          << request.method << " to " << location << "\n";
            }
            throw *decision.error;
        }

        if (hop >= mMaxRedirects) {
            throw std::runtime_error("stopped after " +
                                     std::to_string(mMaxRedirects) +
                                     " redirects");
        }

        auto next = resolveRedirectTarget(current.target, location, mAuthority);
        if (!next) {
            if (mVerbose) {
                std::cerr << "[Transport] Not following redirect to another "
                          << "host: " << location << "\n";
            }
            return response;
        }

        current.target = *next;
        current.body.clear();

        if (mVerbose) {
            std::cerr << "[Transport] HTTP " << response.status
                      << ", following redirect to " << current.target << "\n";
        }
    }
}

} // namespace dockapi
