#pragma once

#include "context.hpp"
#include "models.hpp"
#include "version.hpp"

#include <atomic>
#include <functional>
#include <mutex>
#include <string>

namespace dockapi {

/// Owns the effective API version of a client and decides when to ask the
/// daemon for the version it supports.
///
///   Fixed         pinned by configuration; never changes.
///   Unnegotiated  auto-negotiation enabled, no handshake has succeeded yet.
///   Negotiated    a handshake succeeded; the result is kept for the
///                 lifetime of the client.
///
/// All members are safe to call concurrently.  The lock is never held
/// while the ping runs.
class VersionNegotiator {
public:
    enum class State { Unnegotiated, Negotiated, Fixed };

    /// Performs the handshake.  Throws on transport failure.
    using PingFn = std::function<PingResult(const RequestContext&)>;

    /// @param configuredVersion  Pinned version; "" (or "v") means none.
    /// @param autoNegotiate      Negotiate when no version is pinned.
    /// @param defaultVersion     Version the client natively speaks.
    VersionNegotiator(const std::string& configuredVersion,
                      bool autoNegotiate,
                      const std::string& defaultVersion = kDefaultApiVersion);

    /// Snapshot of the version in effect.  Never performs I/O.
    ApiVersion effectiveVersion() const;

    State state() const;

    /// True while auto-negotiation is enabled and has not yet succeeded.
    bool needsNegotiation() const;

    /// Ping the daemon and lock in the resolved version.
    ///
    /// No-op unless the state is Unnegotiated.  Ping failures and
    /// cancellation are absorbed: the state and version stay as they were.
    /// @return true if this call made the Unnegotiated -> Negotiated
    ///         transition.
    bool negotiate(const RequestContext& ctx, const PingFn& ping);

    /// Apply a ping result obtained elsewhere, with the same rules as
    /// negotiate().
    bool negotiateWithPing(const PingResult& ping);

    /// The version a client speaking @p clientVersion should use against a
    /// daemon that answered @p ping.
    static ApiVersion resolve(const ApiVersion& clientVersion,
                              const PingResult& ping);

    void setVerbose(bool v) { mVerbose = v; }

private:
    mutable std::mutex mMutex;
    State              mState;
    ApiVersion         mVersion;
    ApiVersion         mDefaultVersion;
    std::atomic<bool>  mVerbose{false};
};

const char* toString(VersionNegotiator::State state);

} // namespace dockapi
