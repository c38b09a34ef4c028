#include "negotiator.hpp"

#include <iostream>

namespace dockapi {

VersionNegotiator::VersionNegotiator(const std::string& configuredVersion,
                                     bool autoNegotiate,
                                     const std::string& defaultVersion)
    : mDefaultVersion(defaultVersion)
{
    ApiVersion configured(configuredVersion);

    if (!configured.empty()) {
        mState   = State::Fixed;
        mVersion = configured;
    } else if (autoNegotiate) {
        mState   = State::Unnegotiated;
        mVersion = mDefaultVersion;
    } else {
        mState   = State::Fixed;
        mVersion = mDefaultVersion;
    }
}

ApiVersion VersionNegotiator::effectiveVersion() const {
    std::lock_guard<std::mutex> lock(mMutex);
    return mVersion;
}

VersionNegotiator::State VersionNegotiator::state() const {
    std::lock_guard<std::mutex> lock(mMutex);
    return mState;
}

bool VersionNegotiator::needsNegotiation() const {
    return state() == State::Unnegotiated;
}

bool VersionNegotiator::negotiate(const RequestContext& ctx,
                                  const PingFn& ping)
{
    if (!needsNegotiation()) return false;

    PingResult result;
    try {
        ctx.check();
        result = ping(ctx);
        ctx.check();
    } catch (const std::exception& e) {
        if (mVerbose) {
            std::cerr << "[Negotiator] Ping failed, keeping API version "
                      << effectiveVersion().str() << ": " << e.what() << "\n";
        }
        return false;
    }

    return negotiateWithPing(result);
}

bool VersionNegotiator::negotiateWithPing(const PingResult& ping) {
    std::lock_guard<std::mutex> lock(mMutex);
    if (mState != State::Unnegotiated) return false;

    mVersion = resolve(mDefaultVersion, ping);
    mState   = State::Negotiated;

    if (mVerbose) {
        std::cerr << "[Negotiator] Negotiated API version " << mVersion.str()
                  << " (daemon reported "
                  << ping.apiVersion.value_or("none") << ")\n";
    }
    return true;
}

ApiVersion VersionNegotiator::resolve(const ApiVersion& clientVersion,
                                      const PingResult& ping)
{
    if (!ping.apiVersion || ping.apiVersion->empty()) {
        return ApiVersion(kLegacyFloorVersion);
    }

    ApiVersion daemonVersion(*ping.apiVersion);
    if (clientVersion.empty() || daemonVersion < clientVersion) {
        return daemonVersion;
    }
    return clientVersion;
}

const char* toString(VersionNegotiator::State state) {
    switch (state) {
        case VersionNegotiator::State::Unnegotiated: return "unnegotiated";
        case VersionNegotiator::State::Negotiated:   return "negotiated";
        case VersionNegotiator::State::Fixed:        return "fixed";
    }
    return "unknown";
}

} // namespace dockapi
