#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace dockapi {

/// Raised when a request context is cancelled or its deadline has passed.
class CancelledError : public std::runtime_error {
public:
    explicit CancelledError(const std::string& what)
        : std::runtime_error(what) {}
};

/// Deadline and cancellation carried through a request.
///
/// Copies share the cancellation flag, so cancelling any copy cancels all
/// of them.
class RequestContext {
public:
    using Clock = std::chrono::steady_clock;

    RequestContext() : mCancelled(std::make_shared<std::atomic<bool>>(false)) {}

    static RequestContext withTimeout(std::chrono::milliseconds timeout) {
        RequestContext ctx;
        ctx.mDeadline = Clock::now() + timeout;
        return ctx;
    }

    void cancel() { mCancelled->store(true); }

    bool cancelled() const { return mCancelled->load(); }

    const std::optional<Clock::time_point>& deadline() const { return mDeadline; }

    /// True once cancelled or past the deadline.
    bool done() const {
        return cancelled() || (mDeadline && Clock::now() >= *mDeadline);
    }

    /// Throw CancelledError if done().
    void check() const {
        if (cancelled()) throw CancelledError("context cancelled");
        if (mDeadline && Clock::now() >= *mDeadline) {
            throw CancelledError("context deadline exceeded");
        }
    }

    /// Clamp @p timeout to the time left before the deadline.
    std::chrono::milliseconds clamp(std::chrono::milliseconds timeout) const {
        if (!mDeadline) return timeout;
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            *mDeadline - Clock::now());
        if (left.count() < 1) left = std::chrono::milliseconds(1);
        return left < timeout ? left : timeout;
    }

private:
    std::shared_ptr<std::atomic<bool>> mCancelled;
    std::optional<Clock::time_point>   mDeadline;
};

} // namespace dockapi
