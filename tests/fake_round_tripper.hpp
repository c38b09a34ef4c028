#pragma once

#include "transport.hpp"

#include <functional>
#include <mutex>
#include <vector>

namespace dockapi {
namespace fakes {

/// RoundTripper that answers from a callback and records every request.
class FakeRoundTripper : public RoundTripper {
public:
    using Handler = std::function<HttpResponse(const HttpRequest&)>;

    explicit FakeRoundTripper(Handler handler) : mHandler(std::move(handler)) {}

    HttpResponse roundTrip(const RequestContext& ctx,
                           const HttpRequest& request) override {
        ctx.check();
        {
            std::lock_guard<std::mutex> lock(mMutex);
            mRequests.push_back(request);
        }
        return mHandler(request);
    }

    std::vector<HttpRequest> requests() const {
        std::lock_guard<std::mutex> lock(mMutex);
        return mRequests;
    }

private:
    Handler                  mHandler;
    mutable std::mutex       mMutex;
    std::vector<HttpRequest> mRequests;
};

inline HttpResponse makeResponse(unsigned int status,
                                 HeaderMap headers = {},
                                 std::string body = "") {
    HttpResponse resp;
    resp.status  = status;
    resp.headers = std::move(headers);
    resp.body    = std::move(body);
    return resp;
}

} // namespace fakes
} // namespace dockapi
