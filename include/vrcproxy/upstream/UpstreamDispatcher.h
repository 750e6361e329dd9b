#pragma once

#include "vrcproxy/protocol/HttpHeaders.h"
#include "vrcproxy/upstream/UpstreamTarget.h"

#include <functional>
#include <string>

namespace vrcproxy {
namespace network {
class EventLoop;
}

namespace upstream {

struct UpstreamRequest {
    std::string method;
    UpstreamTarget target;
    // Already filtered for forwarding.
    vrcproxy::protocol::HeaderMap headers;
};

struct UpstreamResult {
    enum Outcome { kOk, kTimeout, kFailure };

    Outcome outcome{kFailure};
    int status{0};
    std::string reason;
    // Decoded representation headers; framing and content-coding fields are removed.
    vrcproxy::protocol::HeaderList headers;
    std::string body;
    // Set for kTimeout and kFailure.
    std::string error;

    bool ok() const { return outcome == kOk; }
};

// Issues one request to the upstream and reports exactly once on the caller's loop.
class UpstreamDispatcher {
public:
    using DoneCallback = std::function<void(UpstreamResult)>;

    virtual ~UpstreamDispatcher() = default;

    // Must be called on `loop`'s thread; `done` runs exactly once on that thread.
    virtual void Dispatch(vrcproxy::network::EventLoop* loop,
                          const UpstreamRequest& request,
                          DoneCallback done) = 0;
};

} // namespace upstream
} // namespace vrcproxy
