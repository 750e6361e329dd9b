#pragma once

#include "vrcproxy/pipeline/ErrorMapper.h"
#include "vrcproxy/pipeline/Notice.h"
#include "vrcproxy/pipeline/ResponseComposer.h"
#include "vrcproxy/pipeline/UrlRewriter.h"
#include "vrcproxy/protocol/HttpResponse.h"
#include "vrcproxy/upstream/UpstreamConfig.h"
#include "vrcproxy/upstream/UpstreamDispatcher.h"

#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace vrcproxy {
namespace network {
class EventLoop;
}
namespace protocol {
class HttpRequest;
}

namespace pipeline {

// Root short-circuit, rewrite, admissibility, upstream dispatch, then compose or map
// the error. Stateless between requests; one instance serves every IO loop.
class RequestPipeline {
public:
    using DoneCallback = std::function<void(vrcproxy::protocol::HttpResponse)>;

    // An empty publicOrigin derives the origin from each request's Host header.
    RequestPipeline(const Notice& notice,
                    const vrcproxy::upstream::UpstreamConfig& upstream,
                    std::shared_ptr<vrcproxy::upstream::UpstreamDispatcher> dispatcher,
                    const std::string& publicOrigin = std::string());

    // Runs on `loop`'s thread; `done` is called exactly once on that thread.
    void Handle(vrcproxy::network::EventLoop* loop,
                const vrcproxy::protocol::HttpRequest& request,
                DoneCallback done) const;

    std::string OriginOf(const vrcproxy::protocol::HttpRequest& request) const;

private:
    vrcproxy::protocol::HttpResponse OnUpstreamResult(const vrcproxy::upstream::UpstreamTarget& target,
                                                      vrcproxy::upstream::UpstreamResult result) const;
    static void LogAccess(const vrcproxy::protocol::HttpRequest& request, int status,
                          std::chrono::steady_clock::time_point start);

    UrlRewriter rewriter_;
    ResponseComposer composer_;
    ErrorMapper errors_;
    std::shared_ptr<vrcproxy::upstream::UpstreamDispatcher> dispatcher_;
    std::string publicOrigin_;
};

} // namespace pipeline
} // namespace vrcproxy
