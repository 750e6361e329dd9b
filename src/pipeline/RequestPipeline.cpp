#include "vrcproxy/pipeline/RequestPipeline.h"
#include "vrcproxy/pipeline/AdmissibilityFilter.h"
#include "vrcproxy/protocol/HttpRequest.h"
#include "vrcproxy/common/Logger.h"

namespace vrcproxy {
namespace pipeline {

using vrcproxy::protocol::HttpRequest;
using vrcproxy::protocol::HttpResponse;
using vrcproxy::upstream::UpstreamRequest;
using vrcproxy::upstream::UpstreamResult;
using vrcproxy::upstream::UpstreamTarget;

RequestPipeline::RequestPipeline(const Notice& notice,
                                 const vrcproxy::upstream::UpstreamConfig& upstream,
                                 std::shared_ptr<vrcproxy::upstream::UpstreamDispatcher> dispatcher,
                                 const std::string& publicOrigin)
    : rewriter_(upstream),
      composer_(notice),
      errors_(notice),
      dispatcher_(std::move(dispatcher)),
      publicOrigin_(publicOrigin) {
    while (!publicOrigin_.empty() && publicOrigin_.back() == '/') {
        publicOrigin_.pop_back();
    }
}

std::string RequestPipeline::OriginOf(const HttpRequest& request) const {
    if (!publicOrigin_.empty()) {
        return publicOrigin_;
    }
    const std::string host = request.getHeader("Host");
    return "http://" + (host.empty() ? std::string("localhost") : host);
}

void RequestPipeline::LogAccess(const HttpRequest& request, int status,
                                std::chrono::steady_clock::time_point start) {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    LOG_INFO << request.method() << " " << request.path() << request.query()
             << " " << status << " " << ms << "ms";
}

void RequestPipeline::Handle(vrcproxy::network::EventLoop* loop,
                             const HttpRequest& request,
                             DoneCallback done) const {
    const auto start = std::chrono::steady_clock::now();

    if (UrlRewriter::IsRoot(request)) {
        LOG_DEBUG << "root path, answering with service metadata";
        HttpResponse response = composer_.ComposeRoot(OriginOf(request));
        LogAccess(request, response.statusCode(), start);
        done(std::move(response));
        return;
    }

    UpstreamRequest upstream;
    upstream.target = rewriter_.Rewrite(request);
    upstream.headers = request.headers();
    LOG_DEBUG << "rewrite " << request.path() << request.query() << " -> " << upstream.target.url();

    if (auto rejection = AdmissibilityFilter::Check(request.method(), &upstream.headers)) {
        LOG_INFO << "rejected " << request.method() << " " << request.path() << ": " << FailureName(*rejection);
        HttpResponse response = errors_.ToResponse(*rejection);
        LogAccess(request, response.statusCode(), start);
        done(std::move(response));
        return;
    }

    // Only GET gets this far; send it in canonical case.
    upstream.method = "GET";

    // The request is copied because the caller's object does not outlive this call.
    auto inbound = std::make_shared<HttpRequest>(request);
    UpstreamTarget target = upstream.target;
    dispatcher_->Dispatch(loop, upstream,
                          [this, inbound, target, start, done = std::move(done)](UpstreamResult result) {
                              HttpResponse response = OnUpstreamResult(target, std::move(result));
                              LogAccess(*inbound, response.statusCode(), start);
                              done(std::move(response));
                          });
}

HttpResponse RequestPipeline::OnUpstreamResult(const UpstreamTarget& target, UpstreamResult result) const {
    switch (result.outcome) {
        case UpstreamResult::kTimeout:
            LOG_WARN << "upstream timeout for " << target.url() << ": " << result.error;
            return errors_.ToResponse(Failure::kUpstreamTimeout);
        case UpstreamResult::kFailure:
            LOG_ERROR << "upstream failure for " << target.url() << ": " << result.error;
            return errors_.ToResponse(Failure::kUpstreamFailure);
        case UpstreamResult::kOk:
            break;
    }

    HttpResponse response;
    if (!composer_.ComposeProxied(result, &response)) {
        LOG_ERROR << "upstream " << target.url() << " declared JSON but sent "
                  << result.body.size() << " unparsable bytes";
        return errors_.ToResponse(Failure::kMalformedUpstreamBody);
    }
    LOG_DEBUG << "upstream " << target.url() << " answered " << result.status;
    return response;
}

} // namespace pipeline
} // namespace vrcproxy
