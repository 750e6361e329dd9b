#include "vrcproxy/pipeline/UrlRewriter.h"
#include "vrcproxy/protocol/HttpRequest.h"

namespace vrcproxy {
namespace pipeline {

bool UrlRewriter::IsRoot(const vrcproxy::protocol::HttpRequest& request) {
    return request.path() == "/";
}

vrcproxy::upstream::UpstreamTarget UrlRewriter::Rewrite(const vrcproxy::protocol::HttpRequest& request) const {
    vrcproxy::upstream::UpstreamTarget target;
    target.scheme = config_.scheme;
    target.host = config_.host;
    target.port = config_.port;
    const std::string& path = request.path();
    if (config_.apiPrefix == "/") {
        target.path = path;
    } else if (!path.empty() && path[0] != '/') {
        target.path = config_.apiPrefix + "/" + path;
    } else {
        target.path = config_.apiPrefix + path;
    }
    target.query = request.query();
    return target;
}

} // namespace pipeline
} // namespace vrcproxy
