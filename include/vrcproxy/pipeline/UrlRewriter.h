#pragma once

#include "vrcproxy/upstream/UpstreamConfig.h"
#include "vrcproxy/upstream/UpstreamTarget.h"

namespace vrcproxy {
namespace protocol {
class HttpRequest;
}

namespace pipeline {

// Maps an inbound request onto the upstream API. Path and query bytes are kept as-is.
class UrlRewriter {
public:
    explicit UrlRewriter(const vrcproxy::upstream::UpstreamConfig& config)
        : config_(config) {}

    // "/" is answered locally with service metadata.
    static bool IsRoot(const vrcproxy::protocol::HttpRequest& request);

    vrcproxy::upstream::UpstreamTarget Rewrite(const vrcproxy::protocol::HttpRequest& request) const;

private:
    vrcproxy::upstream::UpstreamConfig config_;
};

} // namespace pipeline
} // namespace vrcproxy
