#pragma once

#include "vrcproxy/pipeline/Notice.h"
#include "vrcproxy/protocol/HttpResponse.h"
#include "vrcproxy/upstream/UpstreamDispatcher.h"

#include <string>

namespace vrcproxy {
namespace pipeline {

// Builds the client-facing response for the root path and for upstream answers.
class ResponseComposer {
public:
    explicit ResponseComposer(const Notice& notice)
        : notice_(notice) {}

    // 200 application/json: notice fields plus "example" = origin + example path.
    vrcproxy::protocol::HttpResponse ComposeRoot(const std::string& origin) const;

    // Copies status and headers from upstream. JSON bodies get the notice fields merged
    // in front; anything else passes through untouched. Returns false when the body is
    // declared as JSON but does not parse.
    bool ComposeProxied(const vrcproxy::upstream::UpstreamResult& upstream,
                        vrcproxy::protocol::HttpResponse* out) const;

    // Notice keys first; upstream object keys follow in their own order unless they
    // collide with a notice key. Arrays contribute "0", "1", ... per element and
    // strings per character; numbers, booleans and null contribute nothing.
    nlohmann::ordered_json MergeWithNotice(const nlohmann::ordered_json& upstream) const;

    static bool IsJsonContentType(const std::string& contentType);

private:
    Notice notice_;
};

} // namespace pipeline
} // namespace vrcproxy
