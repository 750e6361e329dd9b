#pragma once

#include "vrcproxy/pipeline/ErrorMapper.h"
#include "vrcproxy/protocol/HttpHeaders.h"

#include <optional>
#include <string>

namespace vrcproxy {
namespace pipeline {

// Decides whether a non-root request may be forwarded.
//
// Referer is removed from `forwardHeaders` first, whatever the verdict. The checks
// then run in a fixed order and the first one that fails is reported:
//   1. method must be GET (case-insensitive)        -> kMethodNotAllowed
//   2. User-Agent must not contain "PostmanRuntime" -> kBlockedClient
//   3. no Authorization and no Cookie header        -> kCredentialsForbidden
class AdmissibilityFilter {
public:
    static std::optional<Failure> Check(const std::string& method,
                                        vrcproxy::protocol::HeaderMap* forwardHeaders);
};

} // namespace pipeline
} // namespace vrcproxy
