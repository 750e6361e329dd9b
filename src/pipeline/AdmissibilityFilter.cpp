#include "vrcproxy/pipeline/AdmissibilityFilter.h"

namespace vrcproxy {
namespace pipeline {

std::optional<Failure> AdmissibilityFilter::Check(const std::string& method,
                                                  vrcproxy::protocol::HeaderMap* forwardHeaders) {
    forwardHeaders->erase("Referer");

    if (!vrcproxy::protocol::IEquals(method, "get")) {
        return Failure::kMethodNotAllowed;
    }

    auto agent = forwardHeaders->find("User-Agent");
    if (agent != forwardHeaders->end() && agent->second.find("PostmanRuntime") != std::string::npos) {
        return Failure::kBlockedClient;
    }

    if (forwardHeaders->count("Authorization") > 0 || forwardHeaders->count("Cookie") > 0) {
        return Failure::kCredentialsForbidden;
    }
    return std::nullopt;
}

} // namespace pipeline
} // namespace vrcproxy
