#include "vrcproxy/pipeline/ErrorMapper.h"

namespace vrcproxy {
namespace pipeline {

const char* FailureName(Failure failure) {
    switch (failure) {
        case Failure::kMethodNotAllowed: return "method not allowed";
        case Failure::kBlockedClient: return "blocked user-agent";
        case Failure::kCredentialsForbidden: return "credentials present";
        case Failure::kUpstreamTimeout: return "upstream timeout";
        case Failure::kUpstreamFailure: return "upstream failure";
        case Failure::kMalformedUpstreamBody: return "malformed upstream body";
    }
    return "unknown";
}

const ErrorMapper::Entry& ErrorMapper::Describe(Failure failure) {
    static const Entry kMethodNotAllowed{405, "Method Not Allowed", "Only GET requests are allowed."};
    static const Entry kBlockedClient{400, "Bad Request", "Requests with current user-agent will always fail."};
    static const Entry kCredentials{400, "Bad Request", "Requests with credentials are not allowed."};
    static const Entry kTimeout{504, "Gateway Timeout", "The request timed out."};
    static const Entry kUpstream{500, "Internal Server Error", "An internal server error occurred."};
    static const Entry kMalformed{500, "Internal Server Error", "The upstream response could not be parsed as JSON."};

    switch (failure) {
        case Failure::kMethodNotAllowed: return kMethodNotAllowed;
        case Failure::kBlockedClient: return kBlockedClient;
        case Failure::kCredentialsForbidden: return kCredentials;
        case Failure::kUpstreamTimeout: return kTimeout;
        case Failure::kMalformedUpstreamBody: return kMalformed;
        case Failure::kUpstreamFailure: break;
    }
    return kUpstream;
}

nlohmann::ordered_json ErrorMapper::ToJson(Failure failure) const {
    const Entry& e = Describe(failure);
    nlohmann::ordered_json body = notice_.ToJson();
    nlohmann::ordered_json error = nlohmann::ordered_json::object();
    error["_comment"] = e.comment;
    error["message"] = e.message;
    error["status_code"] = e.status;
    body["error"] = std::move(error);
    return body;
}

vrcproxy::protocol::HttpResponse ErrorMapper::ToResponse(Failure failure) const {
    const Entry& e = Describe(failure);
    vrcproxy::protocol::HttpResponse response;
    response.setStatusCode(e.status);
    response.setStatusMessage(e.message);
    response.setContentType("application/json");
    response.setBody(ToJson(failure).dump());
    return response;
}

} // namespace pipeline
} // namespace vrcproxy
