#pragma once

#include "vrcproxy/pipeline/Notice.h"
#include "vrcproxy/protocol/HttpResponse.h"

namespace vrcproxy {
namespace pipeline {

// Every way a proxied request can fail before a normal response is composed.
enum class Failure {
    kMethodNotAllowed,
    kBlockedClient,
    kCredentialsForbidden,
    kUpstreamTimeout,
    kUpstreamFailure,
    kMalformedUpstreamBody,
};

const char* FailureName(Failure failure);

// Turns a Failure into its fixed status and JSON error document.
class ErrorMapper {
public:
    struct Entry {
        int status;
        const char* message;
        const char* comment;
    };

    explicit ErrorMapper(const Notice& notice)
        : notice_(notice) {}

    static const Entry& Describe(Failure failure);

    nlohmann::ordered_json ToJson(Failure failure) const;
    vrcproxy::protocol::HttpResponse ToResponse(Failure failure) const;

private:
    Notice notice_;
};

} // namespace pipeline
} // namespace vrcproxy
