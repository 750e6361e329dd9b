#pragma once

#include "vrcproxy/protocol/HttpHeaders.h"

#include <cstddef>
#include <string>

namespace vrcproxy {
namespace protocol {

// Incremental HTTP/1.x response parser for the upstream side.
// - Supports Content-Length and Transfer-Encoding: chunked; the body is de-chunked.
// - If neither is present, the body runs until the peer closes (see finishOnClose()).
class HttpResponseContext {
public:
    enum ParseState { kExpectStatusLine, kExpectBody, kGotAll, kError };

    static const size_t kMaxHeaderBytes = 64 * 1024;
    // Upper bound for a de-chunked body and for its decoded form.
    static const size_t kMaxBodyBytes = 32 * 1024 * 1024;

    // Returns true if the response is complete after processing these bytes.
    bool feed(const char* data, size_t len);

    // The peer closed. Completes a read-until-close body; anything else
    // unfinished becomes an error. Returns gotAll().
    bool finishOnClose();

    bool gotAll() const { return state_ == kGotAll; }
    bool hasError() const { return state_ == kError; }
    const std::string& error() const { return error_; }

    void reset();

    int statusCode() const { return statusCode_; }
    const std::string& reason() const { return reason_; }
    const HeaderList& headers() const { return headers_; }
    std::string getHeader(const std::string& field) const {
        const std::string* v = FindHeader(headers_, field);
        return v ? *v : std::string();
    }
    const std::string& body() const { return body_; }
    std::string& body() { return body_; }

    bool needsCloseToFinish() const { return needsCloseToFinish_; }

private:
    bool parseHeaderBlock(const std::string& headerBlock);
    bool consumeBody();
    bool consumeChunked();
    bool fail(const std::string& why);

    ParseState state_{kExpectStatusLine};
    std::string pending_;
    std::string error_;

    int statusCode_{0};
    std::string reason_;
    HeaderList headers_;
    std::string body_;

    bool chunked_{false};
    size_t bodyRemaining_{0};
    bool needsCloseToFinish_{false};

    bool expectingChunkSize_{true};
    size_t chunkRemaining_{0};
    bool trailer_{false};
};

} // namespace protocol
} // namespace vrcproxy
