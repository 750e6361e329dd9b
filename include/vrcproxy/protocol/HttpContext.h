#pragma once

#include "vrcproxy/protocol/HttpRequest.h"

#include <chrono>
#include <cstddef>

namespace vrcproxy {
namespace network {
class Buffer;
}

namespace protocol {

// Incremental HTTP/1.x request parser. Consumes from the connection buffer and
// leaves any pipelined bytes after a complete request in place.
class HttpContext {
public:
    enum HttpRequestParseState {
        kExpectRequestLine,
        kExpectHeaders,
        kExpectBody,
        kGotAll,
    };

    static const size_t kMaxHeaderBytes = 64 * 1024;
    // Request bodies are never forwarded; anything larger is refused.
    static const size_t kMaxBodyBytes = 1024 * 1024;

    HttpContext()
        : state_(kExpectRequestLine) {}

    // return false if some error
    bool parseRequest(vrcproxy::network::Buffer* buf, std::chrono::system_clock::time_point receiveTime);

    bool gotAll() const { return state_ == kGotAll; }
    // Set when parseRequest failed because the declared or accumulated body
    // exceeds kMaxBodyBytes.
    bool bodyTooLarge() const { return bodyTooLarge_; }
    void reset();

    const HttpRequest& request() const { return request_; }
    HttpRequest& request() { return request_; }

    std::chrono::system_clock::time_point receiveTime() const { return receiveTime_; }

private:
    bool processRequestLine(const char* begin, const char* end);
    bool beginBody();
    // Returns false on a framing error; sets *needMore when the buffer ran dry.
    bool parseChunked(vrcproxy::network::Buffer* buf, bool* needMore);

    HttpRequestParseState state_;
    HttpRequest request_;
    std::chrono::system_clock::time_point receiveTime_;
    size_t headerBytes_{0};

    bool chunked_{false};
    size_t bodyRemaining_{0};
    size_t chunkSize_{0};
    bool expectingChunkSize_{true};
    bool bodyTooLarge_{false};
};

} // namespace protocol
} // namespace vrcproxy
