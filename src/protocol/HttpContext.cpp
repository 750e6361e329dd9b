#include "vrcproxy/protocol/HttpContext.h"
#include "vrcproxy/network/Buffer.h"
#include "vrcproxy/common/Logger.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace vrcproxy {
namespace protocol {

const size_t HttpContext::kMaxHeaderBytes;
const size_t HttpContext::kMaxBodyBytes;

// Longest chunk-size line accepted, extensions included.
static const size_t kMaxChunkLineBytes = 1024;

static std::string Trim(std::string s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.pop_back();
    size_t i = 0;
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
    return s.substr(i);
}

void HttpContext::reset() {
    state_ = kExpectRequestLine;
    HttpRequest dummy;
    request_.swap(dummy);
    headerBytes_ = 0;
    chunked_ = false;
    bodyRemaining_ = 0;
    chunkSize_ = 0;
    expectingChunkSize_ = true;
    bodyTooLarge_ = false;
}

bool HttpContext::processRequestLine(const char* begin, const char* end) {
    bool succeed = false;
    const char* start = begin;
    const char* space = std::find(start, end, ' ');
    if (space != end && request_.setMethod(start, space)) {
        start = space + 1;
        space = std::find(start, end, ' ');
        if (space != end && space != start) {
            const char* question = std::find(start, space, '?');
            if (question != space) {
                request_.setPath(start, question);
                request_.setQuery(question, space);
            } else {
                request_.setPath(start, space);
            }
            start = space + 1;
            succeed = end - start == 8 && std::equal(start, end - 1, "HTTP/1.");
            if (succeed) {
                if (*(end - 1) == '1') {
                    request_.setVersion(HttpRequest::kHttp11);
                } else if (*(end - 1) == '0') {
                    request_.setVersion(HttpRequest::kHttp10);
                } else {
                    succeed = false;
                }
            }
        }
    }
    return succeed;
}

bool HttpContext::beginBody() {
    chunked_ = false;
    bodyRemaining_ = 0;
    chunkSize_ = 0;
    expectingChunkSize_ = true;

    const std::string te = request_.getHeader("Transfer-Encoding");
    if (!te.empty() && HeaderHasToken(te, "chunked")) {
        chunked_ = true;
    } else {
        const std::string cl = request_.getHeader("Content-Length");
        if (!cl.empty()) {
            char* endp = nullptr;
            long long v = std::strtoll(cl.c_str(), &endp, 10);
            if (endp == cl.c_str() || *endp != '\0' || v < 0) {
                return false;
            }
            if (static_cast<unsigned long long>(v) > kMaxBodyBytes) {
                LOG_DEBUG << "HttpContext: Content-Length " << v << " over limit";
                bodyTooLarge_ = true;
                return false;
            }
            bodyRemaining_ = static_cast<size_t>(v);
        }
    }
    state_ = (chunked_ || bodyRemaining_ > 0) ? kExpectBody : kGotAll;
    return true;
}

bool HttpContext::parseChunked(vrcproxy::network::Buffer* buf, bool* needMore) {
    *needMore = false;
    while (true) {
        if (expectingChunkSize_) {
            const char* crlf = buf->FindCRLF();
            if (!crlf) {
                *needMore = true;
                return buf->ReadableBytes() <= kMaxChunkLineBytes;
            }
            std::string line(buf->Peek(), crlf);
            buf->RetrieveUntil(crlf + 2);

            // Chunk extensions are ignored.
            const size_t semi = line.find(';');
            if (semi != std::string::npos) line.resize(semi);
            line = Trim(line);
            if (line.empty()) return false;

            char* endp = nullptr;
            long long sz = std::strtoll(line.c_str(), &endp, 16);
            if (endp == line.c_str() || *endp != '\0' || sz < 0) return false;
            if (static_cast<unsigned long long>(sz) > kMaxBodyBytes - request_.body().size()) {
                LOG_DEBUG << "HttpContext: chunked body over limit";
                bodyTooLarge_ = true;
                return false;
            }
            chunkSize_ = static_cast<size_t>(sz);
            expectingChunkSize_ = false;
        }

        if (chunkSize_ == 0) {
            // Trailer section: header lines up to an empty line.
            while (true) {
                const char* crlf = buf->FindCRLF();
                if (!crlf) {
                    *needMore = true;
                    return buf->ReadableBytes() <= kMaxHeaderBytes;
                }
                const bool empty = crlf == buf->Peek();
                buf->RetrieveUntil(crlf + 2);
                if (empty) {
                    state_ = kGotAll;
                    return true;
                }
            }
        }

        if (buf->ReadableBytes() < chunkSize_ + 2) {
            *needMore = true;
            return true;
        }
        const char* p = buf->Peek() + chunkSize_;
        if (p[0] != '\r' || p[1] != '\n') return false;
        request_.appendBody(buf->Peek(), chunkSize_);
        buf->Retrieve(chunkSize_ + 2);
        expectingChunkSize_ = true;
    }
}

// return false if any error
bool HttpContext::parseRequest(vrcproxy::network::Buffer* buf, std::chrono::system_clock::time_point receiveTime) {
    bool hasMore = true;
    while (hasMore) {
        if (state_ == kExpectRequestLine) {
            const char* crlf = buf->FindCRLF();
            if (!crlf) {
                return buf->ReadableBytes() <= kMaxHeaderBytes;
            }
            if (crlf == buf->Peek()) {
                // Tolerate stray CRLF between pipelined requests.
                buf->Retrieve(2);
                continue;
            }
            if (!processRequestLine(buf->Peek(), crlf)) {
                LOG_DEBUG << "HttpContext: bad request line";
                return false;
            }
            receiveTime_ = receiveTime;
            headerBytes_ = crlf + 2 - buf->Peek();
            buf->RetrieveUntil(crlf + 2);
            state_ = kExpectHeaders;
        } else if (state_ == kExpectHeaders) {
            const char* crlf = buf->FindCRLF();
            if (!crlf) {
                return headerBytes_ + buf->ReadableBytes() <= kMaxHeaderBytes;
            }
            headerBytes_ += crlf + 2 - buf->Peek();
            if (headerBytes_ > kMaxHeaderBytes) {
                return false;
            }
            if (crlf == buf->Peek()) {
                buf->RetrieveUntil(crlf + 2);
                if (!beginBody()) {
                    return false;
                }
                hasMore = state_ != kGotAll;
                continue;
            }
            const char* colon = std::find(buf->Peek(), crlf, ':');
            if (colon == crlf || colon == buf->Peek()) {
                return false;
            }
            request_.addHeader(buf->Peek(), colon, crlf);
            buf->RetrieveUntil(crlf + 2);
        } else if (state_ == kExpectBody) {
            if (chunked_) {
                bool needMore = false;
                if (!parseChunked(buf, &needMore)) {
                    return false;
                }
                hasMore = false;
            } else {
                const size_t n = std::min(bodyRemaining_, buf->ReadableBytes());
                if (n > 0) {
                    request_.appendBody(buf->Peek(), n);
                    buf->Retrieve(n);
                    bodyRemaining_ -= n;
                }
                if (bodyRemaining_ == 0) {
                    state_ = kGotAll;
                }
                hasMore = false;
            }
        } else {
            hasMore = false;
        }
    }
    return true;
}

} // namespace protocol
} // namespace vrcproxy
