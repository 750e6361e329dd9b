#include "vrcproxy/protocol/HttpResponseContext.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace vrcproxy {
namespace protocol {

const size_t HttpResponseContext::kMaxHeaderBytes;
const size_t HttpResponseContext::kMaxBodyBytes;

static bool isWs(unsigned char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

void HttpResponseContext::reset() {
    state_ = kExpectStatusLine;
    pending_.clear();
    error_.clear();
    statusCode_ = 0;
    reason_.clear();
    headers_.clear();
    body_.clear();
    chunked_ = false;
    bodyRemaining_ = 0;
    needsCloseToFinish_ = false;
    expectingChunkSize_ = true;
    chunkRemaining_ = 0;
    trailer_ = false;
}

bool HttpResponseContext::fail(const std::string& why) {
    state_ = kError;
    error_ = why;
    return false;
}

bool HttpResponseContext::parseHeaderBlock(const std::string& headerBlock) {
    headers_.clear();

    size_t pos = 0;
    size_t lineEnd = headerBlock.find("\r\n", pos);
    if (lineEnd == std::string::npos) {
        return fail("missing status line");
    }
    const std::string statusLine = headerBlock.substr(0, lineEnd);
    pos = lineEnd + 2;

    // HTTP/1.1 200 OK
    if (statusLine.rfind("HTTP/1.", 0) != 0) {
        return fail("bad status line: " + statusLine);
    }
    const size_t sp1 = statusLine.find(' ');
    if (sp1 == std::string::npos || sp1 + 4 > statusLine.size()) {
        return fail("bad status line: " + statusLine);
    }
    int code = 0;
    for (size_t i = sp1 + 1; i < sp1 + 4; ++i) {
        const char c = statusLine[i];
        if (c < '0' || c > '9') return fail("bad status code: " + statusLine);
        code = code * 10 + (c - '0');
    }
    if (sp1 + 4 < statusLine.size() && statusLine[sp1 + 4] != ' ') {
        return fail("bad status code: " + statusLine);
    }
    statusCode_ = code;
    reason_ = sp1 + 5 <= statusLine.size() ? statusLine.substr(sp1 + 5) : std::string();

    while (pos < headerBlock.size()) {
        const size_t next = headerBlock.find("\r\n", pos);
        if (next == std::string::npos || next == pos) break;
        const std::string line = headerBlock.substr(pos, next - pos);
        pos = next + 2;
        const size_t colon = line.find(':');
        if (colon == std::string::npos || colon == 0) {
            return fail("bad header line: " + line);
        }
        std::string key = line.substr(0, colon);
        std::string val = line.substr(colon + 1);
        while (!val.empty() && (val.front() == ' ' || val.front() == '\t')) val.erase(val.begin());
        while (!val.empty() && (val.back() == ' ' || val.back() == '\t')) val.pop_back();
        headers_.emplace_back(std::move(key), std::move(val));
    }

    const std::string te = getHeader("Transfer-Encoding");
    const std::string cl = getHeader("Content-Length");

    chunked_ = !te.empty() && HeaderHasToken(te, "chunked");
    needsCloseToFinish_ = false;
    bodyRemaining_ = 0;
    state_ = kExpectBody;

    if ((statusCode_ >= 100 && statusCode_ < 200) || statusCode_ == 204 || statusCode_ == 304) {
        state_ = kGotAll;
    } else if (chunked_) {
        expectingChunkSize_ = true;
        chunkRemaining_ = 0;
        trailer_ = false;
    } else if (!cl.empty()) {
        char* endp = nullptr;
        const long long n = std::strtoll(cl.c_str(), &endp, 10);
        if (endp == cl.c_str() || *endp != '\0' || n < 0) {
            return fail("bad Content-Length: " + cl);
        }
        if (static_cast<unsigned long long>(n) > kMaxBodyBytes) {
            return fail("response body too large: Content-Length " + cl);
        }
        bodyRemaining_ = static_cast<size_t>(n);
        if (bodyRemaining_ == 0) state_ = kGotAll;
    } else {
        needsCloseToFinish_ = true;
    }
    return true;
}

bool HttpResponseContext::consumeChunked() {
    while (!pending_.empty()) {
        if (trailer_) {
            // Trailer fields are dropped; an empty line ends the message.
            const size_t crlf = pending_.find("\r\n");
            if (crlf == std::string::npos) {
                if (pending_.size() > kMaxHeaderBytes) return fail("chunk trailer too large");
                return true;
            }
            pending_.erase(0, crlf + 2);
            if (crlf == 0) {
                state_ = kGotAll;
                return true;
            }
            continue;
        }

        if (expectingChunkSize_) {
            const size_t crlf = pending_.find("\r\n");
            if (crlf == std::string::npos) {
                if (pending_.size() > 1024) return fail("chunk size line too long");
                return true;
            }
            std::string line = pending_.substr(0, crlf);
            pending_.erase(0, crlf + 2);
            const size_t semi = line.find(';');
            if (semi != std::string::npos) line.resize(semi);
            while (!line.empty() && isWs(static_cast<unsigned char>(line.front()))) line.erase(line.begin());
            while (!line.empty() && isWs(static_cast<unsigned char>(line.back()))) line.pop_back();
            if (line.empty()) return fail("empty chunk size");
            char* endp = nullptr;
            const unsigned long long n = std::strtoull(line.c_str(), &endp, 16);
            if (endp == line.c_str() || *endp != '\0') return fail("bad chunk size: " + line);
            if (n > kMaxBodyBytes - body_.size()) return fail("response body too large");
            chunkRemaining_ = static_cast<size_t>(n);
            expectingChunkSize_ = false;
            if (chunkRemaining_ == 0) trailer_ = true;
            continue;
        }

        if (chunkRemaining_ > 0) {
            const size_t take = std::min(chunkRemaining_, pending_.size());
            body_.append(pending_, 0, take);
            pending_.erase(0, take);
            chunkRemaining_ -= take;
            continue;
        }

        // CRLF after chunk data.
        if (pending_.size() < 2) return true;
        if (pending_[0] != '\r' || pending_[1] != '\n') return fail("missing CRLF after chunk");
        pending_.erase(0, 2);
        expectingChunkSize_ = true;
    }
    return true;
}

bool HttpResponseContext::consumeBody() {
    if (chunked_) {
        return consumeChunked();
    }
    if (needsCloseToFinish_) {
        if (pending_.size() > kMaxBodyBytes - body_.size()) {
            pending_.clear();
            return fail("response body too large");
        }
        body_.append(pending_);
        pending_.clear();
        return true;
    }
    const size_t take = std::min(bodyRemaining_, pending_.size());
    body_.append(pending_, 0, take);
    pending_.erase(0, take);
    bodyRemaining_ -= take;
    if (bodyRemaining_ == 0) state_ = kGotAll;
    // Bytes past the declared length are ignored; we always ask for Connection: close.
    return true;
}

bool HttpResponseContext::feed(const char* data, size_t len) {
    if (state_ == kError || state_ == kGotAll) return state_ == kGotAll;
    if (data && len > 0) pending_.append(data, len);

    if (state_ == kExpectStatusLine) {
        const size_t hdrPos = pending_.find("\r\n\r\n");
        if (hdrPos == std::string::npos) {
            if (pending_.size() > kMaxHeaderBytes) fail("response header too large");
            return false;
        }
        const std::string headerBlock = pending_.substr(0, hdrPos + 4);
        pending_.erase(0, hdrPos + 4);
        if (!parseHeaderBlock(headerBlock)) return false;
        if (state_ == kGotAll) return true;
    }

    if (state_ == kExpectBody) {
        consumeBody();
    }
    return state_ == kGotAll;
}

bool HttpResponseContext::finishOnClose() {
    if (state_ == kExpectBody && needsCloseToFinish_) {
        state_ = kGotAll;
    } else if (state_ != kGotAll && state_ != kError) {
        fail(state_ == kExpectStatusLine ? "connection closed before response headers"
                                         : "connection closed mid-body");
    }
    return state_ == kGotAll;
}

} // namespace protocol
} // namespace vrcproxy
