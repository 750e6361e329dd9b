#pragma once

#include "vrcproxy/protocol/HttpHeaders.h"

#include <string>

namespace vrcproxy {
namespace network {
class Buffer;
}

namespace protocol {

class HttpResponse {
public:
    enum HttpStatusCode {
        kUnknown,
        k200Ok = 200,
        k400BadRequest = 400,
        k404NotFound = 404,
        k405MethodNotAllowed = 405,
        k413PayloadTooLarge = 413,
        k500InternalServerError = 500,
        k504GatewayTimeout = 504,
    };

    explicit HttpResponse(bool close = false)
        : statusCode_(kUnknown), closeConnection_(close) {}

    void setStatusCode(int code) { statusCode_ = code; }
    int statusCode() const { return statusCode_; }
    void setStatusMessage(const std::string& message) { statusMessage_ = message; }
    const std::string& statusMessage() const { return statusMessage_; }

    void setCloseConnection(bool on) { closeConnection_ = on; }
    bool closeConnection() const { return closeConnection_; }

    void setContentType(const std::string& contentType) { setHeader("Content-Type", contentType); }

    // Appends; repeated fields such as Set-Cookie stay separate lines.
    void addHeader(const std::string& key, const std::string& value) {
        headers_.emplace_back(key, value);
    }
    // Replaces every existing field of that name.
    void setHeader(const std::string& key, const std::string& value);
    void removeHeader(const std::string& key);
    std::string getHeader(const std::string& key) const {
        const std::string* v = FindHeader(headers_, key);
        return v ? *v : std::string();
    }
    const HeaderList& headers() const { return headers_; }

    void setBody(const std::string& body) { body_ = body; }
    void setBody(std::string&& body) { body_ = std::move(body); }
    const std::string& body() const { return body_; }

    // Serializes the message. Content-Length and Connection are always computed here;
    // any caller-set framing headers are skipped.
    void appendToBuffer(vrcproxy::network::Buffer* output) const;

    static const char* DefaultReason(int statusCode);

private:
    int statusCode_;
    std::string statusMessage_;
    bool closeConnection_;
    HeaderList headers_;
    std::string body_;
};

} // namespace protocol
} // namespace vrcproxy
