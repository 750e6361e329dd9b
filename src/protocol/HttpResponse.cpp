#include "vrcproxy/protocol/HttpResponse.h"
#include "vrcproxy/network/Buffer.h"

#include <algorithm>
#include <cstdio>
#include <cstring>

namespace vrcproxy {
namespace protocol {

void HttpResponse::setHeader(const std::string& key, const std::string& value) {
    removeHeader(key);
    headers_.emplace_back(key, value);
}

void HttpResponse::removeHeader(const std::string& key) {
    headers_.erase(std::remove_if(headers_.begin(), headers_.end(),
                                  [&key](const HeaderList::value_type& h) { return IEquals(h.first, key); }),
                   headers_.end());
}

const char* HttpResponse::DefaultReason(int statusCode) {
    switch (statusCode) {
        case 200: return "OK";
        case 201: return "Created";
        case 204: return "No Content";
        case 301: return "Moved Permanently";
        case 302: return "Found";
        case 304: return "Not Modified";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 413: return "Payload Too Large";
        case 429: return "Too Many Requests";
        case 500: return "Internal Server Error";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        case 504: return "Gateway Timeout";
        default: return "";
    }
}

void HttpResponse::appendToBuffer(vrcproxy::network::Buffer* output) const {
    char buf[64];
    std::snprintf(buf, sizeof buf, "HTTP/1.1 %d ", statusCode_);
    output->Append(buf, std::strlen(buf));
    output->Append(statusMessage_.empty() ? std::string(DefaultReason(statusCode_)) : statusMessage_);
    output->Append("\r\n");

    std::snprintf(buf, sizeof buf, "Content-Length: %zu\r\n", body_.size());
    output->Append(buf, std::strlen(buf));
    output->Append(closeConnection_ ? "Connection: close\r\n" : "Connection: keep-alive\r\n");

    for (const auto& header : headers_) {
        if (IEquals(header.first, "Content-Length") ||
            IEquals(header.first, "Connection") ||
            IEquals(header.first, "Transfer-Encoding")) {
            continue;
        }
        output->Append(header.first);
        output->Append(": ");
        output->Append(header.second);
        output->Append("\r\n");
    }

    output->Append("\r\n");
    output->Append(body_);
}

} // namespace protocol
} // namespace vrcproxy
