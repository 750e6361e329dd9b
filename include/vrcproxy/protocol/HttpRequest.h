#pragma once

#include "vrcproxy/protocol/HttpHeaders.h"

#include <cctype>
#include <cstddef>
#include <string>

namespace vrcproxy {
namespace protocol {

class HttpRequest {
public:
    enum Version {
        kUnknown, kHttp10, kHttp11
    };

    HttpRequest() : version_(kUnknown) {}

    void setVersion(Version v) { version_ = v; }
    Version getVersion() const { return version_; }

    // Any RFC 9110 token is a syntactically valid method; policy is decided later.
    bool setMethod(const char* start, const char* end) {
        if (start == end) return false;
        for (const char* p = start; p != end; ++p) {
            if (!IsTokenChar(*p)) return false;
        }
        method_.assign(start, end);
        return true;
    }
    void setMethod(const std::string& m) { method_ = m; }
    const std::string& method() const { return method_; }

    void setPath(const char* start, const char* end) {
        path_.assign(start, end);
    }
    void setPath(const std::string& p) { path_ = p; }
    const std::string& path() const { return path_; }

    // Includes the leading '?', empty when the target had none.
    void setQuery(const char* start, const char* end) {
        query_.assign(start, end);
    }
    void setQuery(const std::string& q) { query_ = q; }
    const std::string& query() const { return query_; }

    void addHeader(const char* start, const char* colon, const char* end) {
        std::string field(start, colon);
        ++colon;
        while (colon < end && isspace(static_cast<unsigned char>(*colon))) {
            ++colon;
        }
        std::string value(colon, end);
        while (!value.empty() && isspace(static_cast<unsigned char>(value[value.size() - 1]))) {
            value.resize(value.size() - 1);
        }
        headers_[field] = value;
    }

    std::string getHeader(const std::string& field) const {
        auto it = headers_.find(field);
        return it != headers_.end() ? it->second : std::string();
    }

    bool hasHeader(const std::string& field) const {
        return headers_.find(field) != headers_.end();
    }

    void setHeader(const std::string& field, const std::string& value) {
        headers_[field] = value;
    }

    void removeHeader(const std::string& field) {
        headers_.erase(field);
    }

    const HeaderMap& headers() const { return headers_; }

    void setBody(const std::string& body) { body_ = body; }
    void appendBody(const char* data, size_t len) { body_.append(data, len); }
    const std::string& body() const { return body_; }

    void swap(HttpRequest& that) {
        method_.swap(that.method_);
        std::swap(version_, that.version_);
        path_.swap(that.path_);
        query_.swap(that.query_);
        headers_.swap(that.headers_);
        body_.swap(that.body_);
    }

private:
    static bool IsTokenChar(char c) {
        if (std::isalnum(static_cast<unsigned char>(c))) return true;
        switch (c) {
            case '!': case '#': case '$': case '%': case '&': case '\'': case '*':
            case '+': case '-': case '.': case '^': case '_': case '`': case '|': case '~':
                return true;
            default:
                return false;
        }
    }

    std::string method_;
    Version version_;
    std::string path_;
    std::string query_;
    HeaderMap headers_;
    std::string body_;
};

} // namespace protocol
} // namespace vrcproxy
