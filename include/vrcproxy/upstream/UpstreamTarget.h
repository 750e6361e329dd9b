#pragma once

#include <cstdint>
#include <string>

namespace vrcproxy {
namespace upstream {

// Rewritten destination of one proxied request.
struct UpstreamTarget {
    std::string scheme;
    std::string host;
    uint16_t port{0};
    // API prefix + inbound path.
    std::string path;
    // Verbatim, including the leading '?'; empty when absent.
    std::string query;

    std::string requestTarget() const { return path + query; }

    // Host header value; the port is omitted when it is the scheme default.
    std::string authority() const {
        const bool defaultPort = (scheme == "https" && port == 443) || (scheme == "http" && port == 80);
        return defaultPort ? host : host + ":" + std::to_string(port);
    }

    std::string url() const { return scheme + "://" + authority() + requestTarget(); }
};

} // namespace upstream
} // namespace vrcproxy
