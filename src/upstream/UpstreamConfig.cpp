#include "vrcproxy/upstream/UpstreamConfig.h"
#include "vrcproxy/common/Config.h"

namespace vrcproxy {
namespace upstream {

bool UpstreamConfig::FromConfig(const vrcproxy::common::Config& conf, UpstreamConfig* out, std::string* error) {
    UpstreamConfig c;
    c.scheme = conf.GetString("upstream", "scheme", c.scheme);
    c.host = conf.GetString("upstream", "host", c.host);
    const int port = conf.GetInt("upstream", "port", c.useTls() ? 443 : 80);
    c.apiPrefix = conf.GetString("upstream", "api_prefix", c.apiPrefix);
    c.timeoutMs = conf.GetInt("upstream", "timeout_ms", c.timeoutMs);
    c.dnsCacheSeconds = conf.GetInt("upstream", "dns_cache_s", c.dnsCacheSeconds);
    c.verifyPeer = conf.GetBool("upstream", "verify_peer", c.verifyPeer);
    c.caFile = conf.GetString("upstream", "ca_file", "");

    if (c.scheme != "https" && c.scheme != "http") {
        *error = "upstream.scheme must be https or http, got '" + c.scheme + "'";
        return false;
    }
    if (c.host.empty()) {
        *error = "upstream.host is empty";
        return false;
    }
    if (port <= 0 || port > 65535) {
        *error = "upstream.port out of range: " + std::to_string(port);
        return false;
    }
    c.port = static_cast<uint16_t>(port);
    if (c.timeoutMs <= 0) {
        *error = "upstream.timeout_ms must be positive";
        return false;
    }
    if (c.dnsCacheSeconds < 0) {
        *error = "upstream.dns_cache_s must not be negative";
        return false;
    }
    if (!c.apiPrefix.empty() && c.apiPrefix[0] != '/') {
        c.apiPrefix.insert(c.apiPrefix.begin(), '/');
    }
    while (c.apiPrefix.size() > 1 && c.apiPrefix.back() == '/') {
        c.apiPrefix.pop_back();
    }
    *out = c;
    return true;
}

} // namespace upstream
} // namespace vrcproxy
