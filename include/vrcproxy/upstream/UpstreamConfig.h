#pragma once

#include <cstdint>
#include <string>

namespace vrcproxy {
namespace common {
class Config;
}

namespace upstream {

// Where and how requests are forwarded. Built once at startup, read-only afterwards.
struct UpstreamConfig {
    std::string scheme{"https"};
    std::string host{"api.vrchat.cloud"};
    uint16_t port{443};
    std::string apiPrefix{"/api/1"};
    int timeoutMs{5000};
    // How long a resolved upstream address is used before it is looked up again.
    int dnsCacheSeconds{60};
    bool verifyPeer{true};
    std::string caFile;

    bool useTls() const { return scheme == "https"; }

    // Reads the [upstream] section. Returns false with a message on invalid values.
    static bool FromConfig(const vrcproxy::common::Config& conf, UpstreamConfig* out, std::string* error);
};

} // namespace upstream
} // namespace vrcproxy
