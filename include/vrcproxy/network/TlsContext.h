#pragma once

#include "vrcproxy/common/noncopyable.h"

#include <string>

struct ssl_ctx_st;

namespace vrcproxy {
namespace network {

// Owns an OpenSSL SSL_CTX shared by every outbound TLS session.
class TlsContext : vrcproxy::common::noncopyable {
public:
    TlsContext();
    ~TlsContext();

    // Client context: TLS 1.2 minimum, the system trust store unless caFile names a PEM bundle.
    bool InitClient(bool verifyPeer, const std::string& caFile);

    ssl_ctx_st* ctx() const { return ctx_; }
    bool ok() const { return ctx_ != nullptr; }
    bool verifyPeer() const { return verifyPeer_; }

    // Drains the OpenSSL error queue into one printable line.
    static std::string LastError();

private:
    ssl_ctx_st* ctx_{nullptr};
    bool verifyPeer_{true};
};

} // namespace network
} // namespace vrcproxy
