#include "vrcproxy/network/TlsContext.h"
#include "vrcproxy/common/Logger.h"

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <atomic>

namespace vrcproxy {
namespace network {

TlsContext::TlsContext() {
    static std::atomic<bool> inited{false};
    bool expected = false;
    if (inited.compare_exchange_strong(expected, true)) {
        OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS | OPENSSL_INIT_LOAD_CRYPTO_STRINGS, nullptr);
    }
}

TlsContext::~TlsContext() {
    if (ctx_) {
        SSL_CTX_free(reinterpret_cast<SSL_CTX*>(ctx_));
        ctx_ = nullptr;
    }
}

bool TlsContext::InitClient(bool verifyPeer, const std::string& caFile) {
    if (ctx_) {
        SSL_CTX_free(reinterpret_cast<SSL_CTX*>(ctx_));
        ctx_ = nullptr;
    }

    SSL_CTX* c = SSL_CTX_new(TLS_client_method());
    if (!c) {
        LOG_ERROR << "TLS: SSL_CTX_new failed: " << LastError();
        return false;
    }

    SSL_CTX_set_min_proto_version(c, TLS1_2_VERSION);
    SSL_CTX_set_options(c, SSL_OP_NO_COMPRESSION);
#ifdef SSL_OP_IGNORE_UNEXPECTED_EOF
    // OpenSSL 3: report a missing close_notify as a clean EOF.
    SSL_CTX_set_options(c, SSL_OP_IGNORE_UNEXPECTED_EOF);
#endif
    SSL_CTX_set_mode(c, SSL_MODE_ENABLE_PARTIAL_WRITE | SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER);

    if (verifyPeer) {
        int rc = caFile.empty()
            ? SSL_CTX_set_default_verify_paths(c)
            : SSL_CTX_load_verify_locations(c, caFile.c_str(), nullptr);
        if (rc != 1) {
            LOG_ERROR << "TLS: cannot load trust store "
                      << (caFile.empty() ? std::string("(system default)") : caFile)
                      << ": " << LastError();
            SSL_CTX_free(c);
            return false;
        }
        SSL_CTX_set_verify(c, SSL_VERIFY_PEER, nullptr);
    } else {
        LOG_WARN << "TLS: upstream certificate verification is disabled";
        SSL_CTX_set_verify(c, SSL_VERIFY_NONE, nullptr);
    }

    ctx_ = reinterpret_cast<ssl_ctx_st*>(c);
    verifyPeer_ = verifyPeer;
    return true;
}

std::string TlsContext::LastError() {
    std::string out;
    unsigned long e;
    while ((e = ERR_get_error()) != 0) {
        char buf[256];
        ERR_error_string_n(e, buf, sizeof buf);
        if (!out.empty()) out += "; ";
        out += buf;
    }
    return out.empty() ? std::string("unknown error") : out;
}

} // namespace network
} // namespace vrcproxy
