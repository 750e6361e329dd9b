#pragma once

#include "vrcproxy/common/noncopyable.h"
#include "vrcproxy/network/InetAddress.h"

namespace vrcproxy {
namespace network {

// Owns a socket fd and closes it on destruction.
class Socket : vrcproxy::common::noncopyable {
public:
    explicit Socket(int sockfd)
        : sockfd_(sockfd) {}
    ~Socket();

    int fd() const { return sockfd_; }

    bool BindAddress(const InetAddress& localaddr);
    bool Listen();
    int Accept(InetAddress* peeraddr);

    // Address the socket is bound to (resolves port 0 after bind).
    InetAddress LocalAddress() const;

    void ShutdownWrite();

    void SetTcpNoDelay(bool on);
    void SetReuseAddr(bool on);
    void SetReusePort(bool on);
    void SetKeepAlive(bool on);

private:
    const int sockfd_;
};

} // namespace network
} // namespace vrcproxy
