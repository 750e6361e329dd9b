#pragma once

#include "vrcproxy/common/noncopyable.h"
#include "vrcproxy/network/Socket.h"
#include "vrcproxy/network/Channel.h"

#include <functional>

namespace vrcproxy {
namespace network {

class EventLoop;
class InetAddress;

class Acceptor : vrcproxy::common::noncopyable {
public:
    using NewConnectionCallback = std::function<void(int sockfd, const InetAddress&)>;

    Acceptor(EventLoop* loop, const InetAddress& listenAddr, bool reuseport);
    ~Acceptor();

    void SetNewConnectionCallback(const NewConnectionCallback& cb) {
        new_connection_callback_ = cb;
    }

    bool Listenning() const { return listenning_; }
    // False when the bind in the constructor or listen(2) failed.
    bool Listen();

    InetAddress ListenAddress() const { return accept_socket_.LocalAddress(); }

private:
    void HandleRead();

    EventLoop* loop_;
    Socket accept_socket_;
    Channel accept_channel_;
    NewConnectionCallback new_connection_callback_;
    bool bound_;
    bool listenning_;
};

} // namespace network
} // namespace vrcproxy
