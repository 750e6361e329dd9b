#include "vrcproxy/network/Acceptor.h"
#include "vrcproxy/network/InetAddress.h"
#include "vrcproxy/network/EventLoop.h"
#include "vrcproxy/common/Logger.h"

#include <errno.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cstring>

namespace vrcproxy {
namespace network {

static int CreateNonblocking() {
    int sockfd = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, IPPROTO_TCP);
    if (sockfd < 0) {
        LOG_FATAL << "Acceptor: socket(): " << std::strerror(errno);
    }
    return sockfd;
}

Acceptor::Acceptor(EventLoop* loop, const InetAddress& listenAddr, bool reuseport)
    : loop_(loop),
      accept_socket_(CreateNonblocking()),
      accept_channel_(loop, accept_socket_.fd()),
      bound_(false),
      listenning_(false) {
    accept_socket_.SetReuseAddr(true);
    accept_socket_.SetReusePort(reuseport);
    bound_ = accept_socket_.fd() >= 0 && accept_socket_.BindAddress(listenAddr);

    accept_channel_.SetReadCallback(
        [this](std::chrono::system_clock::time_point) { HandleRead(); });
}

Acceptor::~Acceptor() {
    accept_channel_.DisableAll();
    accept_channel_.Remove();
}

bool Acceptor::Listen() {
    if (!bound_ || !accept_socket_.Listen()) {
        return false;
    }
    listenning_ = true;
    accept_channel_.EnableReading();
    return true;
}

void Acceptor::HandleRead() {
    InetAddress peerAddr;
    int connfd = accept_socket_.Accept(&peerAddr);
    if (connfd >= 0) {
        if (new_connection_callback_) {
            new_connection_callback_(connfd, peerAddr);
        } else {
            ::close(connfd);
        }
    } else {
        int savedErrno = errno;
        LOG_ERROR << "Acceptor::HandleRead: " << std::strerror(savedErrno);
        if (savedErrno == EMFILE) {
            LOG_ERROR << "sockfd reached limit";
        }
    }
}

} // namespace network
} // namespace vrcproxy
