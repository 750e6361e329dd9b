#include "vrcproxy/network/TcpConnection.h"
#include "vrcproxy/network/Socket.h"
#include "vrcproxy/network/Channel.h"
#include "vrcproxy/network/EventLoop.h"
#include "vrcproxy/common/Logger.h"

#include <unistd.h>
#include <errno.h>
#include <cstring>
#include <sys/socket.h>

namespace vrcproxy {
namespace network {

TcpConnection::TcpConnection(EventLoop* loop,
                             const std::string& nameArg,
                             int sockfd,
                             const InetAddress& localAddr,
                             const InetAddress& peerAddr)
    : loop_(loop),
      name_(nameArg),
      state_(kConnecting),
      reading_(true),
      socket_(new Socket(sockfd)),
      channel_(new Channel(loop, sockfd)),
      localAddr_(localAddr),
      peerAddr_(peerAddr) {
    channel_->SetReadCallback(
        std::bind(&TcpConnection::HandleRead, this, std::placeholders::_1));
    channel_->SetWriteCallback(
        std::bind(&TcpConnection::HandleWrite, this));
    channel_->SetCloseCallback(
        std::bind(&TcpConnection::HandleClose, this));
    channel_->SetErrorCallback(
        std::bind(&TcpConnection::HandleError, this));

    LOG_DEBUG << "TcpConnection::ctor[" << name_ << "] fd=" << sockfd;
    socket_->SetKeepAlive(true);
    socket_->SetTcpNoDelay(true);
}

TcpConnection::~TcpConnection() {
    LOG_DEBUG << "TcpConnection::dtor[" << name_ << "] fd=" << channel_->fd()
              << " state=" << static_cast<int>(state_);
}

void TcpConnection::ConnectEstablished() {
    SetState(kConnected);
    channel_->EnableReading();

    if (connectionCallback_) {
        connectionCallback_(shared_from_this());
    }
}

void TcpConnection::ConnectDestroyed() {
    if (state_ == kConnected) {
        SetState(kDisconnected);
        channel_->DisableAll();
        if (connectionCallback_) {
            connectionCallback_(shared_from_this());
        }
    }
    channel_->Remove();
}

void TcpConnection::HandleRead(std::chrono::system_clock::time_point receiveTime) {
    int savedErrno = 0;
    ssize_t n = inputBuffer_.ReadFd(channel_->fd(), &savedErrno);
    if (n > 0) {
        if (messageCallback_) {
            messageCallback_(shared_from_this(), &inputBuffer_, receiveTime);
        }
    } else if (n == 0) {
        HandleClose();
    } else if (savedErrno != EAGAIN && savedErrno != EINTR) {
        LOG_ERROR << "TcpConnection::HandleRead [" << name_ << "]: " << std::strerror(savedErrno);
        HandleError();
        HandleClose();
    }
}

void TcpConnection::HandleWrite() {
    if (!channel_->IsWriting()) {
        LOG_DEBUG << "Connection fd = " << channel_->fd() << " is down, no more writing";
        return;
    }
    ssize_t n = ::write(channel_->fd(), outputBuffer_.Peek(), outputBuffer_.ReadableBytes());
    if (n > 0) {
        outputBuffer_.Retrieve(n);
        if (outputBuffer_.ReadableBytes() == 0) {
            channel_->DisableWriting();
            if (writeCompleteCallback_) {
                loop_->QueueInLoop(
                    std::bind(writeCompleteCallback_, shared_from_this()));
            }
            if (state_ == kDisconnecting) {
                ShutdownInLoop();
            }
        }
    } else if (errno != EWOULDBLOCK && errno != EINTR) {
        LOG_ERROR << "TcpConnection::HandleWrite [" << name_ << "]: " << std::strerror(errno);
    }
}

void TcpConnection::HandleClose() {
    if (state_ == kDisconnected) {
        return;
    }
    LOG_DEBUG << "fd = " << channel_->fd() << " closed";
    SetState(kDisconnected);
    channel_->DisableAll();

    TcpConnectionPtr guardThis(shared_from_this());
    if (connectionCallback_) {
        connectionCallback_(guardThis);
    }
    if (closeCallback_) {
        closeCallback_(guardThis);
    }
}

void TcpConnection::HandleError() {
    int err = 0;
    int optval;
    socklen_t optlen = static_cast<socklen_t>(sizeof optval);
    if (::getsockopt(channel_->fd(), SOL_SOCKET, SO_ERROR, &optval, &optlen) < 0) {
        err = errno;
    } else {
        err = optval;
    }
    LOG_WARN << "TcpConnection::HandleError name:" << name_ << " - SO_ERROR:" << err;
}

void TcpConnection::Send(const std::string& message) {
    if (state_ != kConnected && state_ != kDisconnecting) {
        return;
    }
    if (loop_->IsInLoopThread()) {
        SendInLoop(message.data(), message.size());
    } else {
        loop_->RunInLoop([ptr = shared_from_this(), msg = message]() {
            ptr->SendInLoop(msg.data(), msg.size());
        });
    }
}

void TcpConnection::SendInLoop(const char* data, size_t len) {
    ssize_t nwrote = 0;
    size_t remaining = len;
    bool faultError = false;

    if (state_ == kDisconnected) {
        LOG_WARN << "disconnected, give up writing";
        return;
    }

    // Nothing queued: try the socket directly.
    if (!channel_->IsWriting() && outputBuffer_.ReadableBytes() == 0) {
        nwrote = ::write(channel_->fd(), data, len);
        if (nwrote >= 0) {
            remaining = len - nwrote;
            if (remaining == 0 && writeCompleteCallback_) {
                loop_->QueueInLoop(
                    std::bind(writeCompleteCallback_, shared_from_this()));
            }
        } else {
            nwrote = 0;
            if (errno != EWOULDBLOCK) {
                LOG_ERROR << "TcpConnection::SendInLoop [" << name_ << "]: " << std::strerror(errno);
                if (errno == EPIPE || errno == ECONNRESET) {
                    faultError = true;
                }
            }
        }
    }

    if (!faultError && remaining > 0) {
        outputBuffer_.Append(data + nwrote, remaining);
        if (!channel_->IsWriting()) {
            channel_->EnableWriting();
        }
    }
}

void TcpConnection::Shutdown() {
    if (state_ == kConnected) {
        SetState(kDisconnecting);
        loop_->RunInLoop([conn = shared_from_this()]() { conn->ShutdownInLoop(); });
    }
}

void TcpConnection::ShutdownInLoop() {
    if (!channel_->IsWriting()) {
        socket_->ShutdownWrite();
    }
}

void TcpConnection::ForceClose() {
    if (state_ == kConnected || state_ == kDisconnecting) {
        loop_->QueueInLoop([conn = shared_from_this()]() {
            conn->ForceCloseInLoop();
        });
    }
}

void TcpConnection::ForceCloseInLoop() {
    if (state_ == kConnected || state_ == kDisconnecting) {
        HandleClose();
    }
}

void TcpConnection::StartRead() {
    auto self = shared_from_this();
    loop_->RunInLoop([self]() { self->StartReadInLoop(); });
}

void TcpConnection::StopRead() {
    auto self = shared_from_this();
    loop_->RunInLoop([self]() { self->StopReadInLoop(); });
}

void TcpConnection::StartReadInLoop() {
    if (!reading_ && state_ != kDisconnected) {
        reading_ = true;
        channel_->EnableReading();
    }
}

void TcpConnection::StopReadInLoop() {
    if (reading_) {
        reading_ = false;
        channel_->DisableReading();
    }
}

} // namespace network
} // namespace vrcproxy
