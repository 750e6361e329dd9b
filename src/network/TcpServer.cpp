#include "vrcproxy/network/TcpServer.h"
#include "vrcproxy/network/EventLoop.h"
#include "vrcproxy/network/Acceptor.h"
#include "vrcproxy/network/Socket.h"
#include "vrcproxy/common/Logger.h"

#include <cstdio>
#include <functional>

namespace vrcproxy {
namespace network {

TcpServer::TcpServer(EventLoop* loop,
                     const InetAddress& listenAddr,
                     const std::string& nameArg,
                     Option option)
    : loop_(loop),
      name_(nameArg),
      acceptor_(new Acceptor(loop, listenAddr, option == kReusePort)),
      threadPool_(new EventLoopThreadPool(loop, nameArg)),
      started_(0),
      next_conn_id_(1) {
    acceptor_->SetNewConnectionCallback(
        std::bind(&TcpServer::NewConnection, this, std::placeholders::_1, std::placeholders::_2));
}

TcpServer::~TcpServer() {
    LOG_DEBUG << "TcpServer::~TcpServer [" << name_ << "] destructing";
    for (auto& item : connections_) {
        TcpConnectionPtr conn(item.second);
        item.second.reset();
        conn->getLoop()->RunInLoop(std::bind(&TcpConnection::ConnectDestroyed, conn));
    }
}

InetAddress TcpServer::ListenAddress() const {
    return acceptor_->ListenAddress();
}

void TcpServer::SetThreadNum(int numThreads) {
    threadPool_->SetThreadNum(numThreads);
}

bool TcpServer::Start() {
    if (started_++ != 0) {
        return acceptor_->Listenning();
    }
    if (!acceptor_->Listen()) {
        LOG_ERROR << "TcpServer::Start [" << name_ << "] failed to listen";
        return false;
    }
    threadPool_->Start();
    LOG_INFO << "TcpServer [" << name_ << "] listening on " << ListenAddress().toIpPort();
    return true;
}

void TcpServer::NewConnection(int sockfd, const InetAddress& peerAddr) {
    char buf[32];
    std::snprintf(buf, sizeof buf, "#%d", next_conn_id_);
    ++next_conn_id_;
    std::string connName = name_ + buf;

    LOG_DEBUG << "TcpServer::NewConnection [" << name_ << "] - new connection [" << connName
              << "] from " << peerAddr.toIpPort();

    EventLoop* ioLoop = threadPool_->GetNextLoop();
    TcpConnectionPtr conn = std::make_shared<TcpConnection>(ioLoop,
                                                            connName,
                                                            sockfd,
                                                            ListenAddress(),
                                                            peerAddr);
    connections_[connName] = conn;
    conn->SetConnectionCallback(connectionCallback_);
    conn->SetMessageCallback(messageCallback_);
    conn->SetWriteCompleteCallback(writeCompleteCallback_);
    conn->SetCloseCallback(
        std::bind(&TcpServer::RemoveConnection, this, std::placeholders::_1));

    ioLoop->RunInLoop(std::bind(&TcpConnection::ConnectEstablished, conn));
}

void TcpServer::RemoveConnection(const TcpConnectionPtr& conn) {
    // Deferred so the connection is never erased from inside its own callback.
    loop_->QueueInLoop(std::bind(&TcpServer::RemoveConnectionInLoop, this, conn));
}

void TcpServer::RemoveConnectionInLoop(const TcpConnectionPtr& conn) {
    LOG_DEBUG << "TcpServer::RemoveConnectionInLoop [" << name_ << "] - connection " << conn->name();
    connections_.erase(conn->name());

    EventLoop* ioLoop = conn->getLoop();
    ioLoop->QueueInLoop(
        std::bind(&TcpConnection::ConnectDestroyed, conn));
}

} // namespace network
} // namespace vrcproxy
