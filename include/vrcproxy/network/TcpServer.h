#pragma once

#include "vrcproxy/common/noncopyable.h"
#include "vrcproxy/network/InetAddress.h"
#include "vrcproxy/network/Callbacks.h"
#include "vrcproxy/network/TcpConnection.h"
#include "vrcproxy/network/EventLoopThreadPool.h"

#include <atomic>
#include <map>
#include <memory>
#include <string>

namespace vrcproxy {
namespace network {

class EventLoop;
class Acceptor;

// Accepts on the base loop and spreads connections over the IO loop pool.
class TcpServer : vrcproxy::common::noncopyable {
public:
    enum Option {
        kNoReusePort,
        kReusePort,
    };

    TcpServer(EventLoop* loop,
              const InetAddress& listenAddr,
              const std::string& nameArg,
              Option option = kNoReusePort);
    ~TcpServer();

    const std::string& name() const { return name_; }
    EventLoop* getLoop() const { return loop_; }

    // Actual bound address; differs from the requested one when port 0 was asked for.
    InetAddress ListenAddress() const;

    void SetThreadNum(int numThreads);

    // Must run on the base loop's thread. False when the port could not be bound.
    bool Start();

    void SetConnectionCallback(const ConnectionCallback& cb) { connectionCallback_ = cb; }
    void SetMessageCallback(const MessageCallback& cb) { messageCallback_ = cb; }
    void SetWriteCompleteCallback(const WriteCompleteCallback& cb) { writeCompleteCallback_ = cb; }

private:
    void NewConnection(int sockfd, const InetAddress& peerAddr);
    void RemoveConnection(const TcpConnectionPtr& conn);
    void RemoveConnectionInLoop(const TcpConnectionPtr& conn);

    using ConnectionMap = std::map<std::string, TcpConnectionPtr>;

    EventLoop* loop_;
    const std::string name_;
    std::unique_ptr<Acceptor> acceptor_;
    std::unique_ptr<EventLoopThreadPool> threadPool_;

    ConnectionCallback connectionCallback_;
    MessageCallback messageCallback_;
    WriteCompleteCallback writeCompleteCallback_;

    std::atomic_int started_;
    int next_conn_id_;
    ConnectionMap connections_;
};

} // namespace network
} // namespace vrcproxy
