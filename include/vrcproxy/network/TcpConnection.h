#pragma once

#include "vrcproxy/common/noncopyable.h"
#include "vrcproxy/network/InetAddress.h"
#include "vrcproxy/network/Callbacks.h"
#include "vrcproxy/network/Buffer.h"

#include <any>
#include <atomic>
#include <memory>
#include <string>

namespace vrcproxy {
namespace network {

class Channel;
class EventLoop;
class Socket;

// One accepted client connection, owned through shared_ptr by TcpServer.
class TcpConnection : vrcproxy::common::noncopyable,
                      public std::enable_shared_from_this<TcpConnection> {
public:
    TcpConnection(EventLoop* loop,
                  const std::string& name,
                  int sockfd,
                  const InetAddress& localAddr,
                  const InetAddress& peerAddr);
    ~TcpConnection();

    EventLoop* getLoop() const { return loop_; }
    const std::string& name() const { return name_; }
    const InetAddress& localAddress() const { return localAddr_; }
    const InetAddress& peerAddress() const { return peerAddr_; }
    bool connected() const { return state_ == kConnected; }
    bool disconnected() const { return state_ == kDisconnected; }

    void SetContext(const std::any& context) { context_ = context; }
    const std::any& GetContext() const { return context_; }
    std::any* GetMutableContext() { return &context_; }

    // Bytes received but not yet consumed by the message callback. Loop thread only.
    Buffer* inputBuffer() { return &inputBuffer_; }

    // Thread safe
    void Send(const std::string& message);
    void Shutdown();
    void ForceClose();
    void StartRead();
    void StopRead();
    bool IsReading() const { return reading_; }

    void SetConnectionCallback(const ConnectionCallback& cb) { connectionCallback_ = cb; }
    void SetMessageCallback(const MessageCallback& cb) { messageCallback_ = cb; }
    void SetWriteCompleteCallback(const WriteCompleteCallback& cb) { writeCompleteCallback_ = cb; }
    void SetCloseCallback(const CloseCallback& cb) { closeCallback_ = cb; }

    // Called when TcpServer accepts a new connection
    void ConnectEstablished();
    // Called when TcpServer has removed me from its map
    void ConnectDestroyed();

private:
    enum StateE { kDisconnected, kConnecting, kConnected, kDisconnecting };

    void HandleRead(std::chrono::system_clock::time_point receiveTime);
    void HandleWrite();
    void HandleClose();
    void HandleError();

    void SendInLoop(const char* data, size_t len);
    void ShutdownInLoop();
    void ForceCloseInLoop();
    void StartReadInLoop();
    void StopReadInLoop();

    void SetState(StateE s) { state_ = s; }

    EventLoop* loop_;
    const std::string name_;
    std::atomic<StateE> state_;
    bool reading_;

    std::unique_ptr<Socket> socket_;
    std::unique_ptr<Channel> channel_;

    const InetAddress localAddr_;
    const InetAddress peerAddr_;

    ConnectionCallback connectionCallback_;
    MessageCallback messageCallback_;
    WriteCompleteCallback writeCompleteCallback_;
    CloseCallback closeCallback_;

    Buffer inputBuffer_;
    Buffer outputBuffer_;

    std::any context_;
};

} // namespace network
} // namespace vrcproxy
