#pragma once

#include "vrcproxy/network/TcpServer.h"
#include "vrcproxy/common/noncopyable.h"
#include "vrcproxy/protocol/HttpContext.h"

#include <functional>
#include <memory>

namespace vrcproxy {
namespace protocol {

class HttpRequest;
class HttpResponse;

// HTTP/1.x server with asynchronous handlers.
//
// The handler gets the parsed request and a Responder it must call exactly once,
// possibly later. While a request is outstanding the connection stops reading, so
// pipelined requests are answered strictly in order.
class HttpServer : vrcproxy::common::noncopyable {
public:
    using Responder = std::function<void(HttpResponse)>;
    using HttpCallback = std::function<void(const HttpRequest&, Responder)>;

    HttpServer(vrcproxy::network::EventLoop* loop,
               const vrcproxy::network::InetAddress& listenAddr,
               const std::string& name,
               vrcproxy::network::TcpServer::Option option = vrcproxy::network::TcpServer::kNoReusePort);

    vrcproxy::network::EventLoop* getLoop() const { return server_.getLoop(); }
    vrcproxy::network::InetAddress listenAddress() const { return server_.ListenAddress(); }

    void setHttpCallback(const HttpCallback& cb) {
        httpCallback_ = cb;
    }

    void setThreadNum(int numThreads) {
        server_.SetThreadNum(numThreads);
    }

    bool start();

private:
    struct Session {
        HttpContext context;
        bool busy{false};
    };
    using SessionPtr = std::shared_ptr<Session>;

    void onConnection(const vrcproxy::network::TcpConnectionPtr& conn);
    void onMessage(const vrcproxy::network::TcpConnectionPtr& conn,
                   vrcproxy::network::Buffer* buf,
                   std::chrono::system_clock::time_point receiveTime);

    // Static so a late Responder never touches a destroyed HttpServer.
    static void processBuffer(const vrcproxy::network::TcpConnectionPtr& conn,
                              const SessionPtr& session,
                              std::chrono::system_clock::time_point receiveTime,
                              const HttpCallback& cb);
    static void writeResponse(const vrcproxy::network::TcpConnectionPtr& conn,
                              const SessionPtr& session,
                              HttpResponse& response,
                              const HttpCallback& cb);

    vrcproxy::network::TcpServer server_;
    HttpCallback httpCallback_;
};

} // namespace protocol
} // namespace vrcproxy
