#include "vrcproxy/protocol/HttpServer.h"
#include "vrcproxy/protocol/HttpRequest.h"
#include "vrcproxy/protocol/HttpResponse.h"
#include "vrcproxy/network/EventLoop.h"
#include "vrcproxy/network/Buffer.h"
#include "vrcproxy/common/Logger.h"

namespace vrcproxy {
namespace protocol {

using vrcproxy::network::Buffer;
using vrcproxy::network::TcpConnection;
using vrcproxy::network::TcpConnectionPtr;

HttpServer::HttpServer(vrcproxy::network::EventLoop* loop,
                       const vrcproxy::network::InetAddress& listenAddr,
                       const std::string& name,
                       vrcproxy::network::TcpServer::Option option)
    : server_(loop, listenAddr, name, option) {
    server_.SetConnectionCallback(
        std::bind(&HttpServer::onConnection, this, std::placeholders::_1));
    server_.SetMessageCallback(
        std::bind(&HttpServer::onMessage, this, std::placeholders::_1, std::placeholders::_2, std::placeholders::_3));
}

bool HttpServer::start() {
    LOG_INFO << "HttpServer[" << server_.name() << "] starting";
    return server_.Start();
}

void HttpServer::onConnection(const TcpConnectionPtr& conn) {
    if (conn->connected()) {
        conn->SetContext(std::make_shared<Session>());
    }
}

void HttpServer::onMessage(const TcpConnectionPtr& conn,
                           Buffer* buf,
                           std::chrono::system_clock::time_point receiveTime) {
    SessionPtr* session = std::any_cast<SessionPtr>(conn->GetMutableContext());
    if (!session || !*session) {
        return;
    }
    if ((*session)->busy) {
        // Bytes stay buffered until the outstanding response is written; after a
        // final response (half-closed) they are dropped.
        if (!conn->connected()) {
            buf->RetrieveAll();
        }
        return;
    }
    processBuffer(conn, *session, receiveTime, httpCallback_);
}

void HttpServer::processBuffer(const TcpConnectionPtr& conn,
                               const SessionPtr& session,
                               std::chrono::system_clock::time_point receiveTime,
                               const HttpCallback& cb) {
    Buffer* buf = conn->inputBuffer();
    HttpContext& context = session->context;

    if (!context.parseRequest(buf, receiveTime)) {
        HttpResponse response(true);
        if (context.bodyTooLarge()) {
            LOG_WARN << "HttpServer: oversized request body from " << conn->peerAddress().toIpPort();
            response.setStatusCode(HttpResponse::k413PayloadTooLarge);
            response.setStatusMessage("Payload Too Large");
            response.setBody("Payload Too Large");
        } else {
            LOG_WARN << "HttpServer: malformed request from " << conn->peerAddress().toIpPort();
            response.setStatusCode(HttpResponse::k400BadRequest);
            response.setStatusMessage("Bad Request");
            response.setBody("Bad Request");
        }
        response.setContentType("text/plain");
        session->busy = true;
        buf->RetrieveAll();
        writeResponse(conn, session, response, cb);
        return;
    }
    if (!context.gotAll()) {
        return;
    }

    HttpRequest request;
    request.swap(context.request());
    context.reset();

    const std::string connection = request.getHeader("Connection");
    const bool close = HeaderHasToken(connection, "close") ||
                       (request.getVersion() == HttpRequest::kHttp10 &&
                        !HeaderHasToken(connection, "keep-alive"));

    session->busy = true;
    conn->StopRead();

    if (!cb) {
        HttpResponse response(close);
        response.setStatusCode(HttpResponse::k404NotFound);
        response.setStatusMessage("Not Found");
        writeResponse(conn, session, response, cb);
        return;
    }

    std::weak_ptr<TcpConnection> weakConn(conn);
    auto answered = std::make_shared<bool>(false);
    vrcproxy::network::EventLoop* loop = conn->getLoop();
    Responder responder = [weakConn, session, close, cb, answered, loop](HttpResponse response) {
        loop->RunInLoop([weakConn, session, close, cb, answered, response]() mutable {
            if (*answered) {
                LOG_ERROR << "HttpServer: handler responded twice";
                return;
            }
            *answered = true;
            TcpConnectionPtr conn = weakConn.lock();
            if (!conn || conn->disconnected()) {
                LOG_DEBUG << "HttpServer: client went away before the response";
                return;
            }
            response.setCloseConnection(close || response.closeConnection());
            writeResponse(conn, session, response, cb);
        });
    };
    cb(request, std::move(responder));
}

void HttpServer::writeResponse(const TcpConnectionPtr& conn,
                               const SessionPtr& session,
                               HttpResponse& response,
                               const HttpCallback& cb) {
    Buffer out;
    response.appendToBuffer(&out);
    conn->Send(out.RetrieveAllAsString());

    if (response.closeConnection()) {
        // Reading must be live again so the peer's FIN reaches HandleClose.
        conn->StartRead();
        conn->Shutdown();
        return;
    }

    session->busy = false;
    conn->StartRead();
    if (conn->inputBuffer()->ReadableBytes() > 0) {
        // Pipelined requests that arrived meanwhile; queued to keep the stack flat.
        std::weak_ptr<TcpConnection> weakConn(conn);
        conn->getLoop()->QueueInLoop([weakConn, session, cb]() {
            TcpConnectionPtr c = weakConn.lock();
            if (c && c->connected() && !session->busy) {
                processBuffer(c, session, std::chrono::system_clock::now(), cb);
            }
        });
    }
}

} // namespace protocol
} // namespace vrcproxy
