#include "vrcproxy/upstream/HttpsUpstreamDispatcher.h"
#include "vrcproxy/network/Channel.h"
#include "vrcproxy/network/EventLoop.h"
#include "vrcproxy/network/Resolver.h"
#include "vrcproxy/network/TlsContext.h"
#include "vrcproxy/protocol/Compression.h"
#include "vrcproxy/common/Logger.h"

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>

#include <sys/socket.h>
#include <sys/timerfd.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <set>

namespace vrcproxy {
namespace upstream {

using vrcproxy::network::Channel;
using vrcproxy::network::EventLoop;
using vrcproxy::network::InetAddress;
using vrcproxy::protocol::HttpResponseContext;
using vrcproxy::protocol::IEquals;
using vrcproxy::protocol::ToLowerCopy;

namespace {

// Never forwarded: connection-scoped fields plus those we set ourselves.
bool IsHopByHop(const std::string& lowerName) {
    static const std::set<std::string> kHopByHop = {
        "connection", "keep-alive", "proxy-connection", "te", "trailer", "upgrade",
        "transfer-encoding", "host", "accept-encoding", "content-length",
    };
    return kHopByHop.count(lowerName) > 0;
}

long ElapsedMs(std::chrono::steady_clock::time_point start) {
    return static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count());
}

} // namespace

HttpsUpstreamDispatcher::HttpsUpstreamDispatcher(const UpstreamConfig& config,
                                                 vrcproxy::network::Resolver* resolver,
                                                 std::shared_ptr<vrcproxy::network::TlsContext> tls)
    : config_(config),
      resolver_(resolver),
      tls_(std::move(tls)) {
    if (config_.useTls() && (!tls_ || !tls_->ok())) {
        LOG_ERROR << "HttpsUpstreamDispatcher: https upstream without a TLS context; every dispatch will fail";
    }
}

std::string HttpsUpstreamDispatcher::BuildRequest(const UpstreamRequest& request) {
    std::set<std::string> connectionTokens;
    auto conn = request.headers.find("Connection");
    if (conn != request.headers.end()) {
        size_t pos = 0;
        const std::string& v = conn->second;
        while (pos <= v.size()) {
            size_t comma = v.find(',', pos);
            if (comma == std::string::npos) comma = v.size();
            std::string token = v.substr(pos, comma - pos);
            while (!token.empty() && token.front() == ' ') token.erase(token.begin());
            while (!token.empty() && token.back() == ' ') token.pop_back();
            if (!token.empty()) connectionTokens.insert(ToLowerCopy(token));
            pos = comma + 1;
        }
    }

    std::string out;
    out.reserve(512);
    out += request.method;
    out += ' ';
    out += request.target.requestTarget();
    out += " HTTP/1.1\r\n";
    out += "Host: " + request.target.authority() + "\r\n";
    for (const auto& h : request.headers) {
        const std::string lower = ToLowerCopy(h.first);
        if (IsHopByHop(lower) || connectionTokens.count(lower) > 0) {
            continue;
        }
        out += h.first;
        out += ": ";
        out += h.second;
        out += "\r\n";
    }
    out += "Accept-Encoding: gzip, deflate\r\n";
    out += "Connection: close\r\n";
    out += "\r\n";
    return out;
}

bool HttpsUpstreamDispatcher::DecodeResponse(HttpResponseContext& response, UpstreamResult* result) {
    result->status = response.statusCode();
    result->reason = response.reason();
    result->headers.clear();

    std::string contentEncoding;
    for (const auto& h : response.headers()) {
        if (IEquals(h.first, "Content-Encoding")) {
            contentEncoding = h.second;
            continue;
        }
        if (IEquals(h.first, "Content-Length") || IEquals(h.first, "Transfer-Encoding") ||
            IEquals(h.first, "Connection") || IEquals(h.first, "Keep-Alive")) {
            continue;
        }
        result->headers.push_back(h);
    }

    const auto enc = vrcproxy::protocol::Compression::ParseContentEncoding(contentEncoding);
    if (enc == vrcproxy::protocol::Compression::Encoding::kIdentity || response.body().empty()) {
        result->body.swap(response.body());
        return true;
    }
    if (enc == vrcproxy::protocol::Compression::Encoding::kUnknown) {
        result->error = "unsupported Content-Encoding: " + contentEncoding;
        return false;
    }
    const size_t limit = vrcproxy::protocol::HttpResponseContext::kMaxBodyBytes;
    if (!vrcproxy::protocol::Compression::Decompress(enc, response.body(), &result->body, limit)) {
        result->error = "cannot decode " + contentEncoding + " body (corrupt, or over " +
                         std::to_string(limit) + " bytes decoded)";
        result->body.clear();
        return false;
    }
    return true;
}

void HttpsUpstreamDispatcher::Dispatch(EventLoop* loop,
                                       const UpstreamRequest& request,
                                       DoneCallback done) {
    auto ctx = std::make_shared<DispatchContext>();
    ctx->loop = loop;
    ctx->host = request.target.host;
    ctx->useTls = request.target.scheme == "https";
    ctx->verifyPeer = config_.verifyPeer;
    ctx->timeoutMs = config_.timeoutMs;
    ctx->tls = tls_;
    ctx->url = request.target.url();
    ctx->out = BuildRequest(request);
    ctx->done = std::move(done);
    ctx->start = std::chrono::steady_clock::now();

    // The deadline covers everything from here on, DNS included.
    int tfd = ::timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (tfd < 0) {
        Fail(ctx, std::string("timerfd_create: ") + std::strerror(errno));
        return;
    }
    ctx->timerfd = tfd;

    struct itimerspec howlong;
    std::memset(&howlong, 0, sizeof howlong);
    howlong.it_value.tv_sec = ctx->timeoutMs / 1000;
    howlong.it_value.tv_nsec = static_cast<long>(ctx->timeoutMs % 1000) * 1000000L;
    if (::timerfd_settime(tfd, 0, &howlong, nullptr) != 0) {
        Fail(ctx, std::string("timerfd_settime: ") + std::strerror(errno));
        return;
    }
    ctx->timerChannel = std::make_shared<Channel>(loop, tfd);
    ctx->timerChannel->SetReadCallback([ctx](std::chrono::system_clock::time_point) { OnTimeout(ctx); });
    ctx->timerChannel->EnableReading();

    if (ctx->useTls && (!ctx->tls || !ctx->tls->ok())) {
        Fail(ctx, "no TLS context for https upstream");
        return;
    }

    LOG_DEBUG << "upstream: " << request.method << " " << ctx->url;
    ctx->state = State::kResolving;
    resolver_->Resolve(loop, request.target.host, request.target.port,
                       [ctx](bool ok, const InetAddress& addr, const std::string& error) {
                           OnResolved(ctx, ok, addr, error);
                       },
                       [ctx]() { return !ctx->finished.load(); });
}

void HttpsUpstreamDispatcher::OnResolved(const ContextPtr& ctx, bool ok,
                                         const InetAddress& addr, const std::string& error) {
    if (ctx->finished.load()) return;
    if (!ok) {
        Fail(ctx, "resolve: " + error);
        return;
    }
    StartConnect(ctx, addr);
}

void HttpsUpstreamDispatcher::StartConnect(const ContextPtr& ctx, const InetAddress& addr) {
    int sockfd = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, IPPROTO_TCP);
    if (sockfd < 0) {
        Fail(ctx, std::string("socket: ") + std::strerror(errno));
        return;
    }
    ctx->sockfd = sockfd;

    ctx->connChannel = std::make_shared<Channel>(ctx->loop, sockfd);
    ctx->connChannel->SetReadCallback([ctx](std::chrono::system_clock::time_point) { Drive(ctx); });
    ctx->connChannel->SetWriteCallback([ctx]() { Drive(ctx); });
    ctx->connChannel->SetCloseCallback([ctx]() { Drive(ctx); });
    ctx->connChannel->SetErrorCallback([ctx]() { Drive(ctx); });

    int ret = ::connect(sockfd, addr.getSockAddr(), sizeof(struct sockaddr_in));
    int savedErrno = (ret == 0) ? 0 : errno;
    if (ret == 0 || savedErrno == EISCONN) {
        ctx->state = State::kConnecting;
        Drive(ctx);
    } else if (savedErrno == EINPROGRESS) {
        ctx->state = State::kConnecting;
        WatchFor(ctx, false, true);
    } else {
        Fail(ctx, "connect " + addr.toIpPort() + ": " + std::strerror(savedErrno));
    }
}

void HttpsUpstreamDispatcher::WatchFor(const ContextPtr& ctx, bool read, bool write) {
    Channel* ch = ctx->connChannel.get();
    if (!ch) return;
    if (read != ch->IsReading()) {
        if (read) ch->EnableReading(); else ch->DisableReading();
    }
    if (write != ch->IsWriting()) {
        if (write) ch->EnableWriting(); else ch->DisableWriting();
    }
}

bool HttpsUpstreamDispatcher::StartTls(const ContextPtr& ctx) {
    SSL* ssl = SSL_new(reinterpret_cast<SSL_CTX*>(ctx->tls->ctx()));
    if (!ssl) {
        Fail(ctx, "SSL_new: " + vrcproxy::network::TlsContext::LastError());
        return false;
    }
    ctx->ssl = reinterpret_cast<ssl_st*>(ssl);
    SSL_set_fd(ssl, ctx->sockfd);
    // SNI is meaningless for an address literal.
    if (!InetAddress::FromIp(ctx->host, 0)) {
        SSL_set_tlsext_host_name(ssl, ctx->host.c_str());
    }
    if (ctx->verifyPeer && SSL_set1_host(ssl, ctx->host.c_str()) != 1) {
        Fail(ctx, "SSL_set1_host: " + vrcproxy::network::TlsContext::LastError());
        return false;
    }
    SSL_set_connect_state(ssl);
    return true;
}

void HttpsUpstreamDispatcher::Drive(const ContextPtr& ctx) {
    if (ctx->finished.load()) return;

    if (ctx->state == State::kConnecting) {
        int err = 0;
        socklen_t len = sizeof err;
        if (::getsockopt(ctx->sockfd, SOL_SOCKET, SO_ERROR, &err, &len) < 0) {
            err = errno;
        }
        if (err) {
            Fail(ctx, std::string("connect: ") + std::strerror(err));
            return;
        }
        if (ctx->useTls) {
            if (!StartTls(ctx)) return;
            ctx->state = State::kHandshaking;
        } else {
            ctx->state = State::kSending;
        }
    }

    if (ctx->state == State::kHandshaking && !DriveHandshake(ctx)) return;
    if (ctx->state == State::kSending && !DriveSend(ctx)) return;
    if (ctx->state == State::kReading) DriveRead(ctx);
}

bool HttpsUpstreamDispatcher::DriveHandshake(const ContextPtr& ctx) {
    SSL* ssl = reinterpret_cast<SSL*>(ctx->ssl);
    ERR_clear_error();
    const int r = SSL_connect(ssl);
    if (r == 1) {
        LOG_DEBUG << "upstream: TLS established with " << ctx->host << " (" << SSL_get_version(ssl) << ")";
        ctx->state = State::kSending;
        return true;
    }
    const int e = SSL_get_error(ssl, r);
    if (e == SSL_ERROR_WANT_READ) {
        WatchFor(ctx, true, false);
        return false;
    }
    if (e == SSL_ERROR_WANT_WRITE) {
        WatchFor(ctx, false, true);
        return false;
    }
    std::string why = vrcproxy::network::TlsContext::LastError();
    const long verify = SSL_get_verify_result(ssl);
    if (verify != X509_V_OK) {
        why += std::string(" (certificate: ") + X509_verify_cert_error_string(verify) + ")";
    }
    Fail(ctx, "TLS handshake: " + why);
    return false;
}

bool HttpsUpstreamDispatcher::DriveSend(const ContextPtr& ctx) {
    while (ctx->outOffset < ctx->out.size()) {
        const char* p = ctx->out.data() + ctx->outOffset;
        const size_t left = ctx->out.size() - ctx->outOffset;
        if (ctx->ssl) {
            SSL* ssl = reinterpret_cast<SSL*>(ctx->ssl);
            ERR_clear_error();
            const int n = SSL_write(ssl, p, static_cast<int>(left));
            if (n > 0) {
                ctx->outOffset += static_cast<size_t>(n);
                continue;
            }
            const int e = SSL_get_error(ssl, n);
            if (e == SSL_ERROR_WANT_WRITE) {
                WatchFor(ctx, false, true);
                return false;
            }
            if (e == SSL_ERROR_WANT_READ) {
                WatchFor(ctx, true, false);
                return false;
            }
            Fail(ctx, "SSL_write: " + vrcproxy::network::TlsContext::LastError());
            return false;
        }
        const ssize_t n = ::send(ctx->sockfd, p, left, MSG_NOSIGNAL);
        if (n > 0) {
            ctx->outOffset += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) {
            WatchFor(ctx, false, true);
            return false;
        }
        Fail(ctx, std::string("send: ") + std::strerror(errno));
        return false;
    }

    // Sent all.
    ctx->state = State::kReading;
    WatchFor(ctx, true, false);
    return true;
}

void HttpsUpstreamDispatcher::DriveRead(const ContextPtr& ctx) {
    char buf[16384];
    while (!ctx->finished.load()) {
        ssize_t n = 0;
        bool eof = false;
        if (ctx->ssl) {
            SSL* ssl = reinterpret_cast<SSL*>(ctx->ssl);
            ERR_clear_error();
            const int r = SSL_read(ssl, buf, sizeof buf);
            if (r > 0) {
                n = r;
            } else {
                const int e = SSL_get_error(ssl, r);
                if (e == SSL_ERROR_WANT_READ) {
                    WatchFor(ctx, true, false);
                    return;
                }
                if (e == SSL_ERROR_WANT_WRITE) {
                    WatchFor(ctx, false, true);
                    return;
                }
                if (e == SSL_ERROR_ZERO_RETURN) {
                    eof = true;
                } else if (e == SSL_ERROR_SYSCALL && ERR_peek_error() == 0 && (r == 0 || errno == 0)) {
                    // Peer closed without close_notify.
                    eof = true;
                } else {
                    Fail(ctx, "SSL_read: " + vrcproxy::network::TlsContext::LastError());
                    return;
                }
            }
        } else {
            n = ::recv(ctx->sockfd, buf, sizeof buf, 0);
            if (n == 0) {
                eof = true;
            } else if (n < 0) {
                if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
                    WatchFor(ctx, true, false);
                    return;
                }
                Fail(ctx, std::string("recv: ") + std::strerror(errno));
                return;
            }
        }

        if (eof) {
            if (ctx->response.finishOnClose()) {
                OnResponseComplete(ctx);
            } else {
                Fail(ctx, "malformed response: " + ctx->response.error());
            }
            return;
        }

        ctx->response.feed(buf, static_cast<size_t>(n));
        if (ctx->response.hasError()) {
            Fail(ctx, "malformed response: " + ctx->response.error());
            return;
        }
        if (ctx->response.gotAll()) {
            OnResponseComplete(ctx);
            return;
        }
    }
}

void HttpsUpstreamDispatcher::OnResponseComplete(const ContextPtr& ctx) {
    UpstreamResult result;
    if (!DecodeResponse(ctx->response, &result)) {
        Fail(ctx, result.error);
        return;
    }
    result.outcome = UpstreamResult::kOk;
    LOG_DEBUG << "upstream: " << ctx->url << " -> " << result.status << " ("
              << result.body.size() << " bytes, " << ElapsedMs(ctx->start) << " ms)";
    Finish(ctx, std::move(result));
}

void HttpsUpstreamDispatcher::OnTimeout(const ContextPtr& ctx) {
    uint64_t one;
    ssize_t n = ::read(ctx->timerfd, &one, sizeof one);
    (void)n;
    if (ctx->finished.load()) return;
    UpstreamResult result;
    result.outcome = UpstreamResult::kTimeout;
    result.error = "no response within " + std::to_string(ctx->timeoutMs) + " ms";
    LOG_WARN << "upstream: " << ctx->url << " timed out after " << ElapsedMs(ctx->start) << " ms";
    Finish(ctx, std::move(result));
}

void HttpsUpstreamDispatcher::Fail(const ContextPtr& ctx, const std::string& error) {
    UpstreamResult result;
    result.outcome = UpstreamResult::kFailure;
    result.error = error;
    LOG_WARN << "upstream: " << ctx->url << " failed: " << error;
    Finish(ctx, std::move(result));
}

void HttpsUpstreamDispatcher::Finish(const ContextPtr& ctx, UpstreamResult result) {
    if (!CleanUp(ctx)) return;
    DoneCallback done = std::move(ctx->done);
    ctx->done = nullptr;
    if (done) done(std::move(result));
}

bool HttpsUpstreamDispatcher::CleanUp(const ContextPtr& ctx) {
    if (ctx->finished.exchange(true)) return false;

    // Channel::HandleEvent may still be running on one of these channels, so the
    // callbacks (and the Channel objects they keep alive) are dropped on the next turn.
    for (std::shared_ptr<Channel>* slot : {&ctx->connChannel, &ctx->timerChannel}) {
        std::shared_ptr<Channel> ch = std::move(*slot);
        slot->reset();
        if (!ch) continue;
        ch->DisableAll();
        ch->Remove();
        ctx->loop->QueueInLoop([ch]() { ch->ClearCallbacks(); });
    }

    if (ctx->ssl) {
        SSL_free(reinterpret_cast<SSL*>(ctx->ssl));
        ctx->ssl = nullptr;
    }
    if (ctx->sockfd >= 0) {
        ::close(ctx->sockfd);
        ctx->sockfd = -1;
    }
    if (ctx->timerfd >= 0) {
        ::close(ctx->timerfd);
        ctx->timerfd = -1;
    }
    return true;
}

} // namespace upstream
} // namespace vrcproxy
