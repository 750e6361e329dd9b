#pragma once

#include "vrcproxy/common/noncopyable.h"
#include "vrcproxy/network/InetAddress.h"
#include "vrcproxy/protocol/HttpResponseContext.h"
#include "vrcproxy/upstream/UpstreamConfig.h"
#include "vrcproxy/upstream/UpstreamDispatcher.h"

#include <atomic>
#include <chrono>
#include <memory>
#include <string>

struct ssl_st;

namespace vrcproxy {
namespace network {
class Channel;
class Resolver;
class TlsContext;
}

namespace upstream {

// One connection per request: resolve, connect, TLS handshake, write, read until the
// response is complete, all non-blocking on the caller's loop under a timerfd deadline.
class HttpsUpstreamDispatcher : public UpstreamDispatcher,
                                vrcproxy::common::noncopyable {
public:
    // `tls` may be null only when config.scheme is "http".
    HttpsUpstreamDispatcher(const UpstreamConfig& config,
                            vrcproxy::network::Resolver* resolver,
                            std::shared_ptr<vrcproxy::network::TlsContext> tls);

    void Dispatch(vrcproxy::network::EventLoop* loop,
                  const UpstreamRequest& request,
                  DoneCallback done) override;

    // Serializes the outbound HTTP/1.1 request head.
    static std::string BuildRequest(const UpstreamRequest& request);

    // Strips framing and content-coding, then decodes the body to identity.
    // False when the content coding is unknown or the body does not decode.
    static bool DecodeResponse(vrcproxy::protocol::HttpResponseContext& response,
                               UpstreamResult* result);

private:
    enum class State { kResolving, kConnecting, kHandshaking, kSending, kReading };

    struct DispatchContext {
        vrcproxy::network::EventLoop* loop{nullptr};
        State state{State::kResolving};
        std::string host;
        bool useTls{false};
        bool verifyPeer{true};
        int timeoutMs{0};
        std::shared_ptr<vrcproxy::network::TlsContext> tls;

        int sockfd{-1};
        int timerfd{-1};
        ssl_st* ssl{nullptr};
        std::shared_ptr<vrcproxy::network::Channel> connChannel;
        std::shared_ptr<vrcproxy::network::Channel> timerChannel;

        std::string url;
        std::string out;
        size_t outOffset{0};
        vrcproxy::protocol::HttpResponseContext response;

        DoneCallback done;
        std::atomic<bool> finished{false};
        std::chrono::steady_clock::time_point start;
    };
    using ContextPtr = std::shared_ptr<DispatchContext>;

    static void OnResolved(const ContextPtr& ctx, bool ok,
                           const vrcproxy::network::InetAddress& addr, const std::string& error);
    static void StartConnect(const ContextPtr& ctx, const vrcproxy::network::InetAddress& addr);
    static bool StartTls(const ContextPtr& ctx);
    static void Drive(const ContextPtr& ctx);
    static bool DriveHandshake(const ContextPtr& ctx);
    static bool DriveSend(const ContextPtr& ctx);
    static void DriveRead(const ContextPtr& ctx);
    static void WatchFor(const ContextPtr& ctx, bool read, bool write);
    static void OnTimeout(const ContextPtr& ctx);
    static void OnResponseComplete(const ContextPtr& ctx);
    static void Fail(const ContextPtr& ctx, const std::string& error);
    static void Finish(const ContextPtr& ctx, UpstreamResult result);
    static bool CleanUp(const ContextPtr& ctx);

    UpstreamConfig config_;
    vrcproxy::network::Resolver* resolver_;
    std::shared_ptr<vrcproxy::network::TlsContext> tls_;
};

} // namespace upstream
} // namespace vrcproxy
