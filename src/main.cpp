#include "vrcproxy/common/Config.h"
#include "vrcproxy/common/Logger.h"
#include "vrcproxy/network/Channel.h"
#include "vrcproxy/network/EventLoop.h"
#include "vrcproxy/network/EventLoopThread.h"
#include "vrcproxy/network/InetAddress.h"
#include "vrcproxy/network/Resolver.h"
#include "vrcproxy/network/TlsContext.h"
#include "vrcproxy/pipeline/Notice.h"
#include "vrcproxy/pipeline/RequestPipeline.h"
#include "vrcproxy/protocol/HttpRequest.h"
#include "vrcproxy/protocol/HttpServer.h"
#include "vrcproxy/upstream/HttpsUpstreamDispatcher.h"
#include "vrcproxy/upstream/UpstreamConfig.h"

#include <getopt.h>
#include <pthread.h>
#include <signal.h>
#include <sys/signalfd.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>

namespace {

// PORT from the environment wins over [global] listen_port.
bool ResolveListenPort(const vrcproxy::common::Config& conf, uint16_t* port) {
    long value = conf.GetInt("global", "listen_port", 3000);
    const char* env = std::getenv("PORT");
    if (env && *env) {
        char* end = nullptr;
        errno = 0;
        value = std::strtol(env, &end, 10);
        if (errno != 0 || *end != '\0') {
            LOG_ERROR << "PORT is not a number: " << env;
            return false;
        }
    }
    if (value <= 0 || value > 65535) {
        LOG_ERROR << "listen port out of range: " << value;
        return false;
    }
    *port = static_cast<uint16_t>(value);
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace vrcproxy;

    std::string configFile = "config/vrcproxy.conf";
    bool checkOnly = false;
    int ch;
    while ((ch = getopt(argc, argv, "c:hC")) != -1) {
        switch (ch) {
            case 'c':
                configFile = optarg;
                break;
            case 'C':
                checkOnly = true;
                break;
            case 'h':
            default:
                printf("Usage: %s [-c config_file] [-C]\n", argv[0]);
                printf("  -C  check config and exit\n");
                return ch == 'h' ? 0 : 1;
        }
    }

    auto& conf = common::Config::Instance();
    if (!conf.Load(configFile)) {
        LOG_WARN << "Failed to load config " << configFile << ", using defaults.";
    }
    common::Logger::Instance().SetLevel(common::Logger::ParseLevel(conf.GetString("global", "log_level", "INFO")));

    upstream::UpstreamConfig upstreamConfig;
    std::string error;
    if (!upstream::UpstreamConfig::FromConfig(conf, &upstreamConfig, &error)) {
        LOG_ERROR << "Invalid [upstream] config: " << error;
        return 1;
    }
    uint16_t port = 0;
    if (!ResolveListenPort(conf, &port)) {
        return 1;
    }
    int threads = conf.GetInt("global", "threads", 4);
    if (threads < 0) {
        LOG_WARN << "global.threads is negative, serving from the accept loop only";
        threads = 0;
    }
    const pipeline::Notice notice = pipeline::Notice::FromConfig(conf);
    const std::string publicOrigin = conf.GetString("server", "public_origin", "");

    std::shared_ptr<network::TlsContext> tls;
    if (upstreamConfig.useTls()) {
        tls = std::make_shared<network::TlsContext>();
        if (!tls->InitClient(upstreamConfig.verifyPeer, upstreamConfig.caFile)) {
            LOG_ERROR << "Cannot set up TLS for the upstream connection";
            return 1;
        }
    }

    if (checkOnly) {
        printf("OK\n");
        return 0;
    }

    ::signal(SIGPIPE, SIG_IGN);
    // Blocked before any thread starts so every thread inherits the mask and
    // SIGINT/SIGTERM are only seen through the signalfd below.
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    const bool signalsBlocked = ::pthread_sigmask(SIG_BLOCK, &mask, nullptr) == 0;

    network::EventLoopThread resolverThread("resolver");
    network::Resolver resolver(resolverThread.StartLoop(),
                               std::chrono::seconds(upstreamConfig.dnsCacheSeconds));

    auto dispatcher = std::make_shared<upstream::HttpsUpstreamDispatcher>(upstreamConfig, &resolver, tls);
    pipeline::RequestPipeline requestPipeline(notice, upstreamConfig, dispatcher, publicOrigin);

    network::EventLoop loop;
    protocol::HttpServer server(&loop, network::InetAddress(port), "vrcproxy");
    server.setThreadNum(threads);
    server.setHttpCallback([&requestPipeline](const protocol::HttpRequest& req,
                                              protocol::HttpServer::Responder respond) {
        requestPipeline.Handle(network::EventLoop::GetEventLoopOfCurrentThread(), req, std::move(respond));
    });

    std::unique_ptr<network::Channel> signalChannel;
    int sfd = -1;
    if (signalsBlocked &&
        (sfd = ::signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC)) >= 0) {
        signalChannel = std::make_unique<network::Channel>(&loop, sfd);
        signalChannel->SetReadCallback([&loop, sfd](std::chrono::system_clock::time_point) {
            struct signalfd_siginfo info;
            ssize_t n = ::read(sfd, &info, sizeof info);
            if (n == static_cast<ssize_t>(sizeof info)) {
                LOG_INFO << "Received signal " << info.ssi_signo << ", shutting down";
            }
            loop.Quit();
        });
        signalChannel->EnableReading();
    } else {
        LOG_WARN << "signalfd unavailable: " << std::strerror(errno);
    }

    const bool started = server.start();
    if (started) {
        LOG_INFO << "vrcproxy forwarding to " << upstreamConfig.scheme << "://" << upstreamConfig.host
                 << ":" << upstreamConfig.port << upstreamConfig.apiPrefix
                 << " (timeout " << upstreamConfig.timeoutMs << " ms)";
        loop.Loop();
    }
    // The IO loops are torn down with `server`; no lookup may post to them after that.
    resolver.Shutdown();
    resolverThread.Stop();

    if (signalChannel) {
        signalChannel->DisableAll();
        signalChannel->Remove();
        ::close(sfd);
    }
    return started ? 0 : 1;
}
