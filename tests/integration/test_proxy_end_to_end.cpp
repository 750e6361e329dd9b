#include "vrcproxy/pipeline/RequestPipeline.h"
#include "vrcproxy/protocol/Compression.h"
#include "vrcproxy/protocol/HttpRequest.h"
#include "vrcproxy/protocol/HttpServer.h"
#include "vrcproxy/network/EventLoop.h"
#include "vrcproxy/network/EventLoopThread.h"
#include "vrcproxy/network/InetAddress.h"
#include "vrcproxy/network/Resolver.h"
#include "vrcproxy/upstream/HttpsUpstreamDispatcher.h"
#include "vrcproxy/common/Logger.h"

#include <arpa/inet.h>
#include <dirent.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <cassert>
#include <chrono>
#include <cstring>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace vrcproxy::pipeline;
using namespace vrcproxy::protocol;
using namespace vrcproxy::network;
using namespace vrcproxy::upstream;
using namespace vrcproxy::common;
using json = nlohmann::ordered_json;

static int connectTo(uint16_t port) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    assert(fd >= 0);

    sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    assert(::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr) == 1);

    int ret = ::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    assert(ret == 0);
    return fd;
}

static void sendAll(int fd, const std::string& data) {
    size_t off = 0;
    while (off < data.size()) {
        ssize_t n = ::send(fd, data.data() + off, data.size() - off, MSG_NOSIGNAL);
        assert(n > 0);
        off += static_cast<size_t>(n);
    }
}

static std::string recvUntilClose(int fd, int timeoutMs = 3000) {
    std::string out;
    pollfd pfd;
    pfd.fd = fd;
    pfd.events = POLLIN | POLLHUP | POLLERR;
    while (true) {
        int pret = ::poll(&pfd, 1, timeoutMs);
        assert(pret == 1);
        char buf[4096];
        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n > 0) {
            out.append(buf, buf + n);
            continue;
        }
        break;
    }
    return out;
}

static std::string bodyOf(const std::string& response) {
    const size_t pos = response.find("\r\n\r\n");
    assert(pos != std::string::npos);
    return response.substr(pos + 4);
}

static int countOpenFds() {
    DIR* dir = ::opendir("/proc/self/fd");
    assert(dir != nullptr);
    int n = 0;
    while (::readdir(dir) != nullptr) {
        ++n;
    }
    ::closedir(dir);
    return n;
}

template <typename Pred>
static bool eventually(Pred pred, int timeoutMs = 1000) {
    for (int waited = 0; waited < timeoutMs; waited += 10) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return pred();
}

// Blocking single-threaded stand-in for the API: one request per connection.
class FakeUpstream {
public:
    FakeUpstream() {
        listenFd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        assert(listenFd_ >= 0);
        int one = 1;
        ::setsockopt(listenFd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
        sockaddr_in addr;
        std::memset(&addr, 0, sizeof(addr));
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = htons(0);
        assert(::bind(listenFd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
        assert(::listen(listenFd_, 16) == 0);
        socklen_t len = sizeof(addr);
        assert(::getsockname(listenFd_, reinterpret_cast<sockaddr*>(&addr), &len) == 0);
        port_ = ntohs(addr.sin_port);
        thread_ = std::thread([this]() { Run(); });
    }

    ~FakeUpstream() {
        stop_ = true;
        thread_.join();
        ::close(listenFd_);
    }

    uint16_t port() const { return port_; }

    std::vector<std::string> heads() {
        std::lock_guard<std::mutex> lock(mutex_);
        return heads_;
    }

    // How the last /slow exchange ended: 1 when the proxy hung up, 2 when
    // the fake itself gave up waiting.
    int slowOutcome() const { return slowOutcome_.load(); }

private:
    void Run() {
        while (!stop_) {
            pollfd pfd;
            pfd.fd = listenFd_;
            pfd.events = POLLIN;
            if (::poll(&pfd, 1, 50) != 1) continue;
            int fd = ::accept(listenFd_, nullptr, nullptr);
            if (fd < 0) continue;
            Serve(fd);
            ::close(fd);
        }
    }

    void Serve(int fd) {
        std::string head;
        char buf[4096];
        while (head.find("\r\n\r\n") == std::string::npos) {
            ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
            if (n <= 0) return;
            head.append(buf, buf + n);
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            heads_.push_back(head);
        }

        const std::string target = head.substr(4, head.find(' ', 4) - 4);
        if (target == "/api/1/1/config") {
            std::string packed;
            assert(Compression::Compress(Compression::Encoding::kGzip,
                                         std::string(R"({"clientApiKey":"JlE5Jldo5Jibnk5O5hTx6XVqsJu4WJ26"})"), &packed));
            sendAll(fd, "HTTP/1.1 200 OK\r\n"
                        "Content-Type: application/json; charset=utf-8\r\n"
                        "Content-Encoding: gzip\r\n"
                        "Content-Length: " + std::to_string(packed.size()) + "\r\n"
                        "Set-Cookie: a=1\r\n"
                        "Set-Cookie: b=2\r\n"
                        "\r\n" + packed);
        } else if (target == "/api/1/avatars?n=2") {
            sendAll(fd, "HTTP/1.1 200 OK\r\n"
                        "Content-Type: application/json\r\n"
                        "Transfer-Encoding: chunked\r\n"
                        "\r\n"
                        "6\r\n[\"a\",\"\r\n"
                        "4\r\nb\"]\n\r\n"
                        "0\r\n\r\n");
        } else if (target == "/api/1/file.txt") {
            sendAll(fd, "HTTP/1.0 200 OK\r\nContent-Type: text/plain\r\n\r\nraw bytes until close");
        } else if (target == "/api/1/broken") {
            sendAll(fd, "HTTP/1.1 200 OK\r\nContent-Type: application/json\r\nContent-Length: 7\r\n\r\n{\"a\":[1");
        } else if (target == "/api/1/slow") {
            // Say nothing until the proxy gives up and hangs up.
            slowOutcome_ = 0;
            pollfd pfd;
            pfd.fd = fd;
            pfd.events = POLLIN;
            while (true) {
                if (::poll(&pfd, 1, 2000) != 1) {
                    slowOutcome_ = 2;
                    break;
                }
                if (::recv(fd, buf, sizeof(buf), 0) <= 0) {
                    slowOutcome_ = 1;
                    break;
                }
            }
        } else {
            sendAll(fd, "HTTP/1.1 404 Not Found\r\nContent-Type: application/json\r\nContent-Length: 2\r\n\r\n{}");
        }
    }

    int listenFd_{-1};
    uint16_t port_{0};
    std::atomic<bool> stop_{false};
    std::atomic<int> slowOutcome_{0};
    std::thread thread_;
    std::mutex mutex_;
    std::vector<std::string> heads_;
};

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);

    FakeUpstream api;

    UpstreamConfig upstream;
    upstream.scheme = "http";
    upstream.host = "127.0.0.1";
    upstream.port = api.port();
    upstream.timeoutMs = 300;

    EventLoopThread resolverThread("resolver");
    Resolver resolver(resolverThread.StartLoop());
    auto dispatcher = std::make_shared<HttpsUpstreamDispatcher>(upstream, &resolver, nullptr);
    RequestPipeline pipeline(Notice::Default(), upstream, dispatcher);

    EventLoop loop;
    HttpServer server(&loop, InetAddress(0, true), "TestProxy");
    server.setThreadNum(2);
    server.setHttpCallback([&pipeline](const HttpRequest& req, HttpServer::Responder respond) {
        pipeline.Handle(EventLoop::GetEventLoopOfCurrentThread(), req, std::move(respond));
    });
    assert(server.start());
    const uint16_t port = server.listenAddress().toPort();

    std::thread client([&]() {
        // Gzip upstream body is decoded, merged and re-framed.
        {
            int fd = connectTo(port);
            sendAll(fd, "GET /1/config HTTP/1.1\r\n"
                        "Host: localhost\r\n"
                        "Referer: https://example.com/page\r\n"
                        "Connection: close\r\n\r\n");
            std::string resp = recvUntilClose(fd);
            ::close(fd);
            assert(resp.rfind("HTTP/1.1 200 OK\r\n", 0) == 0);
            assert(resp.find("Content-Encoding") == std::string::npos);
            assert(resp.find("Set-Cookie: a=1\r\nSet-Cookie: b=2\r\n") != std::string::npos);
            json body = json::parse(bodyOf(resp));
            assert(body.begin().key() == "_readme");
            assert(body["clientApiKey"] == "JlE5Jldo5Jibnk5O5hTx6XVqsJu4WJ26");
            LOG_INFO << "Gzip Config PASS";
        }

        // What the upstream actually saw.
        {
            std::vector<std::string> heads = api.heads();
            assert(heads.size() == 1);
            const std::string& head = heads[0];
            assert(head.rfind("GET /api/1/1/config HTTP/1.1\r\n", 0) == 0);
            assert(head.find("Host: 127.0.0.1:" + std::to_string(api.port()) + "\r\n") != std::string::npos);
            assert(head.find("Referer") == std::string::npos);
            assert(head.find("localhost") == std::string::npos);
            assert(head.find("Accept-Encoding: gzip, deflate\r\n") != std::string::npos);
            assert(head.find("Connection: close\r\n") != std::string::npos);
            LOG_INFO << "Forwarded Head PASS";
        }

        // Keep-alive: chunked array, passthrough text and the root document on one connection.
        {
            int fd = connectTo(port);
            sendAll(fd, "GET /avatars?n=2 HTTP/1.1\r\nHost: localhost:3000\r\n\r\n"
                        "GET /file.txt HTTP/1.1\r\nHost: localhost:3000\r\n\r\n"
                        "GET / HTTP/1.1\r\nHost: localhost:3000\r\nConnection: close\r\n\r\n");
            std::string resp = recvUntilClose(fd);
            ::close(fd);
            const size_t avatars = resp.find("\"1\": \"b\"");
            const size_t text = resp.find("raw bytes until close");
            const size_t root = resp.find("\"example\":\"http://localhost:3000/1/config\"");
            assert(avatars != std::string::npos);
            assert(text != std::string::npos);
            assert(root != std::string::npos);
            assert(avatars < text && text < root);
            LOG_INFO << "Keep-Alive Ordering PASS";
        }

        // Rejected locally; the upstream never hears about it.
        {
            const size_t before = api.heads().size();
            int fd = connectTo(port);
            sendAll(fd, "POST /1/config HTTP/1.1\r\nHost: localhost\r\nContent-Length: 2\r\nConnection: close\r\n\r\n{}");
            std::string resp = recvUntilClose(fd);
            ::close(fd);
            assert(resp.rfind("HTTP/1.1 405 Method Not Allowed\r\n", 0) == 0);
            assert(json::parse(bodyOf(resp))["error"]["status_code"] == 405);

            fd = connectTo(port);
            sendAll(fd, "GET /1/auth/user HTTP/1.1\r\nAuthorization: Basic eDp5\r\nConnection: close\r\n\r\n");
            resp = recvUntilClose(fd);
            ::close(fd);
            assert(resp.rfind("HTTP/1.1 400 Bad Request\r\n", 0) == 0);
            assert(api.heads().size() == before);
            LOG_INFO << "Local Rejection PASS";
        }

        // Unparsable JSON from upstream.
        {
            int fd = connectTo(port);
            sendAll(fd, "GET /broken HTTP/1.1\r\nConnection: close\r\n\r\n");
            std::string resp = recvUntilClose(fd);
            ::close(fd);
            assert(resp.rfind("HTTP/1.1 500 ", 0) == 0);
            LOG_INFO << "Malformed Upstream PASS";
        }

        // Silent upstream hits the deadline; the proxy drops its upstream socket
        // and leaves no descriptor behind.
        {
            const int baseline = countOpenFds();
            const auto start = std::chrono::steady_clock::now();
            int fd = connectTo(port);
            sendAll(fd, "GET /slow HTTP/1.1\r\nConnection: close\r\n\r\n");
            std::string resp = recvUntilClose(fd);
            ::close(fd);
            const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start).count();
            assert(resp.rfind("HTTP/1.1 504 Gateway Timeout\r\n", 0) == 0);
            assert(json::parse(bodyOf(resp))["error"]["_comment"] == "The request timed out.");
            assert(ms >= 250 && ms < 2000);
            assert(eventually([&]() { return api.slowOutcome() != 0; }));
            assert(api.slowOutcome() == 1);
            assert(eventually([&]() { return countOpenFds() <= baseline; }));
            LOG_INFO << "Deadline PASS";
        }

        loop.Quit();
    });

    loop.Loop();
    client.join();
    resolver.Shutdown();
    resolverThread.Stop();
    return 0;
}
