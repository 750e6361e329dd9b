#include "vrcproxy/protocol/HttpServer.h"
#include "vrcproxy/protocol/HttpRequest.h"
#include "vrcproxy/protocol/HttpResponse.h"
#include "vrcproxy/network/EventLoop.h"
#include "vrcproxy/network/InetAddress.h"
#include "vrcproxy/common/Logger.h"

#include <arpa/inet.h>
#include <dirent.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cassert>
#include <chrono>
#include <cstring>
#include <string>
#include <thread>
#include <vector>

using namespace vrcproxy::protocol;
using namespace vrcproxy::network;
using namespace vrcproxy::common;

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
    ssize_t n = ::send(fd, data.data(), data.size(), 0);
    assert(n == static_cast<ssize_t>(data.size()));
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

static size_t countOf(const std::string& haystack, const std::string& needle) {
    size_t n = 0;
    for (size_t pos = haystack.find(needle); pos != std::string::npos; pos = haystack.find(needle, pos + 1)) {
        ++n;
    }
    return n;
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

// Waits for the server side to finish closing what the client already closed.
static bool settlesAt(int baseline) {
    for (int i = 0; i < 100; ++i) {
        if (countOpenFds() <= baseline) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return false;
}

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);

    EventLoop loop;
    HttpServer server(&loop, InetAddress(0, true), "TestHttpServer");
    std::vector<std::thread> lateResponders;

    server.setHttpCallback([&](const HttpRequest& req, HttpServer::Responder respond) {
        LOG_INFO << "HttpServer - Request: " << req.method() << " " << req.path();

        HttpResponse resp;
        resp.setStatusCode(HttpResponse::k200Ok);
        resp.setContentType("text/plain");
        if (req.path() == "/slow") {
            // Answered from another thread after the next request is already buffered.
            lateResponders.emplace_back([respond]() {
                std::this_thread::sleep_for(std::chrono::milliseconds(150));
                HttpResponse late;
                late.setStatusCode(HttpResponse::k200Ok);
                late.setContentType("text/plain");
                late.setBody("slow body");
                respond(std::move(late));
                // A second call is ignored.
                respond(HttpResponse());
            });
            return;
        }
        if (req.path() == "/fast") {
            resp.setBody("fast body");
        } else if (req.path() == "/method") {
            resp.setBody("method=" + req.method());
        } else if (req.path() == "/quit") {
            resp.setBody("Server Quitting...");
            loop.QueueInLoop([&]() { loop.Quit(); });
        } else {
            resp.setStatusCode(HttpResponse::k404NotFound);
            resp.setBody("");
        }
        respond(std::move(resp));
    });
    assert(server.start());
    const uint16_t port = server.listenAddress().toPort();
    assert(port != 0);

    std::thread client([&]() {
        // Pipelined: /fast must not overtake /slow.
        {
            int fd = connectTo(port);
            sendAll(fd,
                    "GET /slow HTTP/1.1\r\nHost: test\r\n\r\n"
                    "GET /fast HTTP/1.1\r\nHost: test\r\n\r\n"
                    "DELETE /method HTTP/1.1\r\nHost: test\r\nConnection: close\r\n\r\n");
            std::string resp = recvUntilClose(fd);
            ::close(fd);
            const size_t slow = resp.find("slow body");
            const size_t fast = resp.find("fast body");
            const size_t method = resp.find("method=DELETE");
            assert(slow != std::string::npos && fast != std::string::npos && method != std::string::npos);
            assert(slow < fast && fast < method);
            assert(countOf(resp, "HTTP/1.1 200 OK\r\n") == 3);
            assert(countOf(resp, "Connection: keep-alive\r\n") == 2);
            assert(countOf(resp, "Connection: close\r\n") == 1);
            LOG_INFO << "Pipelined Ordering PASS";
        }

        // HTTP/1.0 without keep-alive closes after one response.
        {
            int fd = connectTo(port);
            sendAll(fd, "GET /fast HTTP/1.0\r\n\r\n");
            std::string resp = recvUntilClose(fd);
            ::close(fd);
            assert(resp.find("fast body") != std::string::npos);
            assert(resp.find("Connection: close\r\n") != std::string::npos);
            LOG_INFO << "HTTP/1.0 Close PASS";
        }

        // Malformed request line.
        {
            int fd = connectTo(port);
            sendAll(fd, "THIS IS NOT HTTP\r\n\r\n");
            std::string resp = recvUntilClose(fd);
            ::close(fd);
            assert(resp.rfind("HTTP/1.1 400 Bad Request\r\n", 0) == 0);
            assert(resp.find("Connection: close\r\n") != std::string::npos);
            LOG_INFO << "Malformed Request PASS";
        }

        // Body larger than the limit is refused up front, without reading it.
        {
            int fd = connectTo(port);
            sendAll(fd, "POST /fast HTTP/1.1\r\nHost: test\r\nContent-Length: 50000000\r\n\r\n");
            std::string resp = recvUntilClose(fd);
            ::close(fd);
            assert(resp.rfind("HTTP/1.1 413 Payload Too Large\r\n", 0) == 0);
            assert(resp.find("Connection: close\r\n") != std::string::npos);
            LOG_INFO << "Oversized Request Body PASS";
        }

        // Connections answered in close mode are released once the client hangs up.
        {
            const int baseline = countOpenFds();
            for (int i = 0; i < 30; ++i) {
                int fd = connectTo(port);
                if (i % 3 == 0) {
                    sendAll(fd, "GET /fast HTTP/1.0\r\n\r\n");
                } else if (i % 3 == 1) {
                    sendAll(fd, "GET /fast HTTP/1.1\r\nHost: test\r\nConnection: close\r\n\r\n");
                } else {
                    sendAll(fd, "NOT HTTP AT ALL\r\n\r\n");
                }
                std::string resp = recvUntilClose(fd);
                ::close(fd);
                assert(resp.find("Connection: close\r\n") != std::string::npos);
            }
            assert(settlesAt(baseline));
            LOG_INFO << "Close Mode Releases Connections PASS";
        }

        // Client that disconnects before a late answer does not disturb the server.
        {
            int fd = connectTo(port);
            sendAll(fd, "GET /slow HTTP/1.1\r\nHost: test\r\n\r\n");
            ::close(fd);
            std::this_thread::sleep_for(std::chrono::milliseconds(300));
        }

        int fd = connectTo(port);
        sendAll(fd, "GET /quit HTTP/1.1\r\nHost: test\r\nConnection: close\r\n\r\n");
        std::string resp = recvUntilClose(fd);
        ::close(fd);
        assert(resp.find("Server Quitting...") != std::string::npos);
    });

    loop.Loop();
    client.join();
    for (auto& t : lateResponders) {
        t.join();
    }
    return 0;
}
