#include "vrcproxy/network/EventLoop.h"
#include "vrcproxy/network/EventLoopThread.h"
#include "vrcproxy/network/Resolver.h"
#include "vrcproxy/common/Logger.h"
#include <atomic>
#include <cassert>
#include <chrono>
#include <thread>

using namespace vrcproxy::network;
using namespace vrcproxy::common;

void testQuitFromOtherThread() {
    EventLoop loop;
    assert(EventLoop::GetEventLoopOfCurrentThread() == &loop);

    int ranInline = 0;
    loop.RunInLoop([&]() { ++ranInline; });
    assert(ranInline == 1);

    std::thread t([&loop]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        LOG_INFO << "Quitting main loop from thread";
        loop.Quit();
    });
    loop.Loop();
    t.join();
    LOG_INFO << "Quit From Thread PASS";
}

void testQueueAcrossThreads() {
    EventLoopThread worker("worker");
    EventLoop* ioLoop = worker.StartLoop();
    assert(ioLoop != nullptr);
    assert(!ioLoop->IsInLoopThread());

    EventLoop loop;
    std::atomic<int> hops{0};
    ioLoop->RunInLoop([&]() {
        assert(ioLoop->IsInLoopThread());
        ++hops;
        loop.QueueInLoop([&]() {
            assert(loop.IsInLoopThread());
            ++hops;
            loop.Quit();
        });
    });
    loop.Loop();
    assert(hops.load() == 2);
    LOG_INFO << "Queue Across Threads PASS";
}

void testResolverLiteralIsDeferred() {
    EventLoopThread resolverThread("resolver");
    Resolver resolver(resolverThread.StartLoop());

    EventLoop loop;
    bool called = false;
    resolver.Resolve(&loop, "127.0.0.1", 8443,
                     [&](bool ok, const InetAddress& addr, const std::string& error) {
                         assert(ok);
                         assert(error.empty());
                         assert(addr.toIpPort() == "127.0.0.1:8443");
                         assert(loop.IsInLoopThread());
                         called = true;
                         loop.Quit();
                     });
    // Never inline, even for an address literal.
    assert(!called);
    loop.WakeUp();
    loop.Loop();
    assert(called);

    InetAddress out;
    std::string error;
    assert(Resolver::ResolveBlocking("10.1.2.3", 80, &out, &error));
    assert(out.toIp() == "10.1.2.3");
    assert(!InetAddress::FromIp("api.vrchat.cloud", 443));
    LOG_INFO << "Resolver PASS";
}

// Runs a fresh loop until a callback started by `start` quits it.
template <typename Fn>
static void runLoopOnce(Fn start) {
    EventLoop loop;
    start(&loop);
    loop.WakeUp();
    loop.Loop();
}

void testResolverServesStaleWhileRefreshing() {
    EventLoopThread resolverThread("resolver");
    EventLoop* resolverLoop = resolverThread.StartLoop();
    // Zero TTL: every cached answer is already due for a refresh.
    Resolver resolver(resolverLoop, std::chrono::seconds(0));

    bool firstOk = false;
    runLoopOnce([&](EventLoop* loop) {
        resolver.Resolve(loop, "localhost", 8080,
                         [&, loop](bool ok, const InetAddress& addr, const std::string&) {
                             firstOk = ok && addr.toIp() == "127.0.0.1";
                             loop->Quit();
                         });
    });
    assert(firstOk);
    InetAddress cached;
    assert(resolver.Cached("localhost", 8080, &cached));
    assert(cached.toIpPort() == "127.0.0.1:8080");

    // Keep the resolver thread busy; the stale entry must not wait for it.
    resolverLoop->QueueInLoop([]() { std::this_thread::sleep_for(std::chrono::milliseconds(500)); });
    const auto start = std::chrono::steady_clock::now();
    bool secondOk = false;
    runLoopOnce([&](EventLoop* loop) {
        resolver.Resolve(loop, "localhost", 8080,
                         [&, loop](bool ok, const InetAddress& addr, const std::string&) {
                             secondOk = ok && addr.toIpPort() == "127.0.0.1:8080";
                             loop->Quit();
                         });
    });
    const auto waited = std::chrono::steady_clock::now() - start;
    assert(secondOk);
    assert(waited < std::chrono::milliseconds(300));
    LOG_INFO << "Resolver Stale Cache PASS";
}

void testResolverSkipsUnwantedLookup() {
    EventLoopThread resolverThread("resolver");
    EventLoop* resolverLoop = resolverThread.StartLoop();
    Resolver resolver(resolverLoop);

    std::atomic<bool> wanted{true};
    bool called = false;
    runLoopOnce([&](EventLoop* loop) {
        resolverLoop->QueueInLoop([]() { std::this_thread::sleep_for(std::chrono::milliseconds(100)); });
        resolver.Resolve(loop, "localhost", 8081,
                         [&](bool, const InetAddress&, const std::string&) { called = true; },
                         [&]() { return wanted.load(); });
        // The caller gave up (deadline hit) before the lookup got its turn.
        wanted = false;
        resolverLoop->QueueInLoop([loop]() { loop->QueueInLoop([loop]() { loop->Quit(); }); });
    });
    assert(!called);
    InetAddress out;
    assert(!resolver.Cached("localhost", 8081, &out));
    LOG_INFO << "Resolver Skips Unwanted PASS";
}

void testResolverShutdown() {
    EventLoopThread resolverThread("resolver");
    Resolver resolver(resolverThread.StartLoop());
    resolver.Shutdown();

    bool failed = false;
    runLoopOnce([&](EventLoop* loop) {
        resolver.Resolve(loop, "localhost", 8082,
                         [&, loop](bool ok, const InetAddress&, const std::string& error) {
                             failed = !ok && error == "resolver stopped";
                             loop->Quit();
                         });
    });
    assert(failed);
    LOG_INFO << "Resolver Shutdown PASS";
}

void testEventLoopThreadStop() {
    EventLoopThread worker("worker");
    EventLoop* ioLoop = worker.StartLoop();
    std::atomic<int> ran{0};
    ioLoop->RunInLoop([&]() { ++ran; });
    while (ran.load() == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    worker.Stop();
    // Idempotent; the destructor calls it again.
    worker.Stop();
    LOG_INFO << "EventLoopThread Stop PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);
    testQuitFromOtherThread();
    testQueueAcrossThreads();
    testResolverLiteralIsDeferred();
    testResolverServesStaleWhileRefreshing();
    testResolverSkipsUnwantedLookup();
    testResolverShutdown();
    testEventLoopThreadStop();
    return 0;
}
