#pragma once

#include "vrcproxy/common/noncopyable.h"
#include "vrcproxy/network/InetAddress.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace vrcproxy {
namespace network {

class EventLoop;

// Runs blocking getaddrinfo(3) on its own loop thread so IO loops never stall on DNS.
// Answers are cached per host:port. A fresh entry is served straight away; an
// expired one is still served while a single refresh runs behind it, so a slow
// or failing DNS server only delays the first lookup of a name. Concurrent
// misses for the same name share one getaddrinfo call.
class Resolver : vrcproxy::common::noncopyable {
public:
    // ok == false carries the resolver's error text in `error`.
    using ResolveCallback =
        std::function<void(bool ok, const InetAddress& addr, const std::string& error)>;
    // Polled on the resolver thread; returning false drops the waiter, and a
    // lookup nobody waits for any more is skipped.
    using WantedPredicate = std::function<bool()>;

    explicit Resolver(EventLoop* resolverLoop,
                      std::chrono::seconds cacheTtl = std::chrono::seconds(60));
    ~Resolver();

    // The callback always runs later on `callerLoop`, never inline.
    void Resolve(EventLoop* callerLoop, const std::string& host, uint16_t port,
                 ResolveCallback cb, WantedPredicate wanted = WantedPredicate());

    // Fails every later Resolve and drops answers still in flight. Call it
    // before the caller loops go away.
    void Shutdown();

    // Cached address for host:port, fresh or not.
    bool Cached(const std::string& host, uint16_t port, InetAddress* out) const;

    // Blocking lookup, first IPv4 address only.
    static bool ResolveBlocking(const std::string& host, uint16_t port,
                                InetAddress* out, std::string* error);

private:
    struct Waiter {
        EventLoop* loop;
        ResolveCallback cb;
        WantedPredicate wanted;
    };
    struct Lookup {
        std::vector<Waiter> waiters;
        bool refresh{false};
    };
    struct CacheEntry {
        InetAddress addr;
        std::chrono::steady_clock::time_point expires;
    };
    // Outlives the Resolver inside functors still queued on the resolver loop.
    struct State {
        std::mutex mutex;
        bool stopped{false};
        std::chrono::seconds ttl;
        std::map<std::string, CacheEntry> cache;
        std::map<std::string, Lookup> inflight;
    };

    static void RunLookup(const std::shared_ptr<State>& state, const std::string& host,
                          uint16_t port, const std::string& key);

    EventLoop* resolverLoop_;
    std::shared_ptr<State> state_;
};

} // namespace network
} // namespace vrcproxy
