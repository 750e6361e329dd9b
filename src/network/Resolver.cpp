#include "vrcproxy/network/Resolver.h"
#include "vrcproxy/network/EventLoop.h"
#include "vrcproxy/common/Logger.h"

#include <netdb.h>
#include <sys/socket.h>
#include <cstring>

namespace vrcproxy {
namespace network {

bool Resolver::ResolveBlocking(const std::string& host, uint16_t port,
                               InetAddress* out, std::string* error) {
    if (auto literal = InetAddress::FromIp(host, port)) {
        *out = *literal;
        return true;
    }

    addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* res = nullptr;
    const int gai = ::getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &res);
    if (gai != 0 || !res) {
        *error = std::string("getaddrinfo(") + host + "): " + ::gai_strerror(gai);
        if (res) ::freeaddrinfo(res);
        return false;
    }
    struct sockaddr_in addr;
    std::memcpy(&addr, res->ai_addr, sizeof addr);
    ::freeaddrinfo(res);
    out->setSockAddr(addr);
    return true;
}

Resolver::Resolver(EventLoop* resolverLoop, std::chrono::seconds cacheTtl)
    : resolverLoop_(resolverLoop),
      state_(std::make_shared<State>()) {
    state_->ttl = cacheTtl;
}

Resolver::~Resolver() {
    Shutdown();
}

void Resolver::Shutdown() {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->stopped) return;
    state_->stopped = true;
    state_->inflight.clear();
    LOG_DEBUG << "Resolver: stopped";
}

bool Resolver::Cached(const std::string& host, uint16_t port, InetAddress* out) const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    auto it = state_->cache.find(host + ":" + std::to_string(port));
    if (it == state_->cache.end()) return false;
    *out = it->second.addr;
    return true;
}

void Resolver::Resolve(EventLoop* callerLoop, const std::string& host, uint16_t port,
                       ResolveCallback cb, WantedPredicate wanted) {
    if (auto literal = InetAddress::FromIp(host, port)) {
        InetAddress addr = *literal;
        callerLoop->QueueInLoop([cb = std::move(cb), addr]() { cb(true, addr, std::string()); });
        return;
    }

    const std::string key = host + ":" + std::to_string(port);
    bool stopped = false;
    bool hit = false;
    bool startLookup = false;
    InetAddress addr;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->stopped) {
            stopped = true;
        } else {
            auto cached = state_->cache.find(key);
            if (cached != state_->cache.end()) {
                hit = true;
                addr = cached->second.addr;
                if (std::chrono::steady_clock::now() >= cached->second.expires) {
                    auto res = state_->inflight.emplace(key, Lookup());
                    res.first->second.refresh = true;
                    startLookup = res.second;
                }
            } else {
                auto res = state_->inflight.emplace(key, Lookup());
                res.first->second.waiters.push_back(Waiter{callerLoop, std::move(cb), std::move(wanted)});
                startLookup = res.second;
            }
        }
    }

    if (stopped) {
        callerLoop->QueueInLoop([cb = std::move(cb)]() { cb(false, InetAddress(), "resolver stopped"); });
        return;
    }
    if (hit) {
        callerLoop->QueueInLoop([cb = std::move(cb), addr]() { cb(true, addr, std::string()); });
    }
    if (startLookup) {
        std::shared_ptr<State> state = state_;
        resolverLoop_->QueueInLoop([state, host, port, key]() { RunLookup(state, host, port, key); });
    }
}

void Resolver::RunLookup(const std::shared_ptr<State>& state, const std::string& host,
                         uint16_t port, const std::string& key) {
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        auto it = state->inflight.find(key);
        if (state->stopped || it == state->inflight.end()) return;
        Lookup& lookup = it->second;
        std::vector<Waiter> live;
        for (Waiter& w : lookup.waiters) {
            if (!w.wanted || w.wanted()) live.push_back(std::move(w));
        }
        lookup.waiters.swap(live);
        if (lookup.waiters.empty() && !lookup.refresh) {
            LOG_DEBUG << "Resolver: nobody waits for " << key << " any more, skipped";
            state->inflight.erase(it);
            return;
        }
    }

    InetAddress addr;
    std::string error;
    const bool ok = ResolveBlocking(host, port, &addr, &error);
    if (ok) {
        LOG_DEBUG << "Resolver: " << host << " -> " << addr.toIp();
    } else {
        LOG_WARN << "Resolver: " << error;
    }

    // Posting happens under the lock so nothing reaches a caller loop after Shutdown().
    std::lock_guard<std::mutex> lock(state->mutex);
    auto it = state->inflight.find(key);
    if (state->stopped || it == state->inflight.end()) return;
    if (ok) {
        state->cache[key] = CacheEntry{addr, std::chrono::steady_clock::now() + state->ttl};
    }
    std::vector<Waiter> waiters;
    waiters.swap(it->second.waiters);
    state->inflight.erase(it);
    for (Waiter& w : waiters) {
        if (w.wanted && !w.wanted()) continue;
        w.loop->QueueInLoop([cb = std::move(w.cb), ok, addr, error]() { cb(ok, addr, error); });
    }
}

} // namespace network
} // namespace vrcproxy
