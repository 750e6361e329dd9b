#include "vrcproxy/network/EventLoopThreadPool.h"
#include "vrcproxy/network/EventLoopThread.h"
#include "vrcproxy/network/EventLoop.h"

namespace vrcproxy {
namespace network {

EventLoopThreadPool::EventLoopThreadPool(EventLoop* baseLoop, const std::string& nameArg)
    : baseLoop_(baseLoop),
      name_(nameArg),
      started_(false),
      numThreads_(0),
      next_(0) {
}

// Worker threads join in their own destructors.
EventLoopThreadPool::~EventLoopThreadPool() = default;

void EventLoopThreadPool::Start() {
    started_ = true;

    for (int i = 0; i < numThreads_; ++i) {
        auto t = std::make_unique<EventLoopThread>(name_ + "-io" + std::to_string(i));
        loops_.push_back(t->StartLoop());
        threads_.push_back(std::move(t));
    }
}

EventLoop* EventLoopThreadPool::GetNextLoop() {
    EventLoop* loop = baseLoop_;

    if (!loops_.empty()) {
        loop = loops_[next_];
        next_ = (next_ + 1) % loops_.size();
    }
    return loop;
}

} // namespace network
} // namespace vrcproxy
