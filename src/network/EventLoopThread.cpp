#include "vrcproxy/network/EventLoopThread.h"
#include "vrcproxy/network/EventLoop.h"
#include "vrcproxy/common/Logger.h"

namespace vrcproxy {
namespace network {

EventLoopThread::EventLoopThread(const std::string& name)
    : loop_(nullptr),
      name_(name) {
}

EventLoopThread::~EventLoopThread() {
    Stop();
}

void EventLoopThread::Stop() {
    EventLoop* loop = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        loop = loop_;
    }
    if (loop != nullptr) {
        loop->Quit();
    }
    if (thread_.joinable()) {
        thread_.join();
    }
}

EventLoop* EventLoopThread::StartLoop() {
    thread_ = std::thread(std::bind(&EventLoopThread::ThreadFunc, this));

    std::unique_lock<std::mutex> lock(mutex_);
    cond_.wait(lock, [this]() { return loop_ != nullptr; });
    return loop_;
}

void EventLoopThread::ThreadFunc() {
    EventLoop loop;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        loop_ = &loop;
        cond_.notify_one();
    }

    LOG_DEBUG << "EventLoopThread " << name_ << " running";
    loop.Loop();

    std::lock_guard<std::mutex> lock(mutex_);
    loop_ = nullptr;
}

} // namespace network
} // namespace vrcproxy
