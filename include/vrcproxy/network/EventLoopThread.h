#pragma once

#include "vrcproxy/common/noncopyable.h"
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

namespace vrcproxy {
namespace network {

class EventLoop;

class EventLoopThread : vrcproxy::common::noncopyable {
public:
    explicit EventLoopThread(const std::string& name = std::string());
    ~EventLoopThread();

    // Spawns the thread and blocks until its loop is running.
    EventLoop* StartLoop();

    // Quits the loop and joins the thread. Safe to call more than once.
    void Stop();

    const std::string& name() const { return name_; }

private:
    void ThreadFunc();

    EventLoop* loop_;
    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable cond_;
    std::string name_;
};

} // namespace network
} // namespace vrcproxy
