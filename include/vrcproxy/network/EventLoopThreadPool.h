#pragma once

#include "vrcproxy/common/noncopyable.h"
#include <memory>
#include <string>
#include <vector>

namespace vrcproxy {
namespace network {

class EventLoop;
class EventLoopThread;

class EventLoopThreadPool : vrcproxy::common::noncopyable {
public:
    EventLoopThreadPool(EventLoop* baseLoop, const std::string& nameArg);
    ~EventLoopThreadPool();

    void SetThreadNum(int numThreads) { numThreads_ = numThreads; }
    void Start();

    // Round robin over the worker loops; the base loop when there are none.
    EventLoop* GetNextLoop();

    bool started() const { return started_; }
    const std::string& name() const { return name_; }

private:
    EventLoop* baseLoop_;
    std::string name_;
    bool started_;
    int numThreads_;
    size_t next_;
    std::vector<std::unique_ptr<EventLoopThread>> threads_;
    std::vector<EventLoop*> loops_;
};

} // namespace network
} // namespace vrcproxy
