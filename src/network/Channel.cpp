#include "vrcproxy/network/Channel.h"
#include "vrcproxy/network/EventLoop.h"
#include "vrcproxy/common/Logger.h"

#include <sys/epoll.h>

namespace vrcproxy {
namespace network {

const int Channel::kNoneEvent = 0;
const int Channel::kReadEvent = EPOLLIN | EPOLLPRI;
const int Channel::kWriteEvent = EPOLLOUT;

Channel::Channel(EventLoop* loop, int fd)
    : loop_(loop),
      fd_(fd),
      events_(0),
      revents_(0),
      index_(-1),
      added_to_loop_(false) {
}

Channel::~Channel() {
    if (added_to_loop_) {
        LOG_WARN << "Channel fd=" << fd_ << " destroyed while still registered";
    }
}

void Channel::ClearCallbacks() {
    read_callback_ = nullptr;
    write_callback_ = nullptr;
    close_callback_ = nullptr;
    error_callback_ = nullptr;
}

void Channel::Update() {
    added_to_loop_ = true;
    loop_->UpdateChannel(this);
}

void Channel::Remove() {
    added_to_loop_ = false;
    loop_->RemoveChannel(this);
}

void Channel::HandleEvent(std::chrono::system_clock::time_point receive_time) {
    // Owners that tear a Channel down from inside one of these callbacks must defer
    // its destruction with QueueInLoop; the remaining callbacks still run here.
    if ((revents_ & EPOLLHUP) && !(revents_ & EPOLLIN)) {
        if (close_callback_) close_callback_();
    }

    if (revents_ & EPOLLERR) {
        if (error_callback_) error_callback_();
    }

    if (revents_ & (EPOLLIN | EPOLLPRI | EPOLLRDHUP)) {
        if (read_callback_) read_callback_(receive_time);
    }

    if (revents_ & EPOLLOUT) {
        if (write_callback_) write_callback_();
    }
}

} // namespace network
} // namespace vrcproxy
