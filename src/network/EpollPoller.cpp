#include "vrcproxy/network/EpollPoller.h"
#include "vrcproxy/network/Channel.h"
#include "vrcproxy/common/Logger.h"

#include <cerrno>
#include <cstring>
#include <unistd.h>

namespace vrcproxy {
namespace network {

namespace {
const int kNew = -1;
const int kAdded = 1;
const int kDeleted = 2;
}

EpollPoller::EpollPoller()
    : epollfd_(::epoll_create1(EPOLL_CLOEXEC)),
      events_(kInitEventListSize) {
    if (epollfd_ < 0) {
        LOG_FATAL << "EpollPoller::EpollPoller epoll_create1 failed errno=" << errno;
    }
}

EpollPoller::~EpollPoller() {
    ::close(epollfd_);
}

std::chrono::system_clock::time_point EpollPoller::Poll(int timeout_ms, ChannelList* active_channels) {
    int num_events = ::epoll_wait(epollfd_, events_.data(), static_cast<int>(events_.size()), timeout_ms);
    int saved_errno = errno;
    std::chrono::system_clock::time_point now = std::chrono::system_clock::now();

    if (num_events > 0) {
        FillActiveChannels(num_events, active_channels);
        if (static_cast<size_t>(num_events) == events_.size()) {
            events_.resize(events_.size() * 2);
        }
    } else if (num_events < 0 && saved_errno != EINTR) {
        LOG_ERROR << "EpollPoller::Poll() errno=" << saved_errno;
    }
    return now;
}

void EpollPoller::FillActiveChannels(int num_events, ChannelList* active_channels) const {
    for (int i = 0; i < num_events; ++i) {
        Channel* channel = static_cast<Channel*>(events_[i].data.ptr);
        channel->set_revents(events_[i].events);
        active_channels->push_back(channel);
    }
}

void EpollPoller::UpdateChannel(Channel* channel) {
    const int index = channel->index();
    if (index == kNew || index == kDeleted) {
        if (index == kNew) {
            channels_[channel->fd()] = channel;
        }
        if (channel->IsNoneEvent()) {
            // Nothing to watch yet; stay out of the epoll set.
            channel->set_index(kDeleted);
            return;
        }
        channel->set_index(kAdded);
        Update(EPOLL_CTL_ADD, channel);
    } else {
        if (channel->IsNoneEvent()) {
            Update(EPOLL_CTL_DEL, channel);
            channel->set_index(kDeleted);
        } else {
            Update(EPOLL_CTL_MOD, channel);
        }
    }
}

void EpollPoller::RemoveChannel(Channel* channel) {
    const int fd = channel->fd();
    auto it = channels_.find(fd);
    if (it != channels_.end() && it->second == channel) {
        channels_.erase(it);
    }
    if (channel->index() == kAdded) {
        Update(EPOLL_CTL_DEL, channel);
    }
    channel->set_index(kNew);
}

bool EpollPoller::HasChannel(Channel* channel) const {
    auto it = channels_.find(channel->fd());
    return it != channels_.end() && it->second == channel;
}

void EpollPoller::Update(int operation, Channel* channel) {
    struct epoll_event event;
    std::memset(&event, 0, sizeof(event));
    event.events = channel->events();
    event.data.ptr = channel;
    const int fd = channel->fd();
    if (::epoll_ctl(epollfd_, operation, fd, &event) < 0) {
        if (operation == EPOLL_CTL_DEL) {
            LOG_ERROR << "epoll_ctl DEL fd=" << fd << " errno=" << errno;
        } else {
            LOG_FATAL << "epoll_ctl op=" << operation << " fd=" << fd << " errno=" << errno;
        }
    }
}

} // namespace network
} // namespace vrcproxy
