#pragma once

#include "vrcproxy/common/noncopyable.h"

#include <chrono>
#include <unordered_map>
#include <vector>
#include <sys/epoll.h>

namespace vrcproxy {
namespace network {

class Channel;

class EpollPoller : vrcproxy::common::noncopyable {
public:
    using ChannelList = std::vector<Channel*>;

    EpollPoller();
    ~EpollPoller();

    std::chrono::system_clock::time_point Poll(int timeout_ms, ChannelList* active_channels);
    void UpdateChannel(Channel* channel);
    void RemoveChannel(Channel* channel);
    bool HasChannel(Channel* channel) const;

private:
    static const int kInitEventListSize = 16;

    void FillActiveChannels(int num_events, ChannelList* active_channels) const;
    void Update(int operation, Channel* channel);

    int epollfd_;
    std::vector<struct epoll_event> events_;
    std::unordered_map<int, Channel*> channels_;
};

} // namespace network
} // namespace vrcproxy
