#pragma once

#include "wsproxy/common/noncopyable.h"
#include <vector>
#include <unordered_map>
#include <chrono>
#include <sys/epoll.h>

namespace wsproxy {
namespace network {

class Channel;
class EventLoop;

// IO multiplexing with epoll(7). Only touched from the owner loop's thread.
class EpollPoller : wsproxy::common::noncopyable {
public:
    using ChannelList = std::vector<Channel*>;

    explicit EpollPoller(EventLoop* loop);
    ~EpollPoller();

    std::chrono::system_clock::time_point Poll(int timeout_ms, ChannelList* active_channels);
    void UpdateChannel(Channel* channel);
    void RemoveChannel(Channel* channel);
    bool HasChannel(Channel* channel) const;

    bool valid() const { return epollfd_ >= 0; }

private:
    static const int kInitEventListSize = 16;

    void FillActiveChannels(int num_events, ChannelList* active_channels) const;
    void Update(int operation, Channel* channel);

    using ChannelMap = std::unordered_map<int, Channel*>;
    using EventList = std::vector<struct epoll_event>;

    int epollfd_;
    EventList events_;
    ChannelMap channels_;
};

} // namespace network
} // namespace wsproxy
