#include "wsproxy/network/EpollPoller.h"
#include "wsproxy/network/Channel.h"
#include "wsproxy/common/Logger.h"

#include <sys/epoll.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace wsproxy {
namespace network {

namespace {
const int kNew = -1;
const int kAdded = 1;
const int kDeleted = 2;
} // namespace

EpollPoller::EpollPoller(EventLoop* loop)
    : epollfd_(::epoll_create1(EPOLL_CLOEXEC)),
      events_(kInitEventListSize) {
    if (epollfd_ < 0) {
        LOG_FATAL << "EpollPoller::EpollPoller epoll_create1 failed errno=" << errno;
    }
    LOG_DEBUG << "EpollPoller created for loop " << loop << " epollfd=" << epollfd_;
}

EpollPoller::~EpollPoller() {
    if (epollfd_ >= 0) ::close(epollfd_);
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
        LOG_ERROR << "EpollPoller::Poll() errno=" << saved_errno << " " << std::strerror(saved_errno);
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
    const int fd = channel->fd();

    if (index == kNew || index == kDeleted) {
        if (index == kNew) {
            channels_[fd] = channel;
        }
        // A channel with no interest stays out of the epoll set.
        if (channel->IsNoneEvent()) {
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
    const int index = channel->index();
    auto it = channels_.find(fd);
    if (it != channels_.end() && it->second == channel) {
        channels_.erase(it);
    }

    if (index == kAdded) {
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
        LOG_ERROR << "epoll_ctl op=" << operation << " fd=" << fd << " errno=" << errno;
    }
}

} // namespace network
} // namespace wsproxy
