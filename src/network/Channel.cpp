#include "wsproxy/network/Channel.h"
#include "wsproxy/network/EventLoop.h"
#include "wsproxy/common/Logger.h"

#include <sys/epoll.h>
#include <sstream>

namespace wsproxy {
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
      added_to_loop_(false),
      event_handling_(false),
      tied_(false) {
}

Channel::~Channel() {
    if (added_to_loop_) {
        LOG_WARN << "Channel fd=" << fd_ << " destroyed while still registered";
    }
}

void Channel::Tie(const std::shared_ptr<void>& owner) {
    tie_ = owner;
    tied_ = true;
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
    if (tied_) {
        std::shared_ptr<void> guard = tie_.lock();
        if (guard) {
            HandleEventWithGuard(receive_time);
        }
    } else {
        HandleEventWithGuard(receive_time);
    }
}

void Channel::HandleEventWithGuard(std::chrono::system_clock::time_point receive_time) {
    event_handling_ = true;
    LOG_DEBUG << "fd=" << fd_ << " revents=" << ReventsToString();

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
    event_handling_ = false;
}

std::string Channel::ReventsToString() const {
    std::ostringstream oss;
    oss << fd_ << ": ";
    if (revents_ & EPOLLIN) oss << "IN ";
    if (revents_ & EPOLLPRI) oss << "PRI ";
    if (revents_ & EPOLLOUT) oss << "OUT ";
    if (revents_ & EPOLLHUP) oss << "HUP ";
    if (revents_ & EPOLLRDHUP) oss << "RDHUP ";
    if (revents_ & EPOLLERR) oss << "ERR ";
    return oss.str();
}

} // namespace network
} // namespace wsproxy
