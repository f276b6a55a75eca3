#include "wsproxy/network/Timer.h"
#include "wsproxy/network/Channel.h"
#include "wsproxy/network/EventLoop.h"
#include "wsproxy/common/Logger.h"

#include <sys/timerfd.h>
#include <unistd.h>
#include <cerrno>
#include <cstdint>
#include <cstring>

namespace wsproxy {
namespace network {

namespace {

struct timespec ToTimespec(std::chrono::nanoseconds d) {
    // timerfd treats an all-zero it_value as "disarm".
    if (d.count() <= 0) d = std::chrono::nanoseconds(1000);
    struct timespec ts;
    ts.tv_sec = static_cast<time_t>(d.count() / 1000000000LL);
    ts.tv_nsec = static_cast<long>(d.count() % 1000000000LL);
    return ts;
}

} // namespace

Timer::Timer(EventLoop* loop,
             Callback cb,
             std::chrono::nanoseconds delay,
             std::chrono::nanoseconds interval)
    : loop_(loop),
      callback_(std::move(cb)),
      delay_(delay),
      interval_(interval),
      fd_(-1) {
}

Timer::~Timer() {
    Disarm();
}

bool Timer::Arm() {
    if (fd_ >= 0) return true;

    fd_ = ::timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (fd_ < 0) {
        LOG_ERROR << "Timer::Arm timerfd_create failed errno=" << errno;
        return false;
    }

    struct itimerspec howlong;
    std::memset(&howlong, 0, sizeof howlong);
    howlong.it_value = ToTimespec(delay_);
    if (repeating()) {
        howlong.it_interval = ToTimespec(interval_);
    }
    if (::timerfd_settime(fd_, 0, &howlong, nullptr) != 0) {
        LOG_ERROR << "Timer::Arm timerfd_settime failed errno=" << errno;
        ::close(fd_);
        fd_ = -1;
        return false;
    }

    channel_.reset(new Channel(loop_, fd_));
    channel_->SetReadCallback([this](std::chrono::system_clock::time_point) { HandleRead(); });
    channel_->EnableReading();
    return true;
}

void Timer::Disarm() {
    if (channel_) {
        channel_->DisableAll();
        channel_->Remove();
        channel_.reset();
    }
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

void Timer::HandleRead() {
    uint64_t expirations = 0;
    ssize_t n = ::read(fd_, &expirations, sizeof expirations);
    if (n != sizeof expirations) {
        LOG_WARN << "Timer::HandleRead reads " << n << " bytes instead of 8";
        return;
    }
    if (expirations > 1) {
        LOG_DEBUG << "Timer fd=" << fd_ << " missed " << (expirations - 1) << " expirations";
    }
    if (callback_) callback_();
}

} // namespace network
} // namespace wsproxy
