#pragma once

#include "wsproxy/common/noncopyable.h"

#include <chrono>
#include <functional>
#include <memory>

namespace wsproxy {
namespace network {

class Channel;
class EventLoop;

// One timerfd registered with an EventLoop. Fires once after `delay`, then
// every `interval` when interval is non-zero. Loop thread only.
class Timer : wsproxy::common::noncopyable {
public:
    using Callback = std::function<void()>;

    Timer(EventLoop* loop,
          Callback cb,
          std::chrono::nanoseconds delay,
          std::chrono::nanoseconds interval);
    ~Timer();

    // Returns false when the timerfd could not be created or armed.
    bool Arm();
    void Disarm();

    bool repeating() const { return interval_.count() > 0; }
    bool armed() const { return fd_ >= 0; }

private:
    void HandleRead();

    EventLoop* loop_;
    Callback callback_;
    const std::chrono::nanoseconds delay_;
    const std::chrono::nanoseconds interval_;
    int fd_;
    std::unique_ptr<Channel> channel_;
};

} // namespace network
} // namespace wsproxy
