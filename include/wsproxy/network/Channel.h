#pragma once

#include "wsproxy/common/noncopyable.h"
#include <functional>
#include <memory>
#include <chrono>
#include <string>

namespace wsproxy {
namespace network {

class EventLoop;

// Binds one fd to its owning EventLoop and dispatches readiness events.
// Never owns the fd.
class Channel : wsproxy::common::noncopyable {
public:
    using EventCallback = std::function<void()>;
    using ReadEventCallback = std::function<void(std::chrono::system_clock::time_point)>;

    Channel(EventLoop* loop, int fd);
    ~Channel();

    void HandleEvent(std::chrono::system_clock::time_point receive_time);

    void SetReadCallback(ReadEventCallback cb) { read_callback_ = std::move(cb); }
    void SetWriteCallback(EventCallback cb) { write_callback_ = std::move(cb); }
    void SetCloseCallback(EventCallback cb) { close_callback_ = std::move(cb); }
    void SetErrorCallback(EventCallback cb) { error_callback_ = std::move(cb); }

    // Keeps the owner alive while its callbacks run (e.g. a TcpConnection
    // released by another thread in the middle of HandleEvent).
    void Tie(const std::shared_ptr<void>& owner);

    int fd() const { return fd_; }
    int events() const { return events_; }
    void set_revents(int revt) { revents_ = revt; }
    bool IsNoneEvent() const { return events_ == kNoneEvent; }

    void EnableReading() { events_ |= kReadEvent; Update(); }
    void DisableReading() { events_ &= ~kReadEvent; Update(); }
    void EnableWriting() { events_ |= kWriteEvent; Update(); }
    void DisableWriting() { events_ &= ~kWriteEvent; Update(); }
    void DisableAll() { events_ = kNoneEvent; Update(); }

    bool IsWriting() const { return events_ & kWriteEvent; }
    bool IsReading() const { return events_ & kReadEvent; }

    int index() const { return index_; }
    void set_index(int idx) { index_ = idx; }

    std::string ReventsToString() const;

    EventLoop* owner_loop() { return loop_; }
    void Remove();

private:
    void Update();
    void HandleEventWithGuard(std::chrono::system_clock::time_point receive_time);

    static const int kNoneEvent;
    static const int kReadEvent;
    static const int kWriteEvent;

    EventLoop* loop_;
    const int fd_;
    int events_;
    int revents_;
    int index_; // Used by EpollPoller
    bool added_to_loop_;
    bool event_handling_;

    std::weak_ptr<void> tie_;
    bool tied_;

    ReadEventCallback read_callback_;
    EventCallback write_callback_;
    EventCallback close_callback_;
    EventCallback error_callback_;
};

} // namespace network
} // namespace wsproxy
