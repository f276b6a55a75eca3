#include "wsproxy/network/EventLoop.h"
#include "wsproxy/network/Timer.h"
#include "wsproxy/common/Logger.h"

#include <sys/eventfd.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>

namespace wsproxy {
namespace network {

namespace {

__thread EventLoop* t_loopInThisThread = nullptr;

const int kPollTimeMs = 10000;

int CreateEventfd() {
    int evtfd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (evtfd < 0) {
        LOG_FATAL << "Failed in eventfd errno=" << errno;
    }
    return evtfd;
}

std::chrono::nanoseconds SecondsToNanos(double sec) {
    if (sec <= 0.0) return std::chrono::nanoseconds(0);
    return std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::duration<double>(sec));
}

} // namespace

EventLoop* EventLoop::GetEventLoopOfCurrentThread() {
    return t_loopInThisThread;
}

EventLoop::EventLoop()
    : looping_(false),
      quit_(false),
      calling_pending_functors_(false),
      thread_id_(std::this_thread::get_id()),
      poller_(new EpollPoller(this)),
      wakeup_fd_(CreateEventfd()),
      wakeup_channel_(new Channel(this, wakeup_fd_)),
      next_timer_id_(1) {

    LOG_DEBUG << "EventLoop created " << this << " in thread " << thread_id_;

    if (t_loopInThisThread) {
        LOG_FATAL << "Another EventLoop " << t_loopInThisThread << " exists in this thread " << thread_id_;
    } else {
        t_loopInThisThread = this;
    }

    wakeup_channel_->SetReadCallback(std::bind(&EventLoop::HandleRead, this));
    wakeup_channel_->EnableReading();
}

EventLoop::~EventLoop() {
    timers_.clear();
    wakeup_channel_->DisableAll();
    wakeup_channel_->Remove();
    ::close(wakeup_fd_);
    if (t_loopInThisThread == this) {
        t_loopInThisThread = nullptr;
    }
}

void EventLoop::Loop() {
    looping_ = true;
    quit_ = false;
    LOG_DEBUG << "EventLoop " << this << " start looping";

    while (!quit_) {
        active_channels_.clear();
        const auto now = poller_->Poll(kPollTimeMs, &active_channels_);
        for (Channel* channel : active_channels_) {
            channel->HandleEvent(now);
        }
        DoPendingFunctors();
    }

    LOG_DEBUG << "EventLoop " << this << " stop looping";
    looping_ = false;
}

void EventLoop::Quit() {
    quit_ = true;
    if (!IsInLoopThread()) {
        WakeUp();
    }
}

void EventLoop::RunInLoop(Functor cb) {
    if (IsInLoopThread()) {
        cb();
    } else {
        QueueInLoop(std::move(cb));
    }
}

void EventLoop::QueueInLoop(Functor cb) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_functors_.emplace_back(std::move(cb));
    }

    if (!IsInLoopThread() || calling_pending_functors_) {
        WakeUp();
    }
}

EventLoop::TimerId EventLoop::RunAfter(double delaySec, Functor cb) {
    return AddTimer(delaySec, 0.0, std::move(cb));
}

EventLoop::TimerId EventLoop::RunEvery(double intervalSec, Functor cb) {
    return AddTimer(intervalSec, intervalSec, std::move(cb));
}

void EventLoop::Cancel(TimerId timerId) {
    RunInLoop([this, timerId]() { CancelInLoop(timerId); });
}

EventLoop::TimerId EventLoop::AddTimer(double delaySec, double intervalSec, Functor cb) {
    const TimerId id = next_timer_id_++;
    // Moved into a shared holder so the queued functor stays copyable.
    auto holder = std::make_shared<Functor>(std::move(cb));
    RunInLoop([this, id, delaySec, intervalSec, holder]() {
        AddTimerInLoop(id, delaySec, intervalSec, std::move(*holder));
    });
    return id;
}

void EventLoop::AddTimerInLoop(TimerId id, double delaySec, double intervalSec, Functor cb) {
    std::unique_ptr<Timer> timer(new Timer(this,
                                           [this, id]() { HandleTimer(id); },
                                           SecondsToNanos(delaySec),
                                           SecondsToNanos(intervalSec)));
    if (!timer->Arm()) {
        LOG_ERROR << "EventLoop " << this << " could not arm timer " << id;
        return;
    }
    TimerEntry entry;
    entry.timer = std::move(timer);
    entry.callback = std::move(cb);
    timers_.emplace(id, std::move(entry));
}

void EventLoop::CancelInLoop(TimerId id) {
    auto it = timers_.find(id);
    if (it == timers_.end()) return;
    // The timer may be the channel currently being dispatched; destroy it
    // only after this round of events.
    std::shared_ptr<Timer> dead(it->second.timer.release());
    timers_.erase(it);
    QueueInLoop([dead]() {});
}

void EventLoop::HandleTimer(TimerId id) {
    auto it = timers_.find(id);
    if (it == timers_.end()) return;

    Functor cb = it->second.callback;
    if (!it->second.timer->repeating()) {
        CancelInLoop(id);
    }
    if (cb) cb();
}

void EventLoop::WakeUp() {
    uint64_t one = 1;
    ssize_t n = ::write(wakeup_fd_, &one, sizeof one);
    if (n != sizeof one) {
        LOG_ERROR << "EventLoop::WakeUp() writes " << n << " bytes instead of 8";
    }
}

void EventLoop::HandleRead() {
    uint64_t one = 1;
    ssize_t n = ::read(wakeup_fd_, &one, sizeof one);
    if (n != sizeof one) {
        LOG_ERROR << "EventLoop::HandleRead() reads " << n << " bytes instead of 8";
    }
}

void EventLoop::UpdateChannel(Channel* channel) {
    poller_->UpdateChannel(channel);
}

void EventLoop::RemoveChannel(Channel* channel) {
    poller_->RemoveChannel(channel);
}

bool EventLoop::HasChannel(Channel* channel) {
    return poller_->HasChannel(channel);
}

void EventLoop::DoPendingFunctors() {
    std::vector<Functor> functors;
    calling_pending_functors_ = true;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        functors.swap(pending_functors_);
    }

    for (const auto& functor : functors) {
        functor();
    }
    calling_pending_functors_ = false;
}

} // namespace network
} // namespace wsproxy
