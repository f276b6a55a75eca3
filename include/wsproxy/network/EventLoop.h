#pragma once

#include <vector>
#include <atomic>
#include <memory>
#include <thread>
#include <mutex>
#include <map>
#include <functional>
#include <cstdint>

#include "wsproxy/common/noncopyable.h"
#include "wsproxy/network/Channel.h"
#include "wsproxy/network/EpollPoller.h"

namespace wsproxy {
namespace network {

class Timer;

// One loop per thread. Everything except RunInLoop/QueueInLoop/Quit and the
// timer functions must be called from the loop's own thread.
class EventLoop : wsproxy::common::noncopyable {
public:
    using Functor = std::function<void()>;
    using TimerId = uint64_t;

    EventLoop();
    ~EventLoop();

    void Loop();
    void Quit();

    void RunInLoop(Functor cb);
    void QueueInLoop(Functor cb);

    // Thread safe. Delays are in seconds; RunEvery fires first after one interval.
    TimerId RunAfter(double delaySec, Functor cb);
    TimerId RunEvery(double intervalSec, Functor cb);
    void Cancel(TimerId timerId);

    void WakeUp();
    void UpdateChannel(Channel* channel);
    void RemoveChannel(Channel* channel);
    bool HasChannel(Channel* channel);

    bool IsInLoopThread() const { return thread_id_ == std::this_thread::get_id(); }
    bool looping() const { return looping_; }

    static EventLoop* GetEventLoopOfCurrentThread();

private:
    void HandleRead(); // For wakeup
    void DoPendingFunctors();

    TimerId AddTimer(double delaySec, double intervalSec, Functor cb);
    void AddTimerInLoop(TimerId id, double delaySec, double intervalSec, Functor cb);
    void CancelInLoop(TimerId id);
    void HandleTimer(TimerId id);

    using ChannelList = std::vector<Channel*>;

    std::atomic_bool looping_;
    std::atomic_bool quit_;
    std::atomic_bool calling_pending_functors_;

    const std::thread::id thread_id_;
    std::unique_ptr<EpollPoller> poller_;

    // wakeup fd
    int wakeup_fd_;
    std::unique_ptr<Channel> wakeup_channel_;

    ChannelList active_channels_;

    std::mutex mutex_;
    std::vector<Functor> pending_functors_;

    std::atomic<TimerId> next_timer_id_;
    struct TimerEntry {
        std::unique_ptr<Timer> timer;
        Functor callback;
    };
    std::map<TimerId, TimerEntry> timers_;
};

} // namespace network
} // namespace wsproxy
