#pragma once

#include "wsproxy/common/noncopyable.h"
#include "wsproxy/core/ProxyState.h"
#include "wsproxy/network/EventLoop.h"

namespace wsproxy {
namespace core {

// Periodically evicts clients without inbound activity for longer than
// ProxyState::idleTimeout. When a sweep empties the registry the backend is
// detached in the same critical section and closed before the sweep returns.
class IdleReaper : wsproxy::common::noncopyable {
public:
    IdleReaper(wsproxy::network::EventLoop* loop, ProxyState* state, double sweepIntervalSec);
    ~IdleReaper();

    // Returns the number of evicted clients.
    size_t Sweep();
    size_t SweepAt(SessionRegistry::Clock::time_point now);

    void Start();
    void Stop();

private:
    wsproxy::network::EventLoop* loop_;
    ProxyState* state_;
    const double sweepIntervalSec_;
    wsproxy::network::EventLoop::TimerId timer_;
    bool running_;
};

} // namespace core
} // namespace wsproxy
