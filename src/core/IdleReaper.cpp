#include "wsproxy/core/IdleReaper.h"
#include "wsproxy/core/BackendSession.h"
#include "wsproxy/common/Logger.h"

#include <vector>

namespace wsproxy {
namespace core {

IdleReaper::IdleReaper(wsproxy::network::EventLoop* loop, ProxyState* state, double sweepIntervalSec)
    : loop_(loop),
      state_(state),
      sweepIntervalSec_(sweepIntervalSec),
      timer_(0),
      running_(false) {
}

IdleReaper::~IdleReaper() {
    Stop();
}

size_t IdleReaper::Sweep() {
    return SweepAt(SessionRegistry::Clock::now());
}

size_t IdleReaper::SweepAt(SessionRegistry::Clock::time_point now) {
    std::vector<session::WebSocketSessionPtr> evicted;
    BackendSessionPtr detached;
    size_t active = 0;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        evicted = state_->registry.RemoveIdle(now, state_->idleTimeout);
        active = state_->registry.size();
        if (state_->registry.empty() && state_->backend) {
            detached.swap(state_->backend);
            state_->backendTrigger.reset();
        }
    }

    for (const auto& client : evicted) {
        LOG_INFO << "closing client " << client->id() << " [" << client->name() << "] due to inactivity";
        client->Close(protocol::kCloseGoingAway, "idle timeout");
    }
    if (!evicted.empty() || active > 0) {
        LOG_DEBUG << "idle sweep: evicted " << evicted.size() << ", active clients " << active;
    }
    if (detached) {
        LOG_INFO << "no active clients, closing backend session " << detached->id();
        detached->Close();
    }
    return evicted.size();
}

void IdleReaper::Start() {
    if (running_) return;
    running_ = true;
    timer_ = loop_->RunEvery(sweepIntervalSec_, [this]() { Sweep(); });
}

void IdleReaper::Stop() {
    if (!running_) return;
    running_ = false;
    loop_->Cancel(timer_);
}

} // namespace core
} // namespace wsproxy
