#include "wsproxy/network/EventLoopThreadPool.h"
#include "wsproxy/network/EventLoopThread.h"
#include "wsproxy/network/EventLoop.h"

namespace wsproxy {
namespace network {

EventLoopThreadPool::EventLoopThreadPool(EventLoop* baseLoop, const std::string& nameArg)
    : baseLoop_(baseLoop),
      name_(nameArg),
      started_(false),
      numThreads_(0),
      next_(0) {
}

// Joins the I/O threads; their loops must not own connections anymore.
EventLoopThreadPool::~EventLoopThreadPool() = default;

void EventLoopThreadPool::Start() {
    started_ = true;

    for (int i = 0; i < numThreads_; ++i) {
        std::unique_ptr<EventLoopThread> t(new EventLoopThread(name_ + "-io" + std::to_string(i)));
        loops_.push_back(t->StartLoop());
        threads_.push_back(std::move(t));
    }
}

EventLoop* EventLoopThreadPool::GetNextLoop() {
    EventLoop* loop = baseLoop_;

    if (!loops_.empty()) {
        loop = loops_[next_];
        ++next_;
        if (next_ >= loops_.size()) {
            next_ = 0;
        }
    }
    return loop;
}

} // namespace network
} // namespace wsproxy
