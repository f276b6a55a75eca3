#pragma once

#include "wsproxy/common/noncopyable.h"
#include <mutex>
#include <condition_variable>
#include <thread>
#include <string>

namespace wsproxy {
namespace network {

class EventLoop;

// Runs an EventLoop on a dedicated thread; the loop lives on that thread's stack.
class EventLoopThread : wsproxy::common::noncopyable {
public:
    explicit EventLoopThread(const std::string& name = std::string());
    ~EventLoopThread();

    // Blocks until the loop is constructed and returns it.
    EventLoop* StartLoop();

    const std::string& name() const { return name_; }

private:
    void ThreadFunc();

    EventLoop* loop_;
    bool exiting_;
    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable cond_;
    std::string name_;
};

} // namespace network
} // namespace wsproxy
