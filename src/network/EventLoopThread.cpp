#include "wsproxy/network/EventLoopThread.h"
#include "wsproxy/network/EventLoop.h"
#include "wsproxy/common/Logger.h"

namespace wsproxy {
namespace network {

EventLoopThread::EventLoopThread(const std::string& name)
    : loop_(nullptr),
      exiting_(false),
      name_(name) {
}

EventLoopThread::~EventLoopThread() {
    exiting_ = true;
    EventLoop* loop = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        loop = loop_;
    }
    if (loop != nullptr) {
        loop->Quit();
    }
    if (thread_.joinable()) {
        thread_.join();
    }
}

EventLoop* EventLoopThread::StartLoop() {
    thread_ = std::thread(std::bind(&EventLoopThread::ThreadFunc, this));

    EventLoop* loop = nullptr;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cond_.wait(lock, [this]() { return loop_ != nullptr; });
        loop = loop_;
    }

    return loop;
}

void EventLoopThread::ThreadFunc() {
    EventLoop loop;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        loop_ = &loop;
        cond_.notify_one();
    }

    LOG_DEBUG << "EventLoopThread " << name_ << " running loop " << &loop;
    loop.Loop();

    std::lock_guard<std::mutex> lock(mutex_);
    loop_ = nullptr;
}

} // namespace network
} // namespace wsproxy
