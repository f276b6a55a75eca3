#include "wsproxy/network/EventLoop.h"
#include "wsproxy/network/EventLoopThread.h"
#include "wsproxy/common/Logger.h"
#include <atomic>
#include <cassert>
#include <chrono>
#include <thread>

using namespace wsproxy::network;
using namespace wsproxy::common;

static void testQuitFromOtherThread() {
    EventLoop loop;
    std::thread t([&loop]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        loop.Quit();
    });
    loop.Loop();
    t.join();
}

static void testTimers() {
    EventLoop loop;
    int once = 0;
    int every = 0;
    int cancelled = 0;

    loop.RunAfter(0.05, [&]() { ++once; });
    EventLoop::TimerId repeating = loop.RunEvery(0.05, [&]() { ++every; });
    EventLoop::TimerId dropped = loop.RunAfter(0.1, [&]() { ++cancelled; });
    loop.Cancel(dropped);

    loop.RunAfter(0.3, [&]() {
        loop.Cancel(repeating);
        loop.RunAfter(0.15, [&]() { loop.Quit(); });
    });

    const auto start = std::chrono::steady_clock::now();
    loop.Loop();
    const auto elapsed = std::chrono::steady_clock::now() - start;

    assert(once == 1);
    // Fires at 50ms steps until cancelled at 300ms, then stays quiet.
    assert(every >= 4 && every <= 6);
    assert(cancelled == 0);
    assert(elapsed >= std::chrono::milliseconds(440));
}

static void testCrossThreadWork() {
    EventLoopThread loopThread;
    EventLoop* ioLoop = loopThread.StartLoop();

    std::atomic<int> ran{0};
    std::atomic<bool> inLoopThread{false};
    ioLoop->RunInLoop([&]() {
        inLoopThread = ioLoop->IsInLoopThread();
        ++ran;
    });
    ioLoop->QueueInLoop([&]() { ++ran; });
    // Timers may be added from a foreign thread too.
    ioLoop->RunAfter(0.02, [&]() { ++ran; });

    for (int i = 0; i < 100 && ran.load() < 3; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    assert(ran.load() == 3);
    assert(inLoopThread.load());
    assert(!ioLoop->IsInLoopThread());
}

int main() {
    Logger::Instance().SetLevel(LogLevel::ERROR);
    testQuitFromOtherThread();
    testTimers();
    testCrossThreadWork();
    LOG_INFO << "EventLoop tests passed";
    return 0;
}
