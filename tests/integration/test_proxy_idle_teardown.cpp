#include "WsTestPeer.h"

#include "wsproxy/ProxyServer.h"
#include "wsproxy/common/Logger.h"
#include "wsproxy/network/EventLoop.h"

#include <memory>
#include <thread>

using namespace wstest;
using wsproxy::network::EventLoop;

int main() {
    wsproxy::common::Logger::Instance().SetLevel(wsproxy::common::LogLevel::ERROR);

    constexpr uint16_t backendPort = 9915;
    constexpr uint16_t proxyPort = 9989;

    int lfd = listenOn(backendPort);
    std::unique_ptr<WsPeer> backendPeer;
    std::thread backend([&]() {
        int fd = acceptWithin(lfd, 3000);
        assert(fd >= 0);
        backendPeer.reset(acceptBackendUpgrade(fd));
        assert(backendPeer);
    });

    EventLoop loop;
    wsproxy::core::ProxyOptions opts = proxyOptions(proxyPort, backendPort);
    opts.idleTimeoutSec = 0.4;
    opts.sweepIntervalSec = 0.1;
    wsproxy::ProxyServer server(&loop, opts);
    assert(server.Start());

    std::thread client([&]() {
        sleepMs(100);
        std::unique_ptr<WsPeer> a(openClient(proxyPort));
        assert(a);
        backend.join();

        // Traffic keeps the client registered well past the timeout.
        auto lastSent = std::chrono::steady_clock::now();
        for (int i = 0; i < 6; ++i) {
            lastSent = std::chrono::steady_clock::now();
            a->SendText("tick");
            std::string payload;
            assert(backendPeer->RecvData(&payload, 2000));
            assert(payload == "tick");
            sleepMs(200);
        }
        assert(server.ClientCount() == 1);
        assert(server.HasBackend());

        // Silence: evicted by a sweep, and the backend goes with it.
        uint16_t code = 0;
        assert(a->WaitClosed(2000, &code));
        assert(code == 1001);
        const auto idle = std::chrono::steady_clock::now() - lastSent;
        assert(idle >= std::chrono::milliseconds(400));

        assert(server.ClientCount() == 0);
        assert(!server.HasBackend());
        assert(backendPeer->WaitClosed(2000, &code));
        assert(code == 1001);
        assert(server.DialAttempts() == 1);

        loop.QueueInLoop([&]() { loop.Quit(); });
    });

    loop.Loop();
    client.join();
    server.Stop();
    ::close(lfd);
    return 0;
}
