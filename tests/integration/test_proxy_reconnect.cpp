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

    constexpr uint16_t backendPort = 9916;
    constexpr uint16_t proxyPort = 9990;

    EventLoop loop;
    wsproxy::core::ProxyOptions opts = proxyOptions(proxyPort, backendPort);
    opts.monitorIntervalSec = 0.3;
    wsproxy::ProxyServer server(&loop, opts);
    assert(server.Start());

    std::thread client([&]() {
        sleepMs(100);
        int lfd = listenOn(backendPort);

        std::unique_ptr<WsPeer> a(openClient(proxyPort));
        assert(a);
        {
            int fd = acceptWithin(lfd, 3000);
            assert(fd >= 0);
            std::unique_ptr<WsPeer> first(acceptBackendUpgrade(fd));
            assert(first);
            a->SendText("one");
            std::string payload;
            assert(first->RecvData(&payload));
            assert(payload == "one");
            first->SendText("from-1");
            assert(a->RecvData(&payload));
            assert(payload == "from-1");
            // Backend restarts: the socket just goes away.
        }
        ::close(lfd);

        assert(waitFor([&]() { return !server.HasBackend(); }));
        assert(server.ClientCount() == 1);
        assert(server.DialAttempts() == 1);

        // While the backend is down the monitor keeps trying, one dial per tick.
        sleepMs(700);
        assert(server.ClientCount() == 1);
        const uint64_t failedDials = server.DialAttempts() - 1;
        assert(failedDials >= 1 && failedDials <= 3);

        lfd = listenOn(backendPort);
        int fd = acceptWithin(lfd, 3000);
        assert(fd >= 0);
        std::unique_ptr<WsPeer> second(acceptBackendUpgrade(fd));
        assert(second);
        second->SendText("from-2");
        std::string payload;
        assert(a->RecvData(&payload));
        assert(payload == "from-2");
        a->SendText("two");
        assert(second->RecvData(&payload));
        assert(payload == "two");

        // Exactly one backend connection while the field is set.
        assert(acceptWithin(lfd, 700) == -1);
        assert(server.HasBackend());

        a->Close();
        assert(second->WaitClosed(2000));
        ::close(lfd);

        loop.QueueInLoop([&]() { loop.Quit(); });
    });

    loop.Loop();
    client.join();
    server.Stop();
    return 0;
}
