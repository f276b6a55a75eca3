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

    constexpr uint16_t backendPort = 9914;
    constexpr uint16_t proxyPort = 9988;

    EventLoop loop;
    wsproxy::core::ProxyOptions opts = proxyOptions(proxyPort, backendPort);
    opts.dialTimeoutSec = 0.3;
    wsproxy::ProxyServer server(&loop, opts);
    assert(server.Start());

    std::thread client([&]() {
        sleepMs(100);

        // Nothing listens on the backend port: the triggering client is closed.
        {
            std::unique_ptr<WsPeer> a(openClient(proxyPort));
            assert(a);
            uint16_t code = 0;
            assert(a->WaitClosed(2000, &code));
            assert(code == 1011);
            assert(waitFor([&]() { return server.ClientCount() == 0; }));
            assert(!server.HasBackend());
            assert(server.DialAttempts() == 1);
        }

        // The backend accepts TCP but never answers the upgrade.
        {
            int lfd = listenOn(backendPort);
            std::unique_ptr<WsPeer> a(openClient(proxyPort));
            assert(a);
            uint16_t code = 0;
            assert(a->WaitClosed(2000, &code));
            assert(code == 1011);
            assert(waitFor([&]() { return server.ClientCount() == 0 && !server.HasBackend(); }));
            assert(server.DialAttempts() == 2);
            ::close(lfd);
        }

        // A later client dials afresh and gets through.
        {
            int lfd = listenOn(backendPort);
            std::thread backend([lfd]() {
                int fd = acceptWithin(lfd, 3000);
                assert(fd >= 0);
                std::unique_ptr<WsPeer> peer(acceptBackendUpgrade(fd));
                assert(peer);
                std::string payload;
                assert(peer->RecvData(&payload, 3000));
                assert(payload == "hello");
                peer->SendText("welcome");
                assert(peer->WaitClosed(3000));
            });

            std::unique_ptr<WsPeer> b(openClient(proxyPort));
            assert(b);
            b->SendText("hello");
            std::string reply;
            assert(b->RecvData(&reply, 3000));
            assert(reply == "welcome");
            assert(server.HasBackend());
            assert(server.DialAttempts() == 3);
            b->Close();

            backend.join();
            ::close(lfd);
        }

        loop.QueueInLoop([&]() { loop.Quit(); });
    });

    loop.Loop();
    client.join();
    server.Stop();
    return 0;
}
