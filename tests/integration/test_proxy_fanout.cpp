#include "WsTestPeer.h"

#include "wsproxy/ProxyServer.h"
#include "wsproxy/common/Logger.h"
#include "wsproxy/network/EventLoop.h"

#include <algorithm>
#include <memory>
#include <set>
#include <thread>
#include <vector>

using namespace wstest;
using wsproxy::network::EventLoop;

namespace {

constexpr int kClients = 4;

// Many clients arriving together share one backend connection, and in
// broadcast mode all of them receive what the backend sends.
void checkBroadcast(wsproxy::ProxyServer* server, uint16_t proxyPort, uint16_t backendPort) {
    int lfd = listenOn(backendPort);
    std::thread backend([lfd]() {
        int fd = acceptWithin(lfd, 3000);
        assert(fd >= 0);
        std::unique_ptr<WsPeer> peer(acceptBackendUpgrade(fd));
        assert(peer);

        std::set<std::string> names;
        while (names.size() < static_cast<size_t>(kClients)) {
            std::string payload;
            assert(peer->RecvData(&payload, 3000));
            names.insert(payload);
        }
        assert(acceptWithin(lfd, 300) == -1);
        peer->SendText("news");
        assert(peer->WaitClosed(3000));
    });

    std::vector<std::unique_ptr<WsPeer>> clients(kClients);
    std::vector<std::thread> arrivals;
    for (int i = 0; i < kClients; ++i) {
        arrivals.emplace_back([&clients, i, proxyPort]() {
            clients[i].reset(openClient(proxyPort));
            assert(clients[i]);
            clients[i]->SendText("client-" + std::to_string(i));
        });
    }
    for (auto& t : arrivals) t.join();

    for (auto& c : clients) {
        std::string payload;
        assert(c->RecvData(&payload, 3000));
        assert(payload == "news");
    }
    assert(server->ClientCount() == static_cast<size_t>(kClients));
    assert(server->DialAttempts() == 1);

    for (auto& c : clients) c->Close();
    backend.join();
    assert(waitFor([&]() { return server->ClientCount() == 0 && !server->HasBackend(); }));
    ::close(lfd);
}

// Trigger mode: only the client that caused the dial hears the backend.
void checkTrigger(wsproxy::ProxyServer* server, uint16_t proxyPort, uint16_t backendPort) {
    int lfd = listenOn(backendPort);
    std::unique_ptr<WsPeer> a(openClient(proxyPort));
    assert(a);
    int fd = acceptWithin(lfd, 3000);
    assert(fd >= 0);
    std::unique_ptr<WsPeer> peer(acceptBackendUpgrade(fd));
    assert(peer);

    std::unique_ptr<WsPeer> b(openClient(proxyPort));
    assert(b);
    b->SendText("from-b");
    std::string payload;
    assert(peer->RecvData(&payload));
    assert(payload == "from-b");

    peer->SendText("only-a");
    assert(a->RecvData(&payload));
    assert(payload == "only-a");
    assert(!b->RecvData(&payload, 300));
    assert(server->ClientCount() == 2);
    assert(server->DialAttempts() == 1);

    a->Close();
    b->Close();
    assert(peer->WaitClosed(3000));
    ::close(lfd);
}

} // namespace

int main() {
    wsproxy::common::Logger::Instance().SetLevel(wsproxy::common::LogLevel::ERROR);

    EventLoop loop;

    wsproxy::core::ProxyOptions broadcastOpts = proxyOptions(9991, 9917);
    broadcastOpts.threads = 3;
    wsproxy::ProxyServer broadcast(&loop, broadcastOpts, "Broadcast");
    assert(broadcast.Start());

    wsproxy::core::ProxyOptions triggerOpts = proxyOptions(9992, 9918);
    triggerOpts.fanout = wsproxy::core::FanoutMode::kTrigger;
    wsproxy::ProxyServer trigger(&loop, triggerOpts, "Trigger");
    assert(trigger.Start());

    std::thread client([&]() {
        sleepMs(100);
        checkBroadcast(&broadcast, 9991, 9917);
        checkTrigger(&trigger, 9992, 9918);
        loop.QueueInLoop([&]() { loop.Quit(); });
    });

    loop.Loop();
    client.join();
    broadcast.Stop();
    trigger.Stop();
    return 0;
}
