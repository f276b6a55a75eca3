#include "WsTestPeer.h"

#include "wsproxy/ProxyServer.h"
#include "wsproxy/common/Logger.h"
#include "wsproxy/network/EventLoop.h"

#include <atomic>
#include <memory>
#include <thread>

using namespace wstest;
using wsproxy::network::EventLoop;

namespace {

constexpr int kMessages = 128;
constexpr size_t kMessageBytes = 256 * 1024;

} // namespace

// A client that stops reading is dropped once its unsent output crosses the
// high-water mark; a client that keeps reading gets every broadcast.
int main() {
    wsproxy::common::Logger::Instance().SetLevel(wsproxy::common::LogLevel::ERROR);

    constexpr uint16_t backendPort = 9920;
    constexpr uint16_t proxyPort = 9994;

    int lfd = listenOn(backendPort);

    EventLoop loop;
    wsproxy::core::ProxyOptions opts = proxyOptions(proxyPort, backendPort);
    opts.threads = 2;
    opts.clientHighWaterMarkBytes = 4 * 1024 * 1024;
    wsproxy::ProxyServer server(&loop, opts);
    assert(server.Start());

    std::thread client([&]() {
        sleepMs(100);

        std::unique_ptr<WsPeer> stalled(openClient(proxyPort));
        assert(stalled);
        int fd = acceptWithin(lfd, 3000);
        assert(fd >= 0);
        std::unique_ptr<WsPeer> backend(acceptBackendUpgrade(fd));
        assert(backend);

        std::unique_ptr<WsPeer> reader(openClient(proxyPort));
        assert(reader);
        assert(waitFor([&]() { return server.ClientCount() == 2 && server.HasBackend(); }));

        std::atomic<int> received{0};
        std::thread drain([&]() {
            std::string payload;
            while (received.load() < kMessages && reader->RecvData(&payload, 3000)) {
                assert(payload.size() == kMessageBytes);
                ++received;
            }
        });

        // 32 MiB in total, far more than the kernel buffers of the stalled
        // client can hold.
        const std::string chunk(kMessageBytes, 'z');
        for (int i = 0; i < kMessages; ++i) {
            backend->Send(Opcode::kBinary, chunk);
            sleepMs(4);
        }

        drain.join();
        assert(received.load() == kMessages);

        assert(waitFor([&]() { return server.ClientCount() == 1; }, 3000));
        assert(server.HasBackend());
        assert(server.DialAttempts() == 1);

        // The stalled client is closed: what was queued drains, then the
        // close frame or a hang-up once the grace period runs out.
        assert(stalled->WaitClosed(8000));

        reader->Close();
        assert(backend->WaitClosed(3000));
        assert(waitFor([&]() { return server.ClientCount() == 0 && !server.HasBackend(); }));

        loop.QueueInLoop([&]() { loop.Quit(); });
    });

    loop.Loop();
    client.join();
    server.Stop();
    ::close(lfd);
    return 0;
}
