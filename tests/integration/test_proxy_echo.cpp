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

std::atomic<int> g_backendMessages{0};

// Answers "ping" with "pong" and echoes everything else with its type.
void echoBackend(int lfd) {
    int fd = acceptWithin(lfd, 3000);
    assert(fd >= 0);
    std::string head;
    std::unique_ptr<WsPeer> peer(acceptBackendUpgrade(fd, &head));
    assert(peer);
    assert(head.find("GET /echo?room=1 HTTP/1.1\r\n") == 0);
    assert(head.find("Host: 127.0.0.1:9913\r\n") != std::string::npos);

    std::string payload;
    Opcode opcode;
    while (peer->RecvData(&payload, 3000, &opcode)) {
        ++g_backendMessages;
        if (payload == "ping") {
            peer->SendText("pong");
        } else {
            peer->Send(opcode, payload);
        }
    }
    // The proxy closes its backend session once the last client is gone.
    assert(acceptWithin(lfd, 300) == -1);
}

} // namespace

int main() {
    wsproxy::common::Logger::Instance().SetLevel(wsproxy::common::LogLevel::ERROR);

    constexpr uint16_t backendPort = 9913;
    constexpr uint16_t proxyPort = 9987;

    int lfd = listenOn(backendPort);
    std::thread backend([lfd]() { echoBackend(lfd); });

    EventLoop loop;
    wsproxy::core::ProxyOptions opts = proxyOptions(proxyPort, backendPort, "/echo?room=1");
    opts.threads = 2;
    opts.maxMessageBytes = 100000;
    wsproxy::ProxyServer server(&loop, opts);
    assert(server.Start());

    std::thread client([&]() {
        sleepMs(100);

        // Handshake and the first frame in one write.
        {
            int fd = connectTo(proxyPort);
            WsPeer peer(fd, WebSocketCodec::kClient);
            Buffer frame;
            WebSocketCodec(WebSocketCodec::kClient, 1024).Encode(Opcode::kText, "ping", 4, &frame);
            sendAll(fd, upgradeRequest("/ws") + frame.RetrieveAllAsString());
            const std::string head = readResponseHead(fd, peer.input());
            assert(statusOf(head) == 101);
            assert(head.find("Sec-WebSocket-Accept: s3pPLMBiTxaQ9kYGzzhZRbK+xOo=\r\n") != std::string::npos);

            std::string reply;
            assert(peer.RecvData(&reply));
            assert(reply == "pong");

            // Types survive the round trip, binary included.
            const std::string bin("\x00\x01\xff\x7f", 4);
            peer.Send(Opcode::kBinary, bin);
            Opcode opcode = Opcode::kText;
            assert(peer.RecvData(&reply, 2000, &opcode));
            assert(opcode == Opcode::kBinary);
            assert(reply == bin);

            // 64-bit length frames.
            const std::string big(70000, 'x');
            peer.SendText(big);
            assert(peer.RecvData(&reply, 3000));
            assert(reply == big);

            // Pings are answered by the proxy itself.
            peer.Send(Opcode::kPing, "hb");
            WebSocketFrame pong;
            assert(peer.Recv(&pong));
            assert(pong.opcode == Opcode::kPong);
            assert(pong.payload == "hb");

            // Fragmented message is reassembled before forwarding.
            std::string frag;
            frag.push_back(static_cast<char>(0x01)); // text, no FIN
            frag.push_back(static_cast<char>(0x80 | 3));
            frag.append("\0\0\0\0", 4);
            frag.append("abc");
            frag.push_back(static_cast<char>(0x80)); // continuation, FIN
            frag.push_back(static_cast<char>(0x80 | 3));
            frag.append("\0\0\0\0", 4);
            frag.append("def");
            peer.SendRaw(frag);
            assert(peer.RecvData(&reply));
            assert(reply == "abcdef");

            assert(server.ClientCount() == 1);
            assert(server.HasBackend());
            assert(server.DialAttempts() == 1);
            assert(g_backendMessages.load() == 4);
            assert(server.forwarder().messagesToBackend() == 4);
            assert(server.forwarder().messagesToClients() == 4);

            // Clean close: the proxy echoes our close frame.
            peer.Send(Opcode::kClose, WebSocketCodec::MakeClosePayload(1000, "bye"));
            uint16_t code = 0;
            assert(peer.WaitClosed(2000, &code));
            assert(code == 1000);
        }

        assert(waitFor([&]() { return server.ClientCount() == 0 && !server.HasBackend(); }));
        backend.join();

        // Protocol violations close the client with the matching code.
        {
            std::unique_ptr<WsPeer> peer(openClient(proxyPort));
            assert(peer);
            std::string unmasked;
            unmasked.push_back(static_cast<char>(0x81));
            unmasked.push_back(static_cast<char>(2));
            unmasked.append("hi");
            peer->SendRaw(unmasked);
            uint16_t code = 0;
            assert(peer->WaitClosed(2000, &code));
            assert(code == 1002);
        }
        {
            std::unique_ptr<WsPeer> peer(openClient(proxyPort));
            assert(peer);
            // Header only: a 200000 byte masked text frame.
            std::string header;
            header.push_back(static_cast<char>(0x81));
            header.push_back(static_cast<char>(0x80 | 127));
            const uint64_t len = 200000;
            for (int i = 7; i >= 0; --i) header.push_back(static_cast<char>((len >> (i * 8)) & 0xff));
            header.append("\x01\x02\x03\x04", 4);
            peer->SendRaw(header);
            uint16_t code = 0;
            assert(peer->WaitClosed(2000, &code));
            assert(code == 1009);
        }
        assert(waitFor([&]() { return server.ClientCount() == 0; }));

        loop.QueueInLoop([&]() { loop.Quit(); });
    });

    loop.Loop();
    client.join();
    server.Stop();
    ::close(lfd);
    return 0;
}
