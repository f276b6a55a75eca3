#include "wsproxy/network/TcpClient.h"
#include "wsproxy/network/EventLoop.h"
#include "wsproxy/network/InetAddress.h"
#include "wsproxy/network/TcpServer.h"
#include "wsproxy/common/Logger.h"
#include <arpa/inet.h>
#include <sys/socket.h>
#include <unistd.h>
#include <thread>
#include <string>
#include <atomic>
#include <chrono>
#include <cassert>
#include <cerrno>
#include <cstring>

using namespace wsproxy::network;
using namespace wsproxy::common;

static uint16_t pickFreePort() {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    assert(fd >= 0);
    int one = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
    sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = htons(0);
    assert(::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
    socklen_t len = sizeof(addr);
    assert(::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0);
    uint16_t port = ntohs(addr.sin_port);
    ::close(fd);
    assert(port != 0);
    return port;
}

int main() {
    Logger::Instance().SetLevel(LogLevel::ERROR);
    const uint16_t port = pickFreePort();
    const uint16_t closedPort = pickFreePort();

    EventLoop loop;

    // Echo server on two I/O threads.
    TcpServer server(&loop, InetAddress("127.0.0.1", port), "EchoServer");
    server.SetThreadNum(2);
    server.SetMessageCallback([](const TcpConnectionPtr& conn, Buffer* buf, std::chrono::system_clock::time_point) {
        conn->Send(buf->RetrieveAllAsString());
    });
    assert(server.Start());

    // A second listener on the same address cannot bind.
    TcpServer clash(&loop, InetAddress("127.0.0.1", port), "Clash");
    assert(!clash.Start());

    std::atomic<bool> echoed{false};
    std::atomic<int> refused{0};

    TcpClient client(&loop, InetAddress("127.0.0.1", port), "EchoClient");
    client.SetConnectionCallback([&](const TcpConnectionPtr& conn) {
        if (conn->connected()) conn->Send("Hello Proxy");
    });
    client.SetMessageCallback([&](const TcpConnectionPtr& conn, Buffer* buf, std::chrono::system_clock::time_point) {
        if (buf->ReadableBytes() < 11) return;
        assert(buf->RetrieveAllAsString() == "Hello Proxy");
        assert(server.ConnectionCount() == 1);
        echoed = true;
        conn->Shutdown();
    });

    // Nothing listens here: the failure is reported once, no retry.
    TcpClient failing(&loop, InetAddress("127.0.0.1", closedPort), "FailingClient");
    failing.SetConnectionCallback([](const TcpConnectionPtr& conn) {
        assert(!conn->connected());
    });
    failing.SetConnectErrorCallback([&](int err) {
        assert(err == ECONNREFUSED);
        ++refused;
    });

    client.Connect();
    failing.Connect();

    EventLoop::TimerId poll = loop.RunEvery(0.05, [&]() {
        if (echoed.load() && refused.load() == 1 && server.ConnectionCount() == 0) loop.Quit();
    });
    EventLoop::TimerId deadline = loop.RunAfter(5.0, [&]() { assert(false && "timed out"); });
    loop.Loop();
    loop.Cancel(poll);
    loop.Cancel(deadline);

    // Give a retry a chance to show up.
    loop.RunAfter(0.3, [&]() { loop.Quit(); });
    loop.Loop();
    assert(refused.load() == 1);

    server.Stop();
    return 0;
}
