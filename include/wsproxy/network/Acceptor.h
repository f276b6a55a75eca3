#pragma once

#include "wsproxy/common/noncopyable.h"
#include "wsproxy/network/InetAddress.h"
#include "wsproxy/network/Socket.h"
#include "wsproxy/network/Channel.h"

#include <functional>

namespace wsproxy {
namespace network {

class EventLoop;

// Listening socket. Binding is deferred to Listen() so that a busy port is
// reported to the caller instead of aborting construction.
class Acceptor : wsproxy::common::noncopyable {
public:
    using NewConnectionCallback = std::function<void(int sockfd, const InetAddress&)>;

    Acceptor(EventLoop* loop, const InetAddress& listenAddr, bool reuseport);
    ~Acceptor();

    void SetNewConnectionCallback(const NewConnectionCallback& cb) {
        new_connection_callback_ = cb;
    }

    bool Listenning() const { return listenning_; }
    bool Listen();

private:
    void HandleRead();

    EventLoop* loop_;
    const InetAddress listen_addr_;
    Socket accept_socket_;
    Channel accept_channel_;
    NewConnectionCallback new_connection_callback_;
    bool listenning_;
    int idle_fd_;
};

} // namespace network
} // namespace wsproxy
