#pragma once

#include "wsproxy/common/noncopyable.h"

namespace wsproxy {
namespace network {

class InetAddress;

// Owns a socket fd; closes it on destruction.
class Socket : wsproxy::common::noncopyable {
public:
    explicit Socket(int sockfd)
        : sockfd_(sockfd) {}
    ~Socket();

    int fd() const { return sockfd_; }

    // Return false and log errno on failure.
    bool BindAddress(const InetAddress& localaddr);
    bool Listen();
    int Accept(InetAddress* peeraddr);

    void ShutdownWrite();

    void SetTcpNoDelay(bool on);
    void SetReuseAddr(bool on);
    void SetReusePort(bool on);
    void SetKeepAlive(bool on);

    static int CreateNonblocking();

private:
    const int sockfd_;
};

} // namespace network
} // namespace wsproxy
