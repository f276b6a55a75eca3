#pragma once

#include <netinet/in.h>
#include <string>
#include <cstdint>

namespace wsproxy {
namespace network {

// IPv4 socket address.
class InetAddress {
public:
    explicit InetAddress(uint16_t port = 0, bool loopbackOnly = false);
    // ip must be a dotted quad; see Parse/Resolve for fallible construction.
    InetAddress(const std::string& ip, uint16_t port);
    explicit InetAddress(const struct sockaddr_in& addr)
        : addr_(addr) {}

    // Dotted quad only. Returns false on malformed input.
    static bool Parse(const std::string& ip, uint16_t port, InetAddress* out);
    // Blocking getaddrinfo(3) lookup restricted to IPv4 stream sockets.
    static bool Resolve(const std::string& host, uint16_t port, InetAddress* out, std::string* err);

    sa_family_t family() const { return addr_.sin_family; }
    std::string toIp() const;
    std::string toIpPort() const;
    uint16_t toPort() const;

    const struct sockaddr* getSockAddr() const { return reinterpret_cast<const struct sockaddr*>(&addr_); }
    void setSockAddr(const struct sockaddr_in& addr) { addr_ = addr; }

private:
    struct sockaddr_in addr_;
};

} // namespace network
} // namespace wsproxy
