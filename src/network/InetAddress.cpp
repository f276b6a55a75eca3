#include "wsproxy/network/InetAddress.h"
#include "wsproxy/common/Logger.h"

#include <cstring>
#include <cstdio>
#include <arpa/inet.h>
#include <netdb.h>
#include <sys/socket.h>

namespace wsproxy {
namespace network {

InetAddress::InetAddress(uint16_t port, bool loopbackOnly) {
    std::memset(&addr_, 0, sizeof addr_);
    addr_.sin_family = AF_INET;
    in_addr_t ip = loopbackOnly ? INADDR_LOOPBACK : INADDR_ANY;
    addr_.sin_addr.s_addr = htonl(ip);
    addr_.sin_port = htons(port);
}

InetAddress::InetAddress(const std::string& ip, uint16_t port) {
    std::memset(&addr_, 0, sizeof addr_);
    addr_.sin_family = AF_INET;
    addr_.sin_port = htons(port);
    if (::inet_pton(AF_INET, ip.c_str(), &addr_.sin_addr) <= 0) {
        LOG_ERROR << "InetAddress: invalid IPv4 address '" << ip << "'";
        addr_.sin_addr.s_addr = htonl(INADDR_NONE);
    }
}

bool InetAddress::Parse(const std::string& ip, uint16_t port, InetAddress* out) {
    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof addr);
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (::inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1) {
        return false;
    }
    if (out) out->setSockAddr(addr);
    return true;
}

bool InetAddress::Resolve(const std::string& host, uint16_t port, InetAddress* out, std::string* err) {
    if (Parse(host, port, out)) return true;

    struct addrinfo hints;
    std::memset(&hints, 0, sizeof hints);
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* result = nullptr;
    const int rc = ::getaddrinfo(host.c_str(), nullptr, &hints, &result);
    if (rc != 0 || result == nullptr) {
        if (err) *err = "cannot resolve '" + host + "': " + ::gai_strerror(rc);
        if (result) ::freeaddrinfo(result);
        return false;
    }

    struct sockaddr_in addr;
    std::memcpy(&addr, result->ai_addr, sizeof addr);
    addr.sin_port = htons(port);
    ::freeaddrinfo(result);
    if (out) out->setSockAddr(addr);
    return true;
}

std::string InetAddress::toIp() const {
    char buf[64] = "";
    ::inet_ntop(AF_INET, &addr_.sin_addr, buf, sizeof buf);
    return buf;
}

std::string InetAddress::toIpPort() const {
    char buf[64] = "";
    ::inet_ntop(AF_INET, &addr_.sin_addr, buf, sizeof buf);
    size_t end = std::strlen(buf);
    uint16_t port = ntohs(addr_.sin_port);
    std::snprintf(buf + end, sizeof buf - end, ":%u", port);
    return buf;
}

uint16_t InetAddress::toPort() const {
    return ntohs(addr_.sin_port);
}

} // namespace network
} // namespace wsproxy
