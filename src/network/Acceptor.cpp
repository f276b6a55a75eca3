#include "wsproxy/network/Acceptor.h"
#include "wsproxy/network/EventLoop.h"
#include "wsproxy/common/Logger.h"

#include <sys/socket.h>
#include <unistd.h>
#include <fcntl.h>
#include <cerrno>

namespace wsproxy {
namespace network {

Acceptor::Acceptor(EventLoop* loop, const InetAddress& listenAddr, bool reuseport)
    : loop_(loop),
      listen_addr_(listenAddr),
      accept_socket_(Socket::CreateNonblocking()),
      accept_channel_(loop, accept_socket_.fd()),
      listenning_(false),
      idle_fd_(::open("/dev/null", O_RDONLY | O_CLOEXEC)) {

    accept_socket_.SetReuseAddr(true);
    accept_socket_.SetReusePort(reuseport);

    accept_channel_.SetReadCallback(std::bind(&Acceptor::HandleRead, this));
}

Acceptor::~Acceptor() {
    if (listenning_) {
        accept_channel_.DisableAll();
        accept_channel_.Remove();
    }
    if (idle_fd_ >= 0) ::close(idle_fd_);
}

bool Acceptor::Listen() {
    if (listenning_) return true;
    if (accept_socket_.fd() < 0) return false;
    if (!accept_socket_.BindAddress(listen_addr_)) return false;
    if (!accept_socket_.Listen()) return false;
    listenning_ = true;
    accept_channel_.EnableReading();
    LOG_INFO << "Acceptor listening on " << listen_addr_.toIpPort();
    return true;
}

void Acceptor::HandleRead() {
    InetAddress peerAddr;
    int connfd = accept_socket_.Accept(&peerAddr);
    if (connfd >= 0) {
        if (new_connection_callback_) {
            new_connection_callback_(connfd, peerAddr);
        } else {
            ::close(connfd);
        }
    } else {
        const int savedErrno = errno;
        LOG_ERROR << "Acceptor::HandleRead accept errno=" << savedErrno;
        if (savedErrno == EMFILE && idle_fd_ >= 0) {
            // Out of fds: free the spare one, accept and drop the pending
            // connection so the level-triggered channel does not spin.
            LOG_ERROR << "sockfd reached limit";
            ::close(idle_fd_);
            idle_fd_ = ::accept(accept_socket_.fd(), nullptr, nullptr);
            if (idle_fd_ >= 0) ::close(idle_fd_);
            idle_fd_ = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
        }
    }
}

} // namespace network
} // namespace wsproxy
