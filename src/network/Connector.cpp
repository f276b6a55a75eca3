#include "wsproxy/network/Connector.h"
#include "wsproxy/network/Channel.h"
#include "wsproxy/network/EventLoop.h"
#include "wsproxy/network/Socket.h"
#include "wsproxy/common/Logger.h"

#include <cerrno>
#include <cstring>
#include <unistd.h>
#include <sys/socket.h>

namespace wsproxy {
namespace network {

Connector::Connector(EventLoop* loop, const InetAddress& serverAddr)
    : loop_(loop),
      serverAddr_(serverAddr),
      connect_(false),
      state_(kDisconnected) {
}

Connector::~Connector() {
    if (channel_) {
        LOG_WARN << "Connector::~Connector channel still registered for " << serverAddr_.toIpPort();
    }
}

void Connector::Start() {
    connect_ = true;
    auto self = shared_from_this();
    loop_->RunInLoop([self]() { self->StartInLoop(); });
}

void Connector::StartInLoop() {
    if (connect_) {
        Connect();
    } else {
        LOG_DEBUG << "Connector::StartInLoop - stopped";
    }
}

void Connector::Stop() {
    connect_ = false;
    auto self = shared_from_this();
    loop_->RunInLoop([self]() { self->StopInLoop(); });
}

void Connector::StopInLoop() {
    if (state_ == kConnecting) {
        SetState(kDisconnected);
        int sockfd = RemoveAndResetChannel();
        ::close(sockfd);
    }
}

void Connector::Connect() {
    int sockfd = Socket::CreateNonblocking();
    if (sockfd < 0) {
        const int err = errno;
        if (errorCallback_) errorCallback_(err);
        return;
    }

    int ret = ::connect(sockfd, serverAddr_.getSockAddr(), sizeof(struct sockaddr_in));
    int savedErrno = (ret == 0) ? 0 : errno;

    switch (savedErrno) {
        case 0:
        case EINPROGRESS:
        case EINTR:
        case EISCONN:
            Connecting(sockfd);
            break;

        default:
            LOG_WARN << "Connector::Connect " << serverAddr_.toIpPort() << " errno=" << savedErrno
                     << " " << std::strerror(savedErrno);
            Fail(sockfd, savedErrno);
            break;
    }
}

void Connector::Connecting(int sockfd) {
    SetState(kConnecting);
    channel_.reset(new Channel(loop_, sockfd));
    channel_->SetWriteCallback(std::bind(&Connector::HandleWrite, this));
    channel_->SetErrorCallback(std::bind(&Connector::HandleError, this));
    channel_->EnableWriting();
}

int Connector::RemoveAndResetChannel() {
    channel_->DisableAll();
    channel_->Remove();
    int sockfd = channel_->fd();
    // Can't reset channel_ here because we may be inside Channel::HandleEvent
    auto self = shared_from_this();
    loop_->QueueInLoop([self]() { self->ResetChannel(); });
    return sockfd;
}

void Connector::ResetChannel() {
    channel_.reset();
}

void Connector::HandleWrite() {
    LOG_DEBUG << "Connector::HandleWrite state=" << state_;

    if (state_ == kConnecting) {
        int sockfd = RemoveAndResetChannel();
        int err = 0;
        socklen_t len = sizeof err;
        if (::getsockopt(sockfd, SOL_SOCKET, SO_ERROR, &err, &len) < 0) {
            err = errno;
        }

        if (err) {
            LOG_WARN << "Connector::HandleWrite " << serverAddr_.toIpPort()
                     << " SO_ERROR=" << err << " " << std::strerror(err);
            Fail(sockfd, err);
        } else {
            SetState(kConnected);
            if (connect_ && newConnectionCallback_) {
                newConnectionCallback_(sockfd);
            } else {
                ::close(sockfd);
            }
        }
    }
}

void Connector::HandleError() {
    if (state_ == kConnecting) {
        int sockfd = RemoveAndResetChannel();
        int err = 0;
        socklen_t len = sizeof err;
        ::getsockopt(sockfd, SOL_SOCKET, SO_ERROR, &err, &len);
        LOG_WARN << "Connector::HandleError " << serverAddr_.toIpPort()
                 << " SO_ERROR=" << err << " " << std::strerror(err);
        Fail(sockfd, err);
    }
}

void Connector::Fail(int sockfd, int err) {
    ::close(sockfd);
    SetState(kDisconnected);
    if (connect_ && errorCallback_) {
        errorCallback_(err);
    }
}

} // namespace network
} // namespace wsproxy
