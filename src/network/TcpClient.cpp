#include "wsproxy/network/TcpClient.h"
#include "wsproxy/network/Connector.h"
#include "wsproxy/network/EventLoop.h"
#include "wsproxy/common/Logger.h"

#include <cstdio>
#include <sys/socket.h>

namespace wsproxy {
namespace network {

namespace detail {
void removeConnection(EventLoop* loop, const TcpConnectionPtr& conn) {
    loop->QueueInLoop(std::bind(&TcpConnection::ConnectDestroyed, conn));
}
} // namespace detail

TcpClient::TcpClient(EventLoop* loop, const InetAddress& serverAddr, const std::string& nameArg)
    : loop_(loop),
      connector_(new Connector(loop, serverAddr)),
      name_(nameArg),
      connect_(true),
      nextConnId_(1) {
    connector_->SetNewConnectionCallback(
        std::bind(&TcpClient::NewConnection, this, std::placeholders::_1));
    connector_->SetErrorCallback(
        std::bind(&TcpClient::ConnectFailed, this, std::placeholders::_1));
    LOG_DEBUG << "TcpClient::TcpClient[" << name_ << "] - connector " << connector_.get();
}

TcpClient::~TcpClient() {
    LOG_DEBUG << "TcpClient::~TcpClient[" << name_ << "] - connector " << connector_.get();
    TcpConnectionPtr conn;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        conn = connection_;
    }
    if (conn) {
        // The connection outlives us; its close must no longer call back into
        // this object.
        CloseCallback cb = std::bind(&detail::removeConnection, loop_, std::placeholders::_1);
        loop_->RunInLoop([conn, cb]() {
            conn->SetConnectionCallback(ConnectionCallback());
            conn->SetMessageCallback(MessageCallback());
            conn->SetCloseCallback(cb);
        });
        conn->ForceClose();
    } else {
        connector_->SetNewConnectionCallback(Connector::NewConnectionCallback());
        connector_->SetErrorCallback(Connector::ErrorCallback());
        connector_->Stop();
    }
}

void TcpClient::Connect() {
    LOG_INFO << "TcpClient::Connect[" << name_ << "] - connecting to "
             << connector_->serverAddress().toIpPort();
    connect_ = true;
    connector_->Start();
}

void TcpClient::Disconnect() {
    connect_ = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (connection_) {
            connection_->Shutdown();
        }
    }
}

void TcpClient::Stop() {
    connect_ = false;
    connector_->Stop();
}

void TcpClient::NewConnection(int sockfd) {
    InetAddress peerAddr = connector_->serverAddress();
    InetAddress localAddr(0);
    struct sockaddr_in local;
    socklen_t len = sizeof local;
    if (::getsockname(sockfd, reinterpret_cast<struct sockaddr*>(&local), &len) == 0) {
        localAddr.setSockAddr(local);
    }

    char buf[64];
    std::snprintf(buf, sizeof buf, ":%s#%d", peerAddr.toIpPort().c_str(), nextConnId_);
    ++nextConnId_;
    std::string connName = name_ + buf;

    TcpConnectionPtr conn(new TcpConnection(loop_,
                                            connName,
                                            sockfd,
                                            localAddr,
                                            peerAddr));

    conn->SetConnectionCallback(connectionCallback_);
    conn->SetMessageCallback(messageCallback_);
    conn->SetWriteCompleteCallback(writeCompleteCallback_);
    conn->SetCloseCallback(
        std::bind(&TcpClient::RemoveConnection, this, std::placeholders::_1));

    {
        std::lock_guard<std::mutex> lock(mutex_);
        connection_ = conn;
    }
    conn->ConnectEstablished();
}

void TcpClient::ConnectFailed(int err) {
    LOG_WARN << "TcpClient::ConnectFailed[" << name_ << "] - "
             << connector_->serverAddress().toIpPort() << " errno=" << err;
    if (connectErrorCallback_) {
        connectErrorCallback_(err);
    }
}

void TcpClient::RemoveConnection(const TcpConnectionPtr& conn) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (connection_ == conn) {
            connection_.reset();
        }
    }

    loop_->QueueInLoop(std::bind(&TcpConnection::ConnectDestroyed, conn));
}

} // namespace network
} // namespace wsproxy
