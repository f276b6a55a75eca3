#include "wsproxy/network/TcpServer.h"
#include "wsproxy/network/EventLoop.h"
#include "wsproxy/network/Acceptor.h"
#include "wsproxy/common/Logger.h"

#include <functional>
#include <vector>
#include <cstdio>
#include <unistd.h>

namespace wsproxy {
namespace network {

TcpServer::TcpServer(EventLoop* loop,
                     const InetAddress& listenAddr,
                     const std::string& nameArg,
                     Option option)
    : loop_(loop),
      hostport_(listenAddr.toIpPort()),
      name_(nameArg),
      acceptor_(new Acceptor(loop, listenAddr, option == kReusePort)),
      threadPool_(new EventLoopThreadPool(loop, nameArg)),
      started_(0),
      next_conn_id_(1),
      connection_count_(0) {
    acceptor_->SetNewConnectionCallback(
        std::bind(&TcpServer::NewConnection, this, std::placeholders::_1, std::placeholders::_2));
}

TcpServer::~TcpServer() {
    LOG_DEBUG << "TcpServer::~TcpServer [" << name_ << "] destructing";
    for (auto& item : connections_) {
        TcpConnectionPtr conn(item.second);
        item.second.reset();
        conn->getLoop()->RunInLoop(std::bind(&TcpConnection::ConnectDestroyed, conn));
    }
}

void TcpServer::SetThreadNum(int numThreads) {
    threadPool_->SetThreadNum(numThreads);
}

bool TcpServer::Start() {
    if (started_++ == 0) {
        threadPool_->Start();
        if (!acceptor_->Listen()) {
            LOG_ERROR << "TcpServer::Start [" << name_ << "] cannot listen on " << hostport_;
            return false;
        }
    }
    return acceptor_ && acceptor_->Listenning();
}

void TcpServer::Stop() {
    loop_->RunInLoop(std::bind(&TcpServer::StopInLoop, this));
}

void TcpServer::StopInLoop() {
    if (acceptor_) {
        LOG_INFO << "TcpServer::Stop [" << name_ << "] stop accepting on " << hostport_;
        acceptor_.reset();
    }
    std::vector<TcpConnectionPtr> live;
    live.reserve(connections_.size());
    for (auto const& item : connections_) {
        live.push_back(item.second);
    }
    for (auto& conn : live) {
        conn->ForceClose();
    }
}

size_t TcpServer::ConnectionCount() const {
    return connection_count_.load();
}

void TcpServer::NewConnection(int sockfd, const InetAddress& peerAddr) {
    char buf[64];
    std::snprintf(buf, sizeof buf, "-%s#%d", hostport_.c_str(), next_conn_id_);
    ++next_conn_id_;
    std::string connName = name_ + buf;

    LOG_INFO << "TcpServer::NewConnection [" << name_ << "] - new connection [" << connName
             << "] from " << peerAddr.toIpPort();

    EventLoop* ioLoop = threadPool_->GetNextLoop();

    struct sockaddr_in local;
    socklen_t len = sizeof local;
    InetAddress localAddr(0);
    if (::getsockname(sockfd, reinterpret_cast<struct sockaddr*>(&local), &len) == 0) {
        localAddr.setSockAddr(local);
    }

    TcpConnectionPtr conn(new TcpConnection(ioLoop,
                                            connName,
                                            sockfd,
                                            localAddr,
                                            peerAddr));
    connections_[connName] = conn;
    connection_count_.store(connections_.size());
    conn->SetConnectionCallback(connectionCallback_);
    conn->SetMessageCallback(messageCallback_);
    conn->SetWriteCompleteCallback(writeCompleteCallback_);
    conn->SetCloseCallback(
        std::bind(&TcpServer::RemoveConnection, this, std::placeholders::_1));

    ioLoop->RunInLoop(std::bind(&TcpConnection::ConnectEstablished, conn));
}

void TcpServer::RemoveConnection(const TcpConnectionPtr& conn) {
    // Always defer removal to avoid re-entrancy inside TcpConnection event callbacks.
    loop_->QueueInLoop(std::bind(&TcpServer::RemoveConnectionInLoop, this, conn));
}

void TcpServer::RemoveConnectionInLoop(const TcpConnectionPtr& conn) {
    LOG_DEBUG << "TcpServer::RemoveConnectionInLoop [" << name_ << "] - connection " << conn->name();
    if (connections_.erase(conn->name()) == 0) {
        return;
    }
    connection_count_.store(connections_.size());

    EventLoop* ioLoop = conn->getLoop();
    ioLoop->QueueInLoop(
        std::bind(&TcpConnection::ConnectDestroyed, conn));
}

} // namespace network
} // namespace wsproxy
