#pragma once

#include "wsproxy/common/noncopyable.h"
#include "wsproxy/network/TcpConnection.h"

#include <functional>
#include <mutex>

namespace wsproxy {
namespace network {

class Connector;
class EventLoop;

// Client side of a single outbound TCP connection. A failed connect is
// reported through the connect error callback; reconnecting is up to the
// owner.
class TcpClient : wsproxy::common::noncopyable {
public:
    using ConnectErrorCallback = std::function<void(int err)>;

    TcpClient(EventLoop* loop, const InetAddress& serverAddr, const std::string& nameArg);
    ~TcpClient();

    void Connect();
    // Half-closes an established connection.
    void Disconnect();
    // Abandons a connect attempt in flight.
    void Stop();

    TcpConnectionPtr connection() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return connection_;
    }

    const std::string& name() const { return name_; }
    EventLoop* getLoop() const { return loop_; }

    void SetConnectionCallback(const ConnectionCallback& cb) { connectionCallback_ = cb; }
    void SetMessageCallback(const MessageCallback& cb) { messageCallback_ = cb; }
    void SetWriteCompleteCallback(const WriteCompleteCallback& cb) { writeCompleteCallback_ = cb; }
    void SetConnectErrorCallback(const ConnectErrorCallback& cb) { connectErrorCallback_ = cb; }

private:
    void NewConnection(int sockfd);
    void ConnectFailed(int err);
    void RemoveConnection(const TcpConnectionPtr& conn);

    EventLoop* loop_;
    std::shared_ptr<Connector> connector_;
    const std::string name_;

    ConnectionCallback connectionCallback_;
    MessageCallback messageCallback_;
    WriteCompleteCallback writeCompleteCallback_;
    ConnectErrorCallback connectErrorCallback_;

    bool connect_;
    int nextConnId_;
    mutable std::mutex mutex_;
    TcpConnectionPtr connection_;
};

} // namespace network
} // namespace wsproxy
