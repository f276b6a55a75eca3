#pragma once

#include "wsproxy/common/noncopyable.h"
#include "wsproxy/network/InetAddress.h"
#include "wsproxy/network/Callbacks.h"
#include "wsproxy/network/TcpConnection.h"
#include "wsproxy/network/EventLoopThreadPool.h"

#include <map>
#include <string>
#include <atomic>
#include <memory>

namespace wsproxy {
namespace network {

class EventLoop;
class Acceptor;

// Accepts TCP connections on the base loop and hands each one to an I/O loop
// from the pool (round robin). The server owns the connections it created
// until they close.
class TcpServer : wsproxy::common::noncopyable {
public:
    enum Option {
        kNoReusePort,
        kReusePort,
    };

    TcpServer(EventLoop* loop,
              const InetAddress& listenAddr,
              const std::string& nameArg,
              Option option = kNoReusePort);
    ~TcpServer();

    const std::string& hostport() const { return hostport_; }
    const std::string& name() const { return name_; }
    EventLoop* getLoop() const { return loop_; }

    // Must be called before Start(). 0 keeps every connection on the base loop.
    void SetThreadNum(int numThreads);

    // Starts the I/O threads and binds the listener. Must run in the base
    // loop thread; returns false if the address cannot be bound.
    bool Start();
    // Closes the listener and force-closes every live connection. Thread safe.
    void Stop();

    size_t ConnectionCount() const;

    void SetConnectionCallback(const ConnectionCallback& cb) { connectionCallback_ = cb; }
    void SetMessageCallback(const MessageCallback& cb) { messageCallback_ = cb; }
    void SetWriteCompleteCallback(const WriteCompleteCallback& cb) { writeCompleteCallback_ = cb; }

private:
    void NewConnection(int sockfd, const InetAddress& peerAddr);
    void RemoveConnection(const TcpConnectionPtr& conn);
    void RemoveConnectionInLoop(const TcpConnectionPtr& conn);
    void StopInLoop();

    using ConnectionMap = std::map<std::string, TcpConnectionPtr>;

    EventLoop* loop_;
    const std::string hostport_;
    const std::string name_;
    std::unique_ptr<Acceptor> acceptor_;

    std::unique_ptr<EventLoopThreadPool> threadPool_;

    ConnectionCallback connectionCallback_;
    MessageCallback messageCallback_;
    WriteCompleteCallback writeCompleteCallback_;

    std::atomic_int started_;
    int next_conn_id_;
    ConnectionMap connections_;
    std::atomic<size_t> connection_count_;
};

} // namespace network
} // namespace wsproxy
