#pragma once

#include "wsproxy/common/noncopyable.h"
#include "wsproxy/network/InetAddress.h"
#include "wsproxy/network/Callbacks.h"
#include "wsproxy/network/Buffer.h"

#include <memory>
#include <string>
#include <atomic>
#include <chrono>
#include <any>

namespace wsproxy {
namespace network {

class Channel;
class EventLoop;
class Socket;

// One established TCP stream. Created by TcpServer or TcpClient, always held
// by shared_ptr; all I/O happens on the owning loop.
class TcpConnection : wsproxy::common::noncopyable,
                      public std::enable_shared_from_this<TcpConnection> {
public:
    TcpConnection(EventLoop* loop,
                  const std::string& name,
                  int sockfd,
                  const InetAddress& localAddr,
                  const InetAddress& peerAddr);
    ~TcpConnection();

    EventLoop* getLoop() const { return loop_; }
    const std::string& name() const { return name_; }
    const InetAddress& localAddress() const { return localAddr_; }
    const InetAddress& peerAddress() const { return peerAddr_; }
    bool connected() const { return state_ == kConnected; }
    bool disconnected() const { return state_ == kDisconnected; }

    void SetContext(const std::any& context) { context_ = context; }
    const std::any& GetContext() const { return context_; }
    std::any* GetMutableContext() { return &context_; }

    // Thread safe
    void Send(const std::string& message);
    void Send(const void* data, size_t len);
    void Shutdown();
    void ForceClose();

    void SetConnectionCallback(const ConnectionCallback& cb) { connectionCallback_ = cb; }
    void SetMessageCallback(const MessageCallback& cb) { messageCallback_ = cb; }
    void SetWriteCompleteCallback(const WriteCompleteCallback& cb) { writeCompleteCallback_ = cb; }
    void SetCloseCallback(const CloseCallback& cb) { closeCallback_ = cb; }
    // Fires once each time the queued output crosses highWaterMark upwards.
    void SetHighWaterMarkCallback(const HighWaterMarkCallback& cb, size_t highWaterMark) { highWaterMarkCallback_ = cb; highWaterMark_ = highWaterMark; }

    // Called once by the owner after the connection is registered.
    void ConnectEstablished();
    // Called once by the owner after it dropped its reference.
    void ConnectDestroyed();

private:
    enum StateE { kDisconnected, kConnecting, kConnected, kDisconnecting };

    void HandleRead(std::chrono::system_clock::time_point receiveTime);
    void HandleWrite();
    void HandleClose();
    void HandleError();

    void SendInLoop(const void* message, size_t len);
    void ShutdownInLoop();
    void ForceCloseInLoop();

    void SetState(StateE s) { state_ = s; }
    static const char* StateToString(StateE s);

    EventLoop* loop_;
    const std::string name_;
    std::atomic<StateE> state_;

    std::unique_ptr<Socket> socket_;
    std::unique_ptr<Channel> channel_;

    const InetAddress localAddr_;
    const InetAddress peerAddr_;

    ConnectionCallback connectionCallback_;
    MessageCallback messageCallback_;
    WriteCompleteCallback writeCompleteCallback_;
    CloseCallback closeCallback_;
    HighWaterMarkCallback highWaterMarkCallback_;
    size_t highWaterMark_;

    Buffer inputBuffer_;
    Buffer outputBuffer_;

    std::any context_;
};

} // namespace network
} // namespace wsproxy
