#pragma once

#include "wsproxy/common/noncopyable.h"
#include "wsproxy/network/InetAddress.h"

#include <functional>
#include <memory>
#include <atomic>

namespace wsproxy {
namespace network {

class Channel;
class EventLoop;

// One non-blocking connect(2) attempt. Success hands the connected fd to the
// new connection callback; failure is reported once through the error
// callback and never retried here.
class Connector : public std::enable_shared_from_this<Connector>,
                  wsproxy::common::noncopyable {
public:
    using NewConnectionCallback = std::function<void(int sockfd)>;
    using ErrorCallback = std::function<void(int err)>;

    Connector(EventLoop* loop, const InetAddress& serverAddr);
    ~Connector();

    void SetNewConnectionCallback(const NewConnectionCallback& cb) {
        newConnectionCallback_ = cb;
    }
    void SetErrorCallback(const ErrorCallback& cb) {
        errorCallback_ = cb;
    }

    void Start();
    // Abandons an attempt in flight without reporting it.
    void Stop();

    const InetAddress& serverAddress() const { return serverAddr_; }

private:
    enum States { kDisconnected, kConnecting, kConnected };

    void SetState(States s) { state_ = s; }
    void StartInLoop();
    void StopInLoop();
    void Connect();
    void Connecting(int sockfd);
    void HandleWrite();
    void HandleError();
    void Fail(int sockfd, int err);
    int RemoveAndResetChannel();
    void ResetChannel();

    EventLoop* loop_;
    InetAddress serverAddr_;
    std::atomic<bool> connect_;
    States state_;
    std::unique_ptr<Channel> channel_;
    NewConnectionCallback newConnectionCallback_;
    ErrorCallback errorCallback_;
};

} // namespace network
} // namespace wsproxy
