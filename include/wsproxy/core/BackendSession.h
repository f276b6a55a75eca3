#pragma once

#include "wsproxy/common/noncopyable.h"
#include "wsproxy/network/EventLoop.h"
#include "wsproxy/network/TcpClient.h"
#include "wsproxy/protocol/BackendUrl.h"
#include "wsproxy/protocol/HttpResponseContext.h"
#include "wsproxy/protocol/WebSocketCodec.h"
#include "wsproxy/session/WebSocketSession.h"

#include <atomic>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

namespace wsproxy {
namespace core {

class BackendSession;
using BackendSessionPtr = std::shared_ptr<BackendSession>;

// The shared connection to the backend: a TcpClient plus, once the upgrade
// handshake succeeds, a client-role WebSocketSession. All network work runs
// on the loop given at construction; Send() and Close() are thread safe.
//
// Exactly one of the dial-failed and closed callbacks fires, and only for
// endings the session did not initiate itself through Close().
class BackendSession : public std::enable_shared_from_this<BackendSession>,
                       wsproxy::common::noncopyable {
public:
    enum State { kConnecting, kOpen, kClosed };

    using DialFailedCallback = std::function<void(const BackendSessionPtr&, const std::string& err)>;
    using MessageCallback = std::function<void(const BackendSessionPtr&,
                                               protocol::Opcode,
                                               const std::string&)>;
    using ClosedCallback = std::function<void(const BackendSessionPtr&, const std::string& reason)>;

    // Messages queued while connecting beyond this count are refused.
    static const size_t kMaxPendingMessages = 1024;

    BackendSession(wsproxy::network::EventLoop* loop,
                   const protocol::BackendUrl& url,
                   double dialTimeoutSec,
                   size_t maxMessageBytes);
    ~BackendSession();

    uint64_t id() const { return id_; }
    State state() const;
    const protocol::BackendUrl& url() const { return url_; }

    void SetDialFailedCallback(const DialFailedCallback& cb) { dialFailedCallback_ = cb; }
    void SetMessageCallback(const MessageCallback& cb) { messageCallback_ = cb; }
    void SetClosedCallback(const ClosedCallback& cb) { closedCallback_ = cb; }

    // Resolves the host, connects and performs the upgrade handshake. A new
    // session is already in the connecting state before Start().
    void Start();

    // Queues while connecting, sends while open. Returns false once the
    // session is closed or the queue is full.
    bool Send(protocol::Opcode opcode, const std::string& payload);

    void Close();

private:
    void StartInLoop();
    void CloseInLoop();
    void OnConnection(const wsproxy::network::TcpConnectionPtr& conn);
    void OnMessage(const wsproxy::network::TcpConnectionPtr& conn,
                   wsproxy::network::Buffer* buf,
                   std::chrono::system_clock::time_point receiveTime);
    void OnHandshakeComplete(const wsproxy::network::TcpConnectionPtr& conn,
                             wsproxy::network::Buffer* buf);
    void OnSessionClosed(const std::string& reason);
    void OnDialTimeout();
    void Fail(const std::string& err);
    void CancelDialTimer();
    void DropTransport();

    static std::atomic<uint64_t> s_nextId_;

    const uint64_t id_;
    wsproxy::network::EventLoop* loop_;
    const protocol::BackendUrl url_;
    const double dialTimeoutSec_;
    const size_t maxMessageBytes_;

    mutable std::mutex mutex_;
    State state_;
    std::deque<std::pair<protocol::Opcode, std::string>> pending_;
    session::WebSocketSessionPtr ws_;

    // Loop thread only.
    std::shared_ptr<wsproxy::network::TcpClient> client_;
    std::string handshakeKey_;
    protocol::HttpResponseContext response_;
    bool started_;
    wsproxy::network::EventLoop::TimerId dialTimer_;
    bool dialTimerArmed_;

    DialFailedCallback dialFailedCallback_;
    MessageCallback messageCallback_;
    ClosedCallback closedCallback_;
};

} // namespace core
} // namespace wsproxy
