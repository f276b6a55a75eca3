#pragma once

#include "wsproxy/common/noncopyable.h"
#include "wsproxy/network/Callbacks.h"
#include "wsproxy/protocol/WebSocketCodec.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace wsproxy {
namespace network {
class Buffer;
class EventLoop;
}
namespace session {

class WebSocketSession;
using WebSocketSessionPtr = std::shared_ptr<WebSocketSession>;

// An open WebSocket on top of one TcpConnection, after the opening handshake.
// Inbound bytes are fed by the connection's owner through OnData() on the
// connection's loop; SendMessage() and Close() may be called from any thread.
class WebSocketSession : wsproxy::common::noncopyable,
                         public std::enable_shared_from_this<WebSocketSession> {
public:
    using MessageHandler = std::function<void(const WebSocketSessionPtr&,
                                              protocol::Opcode,
                                              const std::string&)>;
    // Invoked exactly once, on the connection's loop, when the session ends
    // for any reason (local Close included).
    using CloseHandler = std::function<void(const WebSocketSessionPtr&, const std::string& reason)>;

    enum State { kOpen, kClosing, kClosed };

    // Seconds a closing session waits for the peer before the socket is dropped.
    static const double kCloseGraceSec;

    WebSocketSession(const wsproxy::network::TcpConnectionPtr& conn,
                     protocol::WebSocketCodec::Role role,
                     size_t maxMessageBytes);
    ~WebSocketSession();

    uint64_t id() const { return id_; }
    const std::string& name() const { return name_; }
    State state() const { return state_; }
    bool isOpen() const { return state_ == kOpen; }

    void SetMessageHandler(const MessageHandler& cb) { messageHandler_ = cb; }
    void SetCloseHandler(const CloseHandler& cb) { closeHandler_ = cb; }

    // Sends one complete data message. Returns false if the session is not
    // open or its transport is gone.
    bool SendMessage(protocol::Opcode opcode, const std::string& payload);

    // Starts the closing handshake and drops the transport. Idempotent.
    void Close(uint16_t code, const std::string& reason);

    void OnData(wsproxy::network::Buffer* buf);
    // The transport reported EOF or an error.
    void OnTransportClosed();

private:
    void HandleFrame(const protocol::WebSocketFrame& frame);
    void HandleControl(const protocol::WebSocketFrame& frame);
    void Fail(uint16_t code, const std::string& reason);
    bool SendFrame(protocol::Opcode opcode, const char* data, size_t len);
    void Finish(const std::string& reason);

    static std::atomic<uint64_t> s_nextId_;

    const uint64_t id_;
    const std::string name_;
    std::weak_ptr<wsproxy::network::TcpConnection> conn_;
    wsproxy::network::EventLoop* loop_;
    protocol::WebSocketCodec codec_;
    const size_t maxMessageBytes_;

    std::atomic<State> state_;
    std::atomic<bool> finished_;

    // Fragment reassembly, touched only on the connection's loop.
    bool assembling_;
    protocol::Opcode messageOpcode_;
    std::string message_;

    MessageHandler messageHandler_;
    CloseHandler closeHandler_;
};

} // namespace session
} // namespace wsproxy
