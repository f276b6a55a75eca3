#include "wsproxy/session/WebSocketSession.h"
#include "wsproxy/network/Buffer.h"
#include "wsproxy/network/EventLoop.h"
#include "wsproxy/network/TcpConnection.h"
#include "wsproxy/common/Logger.h"

namespace wsproxy {
namespace session {

using protocol::Opcode;
using protocol::WebSocketCodec;
using protocol::WebSocketFrame;

const double WebSocketSession::kCloseGraceSec = 2.0;
std::atomic<uint64_t> WebSocketSession::s_nextId_(1);

WebSocketSession::WebSocketSession(const wsproxy::network::TcpConnectionPtr& conn,
                                   WebSocketCodec::Role role,
                                   size_t maxMessageBytes)
    : id_(s_nextId_.fetch_add(1)),
      name_(conn->name()),
      conn_(conn),
      loop_(conn->getLoop()),
      codec_(role, maxMessageBytes),
      maxMessageBytes_(maxMessageBytes),
      state_(kOpen),
      finished_(false),
      assembling_(false),
      messageOpcode_(Opcode::kText) {
    LOG_DEBUG << "WebSocketSession::ctor id=" << id_ << " [" << name_ << "]";
}

WebSocketSession::~WebSocketSession() {
    LOG_DEBUG << "WebSocketSession::dtor id=" << id_ << " [" << name_ << "]";
}

bool WebSocketSession::SendMessage(Opcode opcode, const std::string& payload) {
    if (state_ != kOpen) return false;
    return SendFrame(opcode, payload.data(), payload.size());
}

bool WebSocketSession::SendFrame(Opcode opcode, const char* data, size_t len) {
    wsproxy::network::TcpConnectionPtr conn = conn_.lock();
    if (!conn || !conn->connected()) return false;

    wsproxy::network::Buffer out(len + 14);
    if (!codec_.Encode(opcode, data, len, &out)) return false;
    conn->Send(out.Peek(), out.ReadableBytes());
    return true;
}

void WebSocketSession::Close(uint16_t code, const std::string& reason) {
    State expected = kOpen;
    if (!state_.compare_exchange_strong(expected, kClosing)) return;

    LOG_DEBUG << "WebSocketSession::Close id=" << id_ << " code=" << code << " reason=" << reason;
    const std::string payload = WebSocketCodec::MakeClosePayload(code, reason);
    SendFrame(Opcode::kClose, payload.data(), payload.size());

    wsproxy::network::TcpConnectionPtr conn = conn_.lock();
    if (conn) {
        conn->Shutdown();
        std::weak_ptr<wsproxy::network::TcpConnection> weakConn(conn);
        loop_->RunAfter(kCloseGraceSec, [weakConn]() {
            if (auto c = weakConn.lock()) c->ForceClose();
        });
    }
    Finish(reason);
}

void WebSocketSession::Fail(uint16_t code, const std::string& reason) {
    LOG_WARN << "WebSocketSession id=" << id_ << " [" << name_ << "] protocol failure: " << reason;
    Close(code, reason);
}

void WebSocketSession::OnData(wsproxy::network::Buffer* buf) {
    while (state_ != kClosed && !finished_ && buf->ReadableBytes() > 0) {
        WebSocketFrame frame;
        std::string err;
        uint16_t code = protocol::kCloseProtocolError;
        const WebSocketCodec::ParseResult r = codec_.Parse(buf, &frame, &err, &code);
        if (r == WebSocketCodec::kIncomplete) return;
        if (r == WebSocketCodec::kError) {
            buf->RetrieveAll();
            Fail(code, err);
            return;
        }
        HandleFrame(frame);
    }

    // Once the session is over the peer's remaining bytes are irrelevant,
    // except a close reply which HandleControl has already consumed.
    if (finished_) {
        while (state_ == kClosing && buf->ReadableBytes() > 0) {
            WebSocketFrame frame;
            if (codec_.Parse(buf, &frame, nullptr) != WebSocketCodec::kFrame) break;
            if (frame.opcode == Opcode::kClose) {
                if (auto conn = conn_.lock()) conn->ForceClose();
            }
        }
        buf->RetrieveAll();
    }
}

void WebSocketSession::HandleFrame(const WebSocketFrame& frame) {
    if (WebSocketCodec::IsControl(frame.opcode)) {
        HandleControl(frame);
        return;
    }
    if (state_ != kOpen) return;

    if (frame.opcode == Opcode::kContinuation) {
        if (!assembling_) {
            Fail(protocol::kCloseProtocolError, "continuation frame without a message");
            return;
        }
        if (message_.size() + frame.payload.size() > maxMessageBytes_) {
            Fail(protocol::kCloseTooBig, "message exceeds " + std::to_string(maxMessageBytes_) + " bytes");
            return;
        }
        message_.append(frame.payload);
        if (!frame.fin) return;
        assembling_ = false;
        std::string message;
        message.swap(message_);
        if (messageHandler_) messageHandler_(shared_from_this(), messageOpcode_, message);
        return;
    }

    if (assembling_) {
        Fail(protocol::kCloseProtocolError, "new message before the previous one finished");
        return;
    }
    if (!frame.fin) {
        assembling_ = true;
        messageOpcode_ = frame.opcode;
        message_ = frame.payload;
        return;
    }
    if (messageHandler_) messageHandler_(shared_from_this(), frame.opcode, frame.payload);
}

void WebSocketSession::HandleControl(const WebSocketFrame& frame) {
    switch (frame.opcode) {
        case Opcode::kPing:
            if (state_ == kOpen) SendFrame(Opcode::kPong, frame.payload.data(), frame.payload.size());
            break;
        case Opcode::kPong:
            break;
        case Opcode::kClose: {
            uint16_t code = protocol::kCloseNoStatus;
            std::string reason;
            if (!WebSocketCodec::ParseClosePayload(frame.payload, &code, &reason)) {
                Fail(protocol::kCloseProtocolError, "malformed close frame");
                return;
            }
            State expected = kOpen;
            if (state_.compare_exchange_strong(expected, kClosing)) {
                // Echo the peer's status, then let it drop the connection.
                const std::string payload = (code == protocol::kCloseNoStatus)
                    ? std::string()
                    : WebSocketCodec::MakeClosePayload(code, reason);
                SendFrame(Opcode::kClose, payload.data(), payload.size());
                wsproxy::network::TcpConnectionPtr conn = conn_.lock();
                if (conn) {
                    conn->Shutdown();
                    std::weak_ptr<wsproxy::network::TcpConnection> weakConn(conn);
                    loop_->RunAfter(kCloseGraceSec, [weakConn]() {
                        if (auto c = weakConn.lock()) c->ForceClose();
                    });
                }
                Finish("peer closed with " + std::to_string(code) + (reason.empty() ? "" : " " + reason));
            } else {
                // Reply to our own close frame: the handshake is complete.
                if (auto conn = conn_.lock()) conn->ForceClose();
            }
            break;
        }
        default:
            break;
    }
}

void WebSocketSession::OnTransportClosed() {
    state_ = kClosed;
    Finish("connection closed");
}

void WebSocketSession::Finish(const std::string& reason) {
    if (finished_.exchange(true)) return;
    auto self = shared_from_this();
    loop_->RunInLoop([self, reason]() {
        CloseHandler cb;
        cb.swap(self->closeHandler_);
        self->messageHandler_ = MessageHandler();
        if (cb) cb(self, reason);
    });
}

} // namespace session
} // namespace wsproxy
