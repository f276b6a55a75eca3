#include "wsproxy/core/BackendSession.h"
#include "wsproxy/network/InetAddress.h"
#include "wsproxy/protocol/WebSocketHandshake.h"
#include "wsproxy/common/Logger.h"

#include <cstring>

namespace wsproxy {
namespace core {

using wsproxy::network::TcpConnectionPtr;
using wsproxy::network::TcpClient;

const size_t BackendSession::kMaxPendingMessages;
std::atomic<uint64_t> BackendSession::s_nextId_(1);

BackendSession::BackendSession(wsproxy::network::EventLoop* loop,
                               const protocol::BackendUrl& url,
                               double dialTimeoutSec,
                               size_t maxMessageBytes)
    : id_(s_nextId_.fetch_add(1)),
      loop_(loop),
      url_(url),
      dialTimeoutSec_(dialTimeoutSec),
      maxMessageBytes_(maxMessageBytes),
      state_(kConnecting),
      started_(false),
      dialTimer_(0),
      dialTimerArmed_(false) {
}

BackendSession::~BackendSession() {
    LOG_DEBUG << "BackendSession::dtor id=" << id_;
    if (dialTimerArmed_) {
        loop_->Cancel(dialTimer_);
    }
    if (client_) {
        // TcpClient must go away on its own loop.
        std::shared_ptr<TcpClient> client;
        client.swap(client_);
        loop_->RunInLoop([client]() mutable { client.reset(); });
    }
}

BackendSession::State BackendSession::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

void BackendSession::Start() {
    auto self = shared_from_this();
    loop_->RunInLoop([self]() { self->StartInLoop(); });
}

void BackendSession::StartInLoop() {
    if (started_) return;
    started_ = true;
    if (state() != kConnecting) return;

    wsproxy::network::InetAddress addr;
    std::string err;
    if (!wsproxy::network::InetAddress::Resolve(url_.host, url_.port, &addr, &err)) {
        Fail(err);
        return;
    }

    LOG_INFO << "BackendSession id=" << id_ << " dialing " << url_.toString()
             << " (" << addr.toIpPort() << ")";

    std::weak_ptr<BackendSession> weakSelf(shared_from_this());
    dialTimer_ = loop_->RunAfter(dialTimeoutSec_, [weakSelf]() {
        if (auto self = weakSelf.lock()) self->OnDialTimeout();
    });
    dialTimerArmed_ = true;

    client_ = std::make_shared<TcpClient>(loop_, addr, "backend" + std::to_string(id_));
    client_->SetConnectionCallback([weakSelf](const TcpConnectionPtr& conn) {
        if (auto self = weakSelf.lock()) self->OnConnection(conn);
    });
    client_->SetMessageCallback([weakSelf](const TcpConnectionPtr& conn,
                                           wsproxy::network::Buffer* buf,
                                           std::chrono::system_clock::time_point receiveTime) {
        if (auto self = weakSelf.lock()) {
            self->OnMessage(conn, buf, receiveTime);
        } else {
            buf->RetrieveAll();
        }
    });
    client_->SetConnectErrorCallback([weakSelf](int err) {
        if (auto self = weakSelf.lock()) {
            self->Fail(std::string("connect failed: ") + std::strerror(err));
        }
    });
    client_->Connect();
}

bool BackendSession::Send(protocol::Opcode opcode, const std::string& payload) {
    std::lock_guard<std::mutex> lock(mutex_);
    switch (state_) {
        case kConnecting:
            if (pending_.size() >= kMaxPendingMessages) {
                LOG_WARN << "BackendSession id=" << id_ << " pending queue full";
                return false;
            }
            pending_.emplace_back(opcode, payload);
            return true;
        case kOpen:
            return ws_->SendMessage(opcode, payload);
        case kClosed:
            break;
    }
    return false;
}

void BackendSession::Close() {
    auto self = shared_from_this();
    loop_->RunInLoop([self]() { self->CloseInLoop(); });
}

void BackendSession::CloseInLoop() {
    State prev;
    session::WebSocketSessionPtr ws;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        prev = state_;
        state_ = kClosed;
        pending_.clear();
        ws = ws_;
    }
    if (prev == kClosed) return;

    LOG_INFO << "BackendSession id=" << id_ << " closing";
    CancelDialTimer();
    if (ws) {
        ws->Close(protocol::kCloseGoingAway, "no clients");
    } else {
        DropTransport();
    }
}

void BackendSession::OnConnection(const TcpConnectionPtr& conn) {
    if (conn->connected()) {
        if (state() != kConnecting) {
            conn->ForceClose();
            return;
        }
        if (!protocol::WebSocketHandshake::GenerateClientKey(&handshakeKey_)) {
            Fail("cannot generate Sec-WebSocket-Key");
            return;
        }
        response_.reset();
        conn->Send(protocol::WebSocketHandshake::BuildClientRequest(url_, handshakeKey_));
        return;
    }

    session::WebSocketSessionPtr ws;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ws = ws_;
    }
    if (ws) {
        ws->OnTransportClosed();
    } else {
        Fail("connection closed during the upgrade handshake");
    }
}

void BackendSession::OnMessage(const TcpConnectionPtr& conn,
                               wsproxy::network::Buffer* buf,
                               std::chrono::system_clock::time_point receiveTime) {
    (void)receiveTime;
    session::WebSocketSessionPtr ws;
    State st;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ws = ws_;
        st = state_;
    }
    if (ws) {
        ws->OnData(buf);
        return;
    }
    if (st != kConnecting) {
        buf->RetrieveAll();
        return;
    }

    if (!response_.parseResponse(buf)) {
        Fail("malformed upgrade response");
        return;
    }
    if (!response_.gotAll()) return;

    std::string err;
    if (!protocol::WebSocketHandshake::ValidateServerResponse(response_, handshakeKey_, &err)) {
        Fail(err);
        return;
    }
    OnHandshakeComplete(conn, buf);
}

void BackendSession::OnHandshakeComplete(const TcpConnectionPtr& conn, wsproxy::network::Buffer* buf) {
    CancelDialTimer();

    auto ws = std::make_shared<session::WebSocketSession>(conn, protocol::WebSocketCodec::kClient, maxMessageBytes_);
    std::weak_ptr<BackendSession> weakSelf(shared_from_this());
    ws->SetMessageHandler([weakSelf](const session::WebSocketSessionPtr&,
                                     protocol::Opcode opcode,
                                     const std::string& payload) {
        auto self = weakSelf.lock();
        if (self && self->messageCallback_) self->messageCallback_(self, opcode, payload);
    });
    ws->SetCloseHandler([weakSelf](const session::WebSocketSessionPtr&, const std::string& reason) {
        if (auto self = weakSelf.lock()) self->OnSessionClosed(reason);
    });

    size_t flushed = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != kConnecting) {
            conn->ForceClose();
            return;
        }
        ws_ = ws;
        state_ = kOpen;
        // Flushed under the lock so later Send() calls cannot overtake them.
        for (const auto& msg : pending_) {
            if (ws->SendMessage(msg.first, msg.second)) ++flushed;
        }
        pending_.clear();
    }

    LOG_INFO << "BackendSession id=" << id_ << " open [" << conn->name() << "]"
             << (flushed ? ", flushed " + std::to_string(flushed) + " queued message(s)" : std::string());

    if (buf->ReadableBytes() > 0) {
        ws->OnData(buf);
    }
}

void BackendSession::OnSessionClosed(const std::string& reason) {
    State prev;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        prev = state_;
        state_ = kClosed;
        pending_.clear();
    }
    if (prev != kOpen) return;

    LOG_WARN << "BackendSession id=" << id_ << " lost: " << reason;
    if (closedCallback_) closedCallback_(shared_from_this(), reason);
}

void BackendSession::OnDialTimeout() {
    dialTimerArmed_ = false;
    Fail("no upgrade within " + std::to_string(dialTimeoutSec_) + "s");
}

void BackendSession::Fail(const std::string& err) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != kConnecting) return;
        state_ = kClosed;
        pending_.clear();
    }
    CancelDialTimer();
    DropTransport();

    LOG_WARN << "BackendSession id=" << id_ << " dial to " << url_.toString() << " failed: " << err;
    if (dialFailedCallback_) dialFailedCallback_(shared_from_this(), err);
}

void BackendSession::CancelDialTimer() {
    if (dialTimerArmed_) {
        loop_->Cancel(dialTimer_);
        dialTimerArmed_ = false;
    }
}

void BackendSession::DropTransport() {
    std::shared_ptr<TcpClient> client;
    client.swap(client_);
    if (!client) return;
    client->Stop();
    if (TcpConnectionPtr conn = client->connection()) {
        conn->ForceClose();
    }
    // We may be inside one of the client's callbacks; destroy it later.
    loop_->QueueInLoop([client]() mutable { client.reset(); });
}

} // namespace core
} // namespace wsproxy
