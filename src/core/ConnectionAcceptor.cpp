#include "wsproxy/core/ConnectionAcceptor.h"
#include "wsproxy/core/BackendSessionManager.h"
#include "wsproxy/core/MessageForwarder.h"
#include "wsproxy/ClientSessionContext.h"
#include "wsproxy/network/Buffer.h"
#include "wsproxy/network/TcpConnection.h"
#include "wsproxy/protocol/WebSocketHandshake.h"
#include "wsproxy/common/Logger.h"

#include <any>

namespace wsproxy {
namespace core {

using wsproxy::network::TcpConnectionPtr;
using protocol::HttpResponse;
using protocol::WebSocketHandshake;

ConnectionAcceptor::ConnectionAcceptor(ProxyState* state,
                                       BackendSessionManager* backends,
                                       MessageForwarder* forwarder,
                                       const ProxyOptions& options)
    : state_(state),
      backends_(backends),
      forwarder_(forwarder),
      path_(options.path),
      maxMessageBytes_(options.maxMessageBytes),
      highWaterMarkBytes_(options.clientHighWaterMarkBytes),
      accepted_(0),
      rejected_(0) {
}

void ConnectionAcceptor::OnConnection(const TcpConnectionPtr& conn) {
    if (conn->connected()) {
        LOG_DEBUG << "ConnectionAcceptor: " << conn->peerAddress().toIpPort() << " connected";
        conn->SetContext(ClientSessionContext());
        return;
    }

    auto* ctx = std::any_cast<ClientSessionContext>(conn->GetMutableContext());
    if (!ctx) return;
    session::WebSocketSessionPtr session = ctx->session;
    conn->SetContext(std::any());
    if (session) {
        session->OnTransportClosed();
    }
}

void ConnectionAcceptor::OnMessage(const TcpConnectionPtr& conn,
                                   wsproxy::network::Buffer* buf,
                                   std::chrono::system_clock::time_point receiveTime) {
    auto* ctx = std::any_cast<ClientSessionContext>(conn->GetMutableContext());
    if (!ctx) {
        buf->RetrieveAll();
        return;
    }

    switch (ctx->phase) {
        case ClientSessionContext::kUpgraded:
            ctx->session->OnData(buf);
            return;
        case ClientSessionContext::kRejected:
            buf->RetrieveAll();
            return;
        case ClientSessionContext::kHandshake:
            break;
    }

    if (!ctx->http.parseRequest(buf, receiveTime)) {
        Reject(conn, HttpResponse::k400BadRequest, "malformed upgrade request");
        return;
    }
    if (ctx->http.gotAll()) {
        Upgrade(conn, buf);
    }
}

void ConnectionAcceptor::Upgrade(const TcpConnectionPtr& conn, wsproxy::network::Buffer* buf) {
    auto* ctx = std::any_cast<ClientSessionContext>(conn->GetMutableContext());
    const protocol::HttpRequest& req = ctx->http.request();

    std::string err;
    const HttpResponse::HttpStatusCode status = WebSocketHandshake::ValidateUpgrade(req, path_, &err);
    if (status != HttpResponse::k101SwitchingProtocols) {
        Reject(conn, status, err);
        return;
    }

    conn->Send(WebSocketHandshake::BuildServerResponse(req.getHeader("Sec-WebSocket-Key")).toString());

    auto session = std::make_shared<session::WebSocketSession>(conn, protocol::WebSocketCodec::kServer, maxMessageBytes_);
    MessageForwarder* forwarder = forwarder_;
    ProxyState* state = state_;
    session->SetMessageHandler([forwarder](const session::WebSocketSessionPtr& s,
                                           protocol::Opcode opcode,
                                           const std::string& payload) {
        forwarder->OnClientMessage(s, opcode, payload);
    });
    session->SetCloseHandler([state](const session::WebSocketSessionPtr& s, const std::string& reason) {
        ReleaseClient(*state, s, protocol::kCloseNormal, reason);
    });
    std::weak_ptr<session::WebSocketSession> weakSession(session);
    conn->SetHighWaterMarkCallback([state, weakSession](const TcpConnectionPtr& c, size_t queued) {
        session::WebSocketSessionPtr s = weakSession.lock();
        if (!s) return;
        LOG_WARN << "client " << s->id() << " at " << c->peerAddress().toIpPort()
                 << " has " << queued << " bytes unsent, dropping slow consumer";
        ReleaseClient(*state, s, protocol::kCloseGoingAway, "slow consumer");
    }, highWaterMarkBytes_);
    ctx->phase = ClientSessionContext::kUpgraded;
    ctx->session = session;
    ++accepted_;

    BackendSessionPtr fresh;
    size_t active = 0;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->registry.Add(session, SessionRegistry::Clock::now());
        active = state_->registry.size();
        fresh = backends_->InstallLocked(session, true);
    }
    LOG_INFO << "new client " << session->id() << " from " << conn->peerAddress().toIpPort()
             << ", active clients: " << active;
    if (fresh) {
        backends_->Dial(fresh, session, true);
    }

    // Frames sent together with the request.
    if (buf->ReadableBytes() > 0) {
        session->OnData(buf);
    }
}

void ConnectionAcceptor::Reject(const TcpConnectionPtr& conn, int status, const std::string& detail) {
    auto* ctx = std::any_cast<ClientSessionContext>(conn->GetMutableContext());
    if (ctx) ctx->phase = ClientSessionContext::kRejected;
    ++rejected_;

    LOG_WARN << "upgrade from " << conn->peerAddress().toIpPort() << " rejected with "
             << status << ": " << detail;
    conn->Send(WebSocketHandshake::BuildReject(static_cast<HttpResponse::HttpStatusCode>(status), detail).toString());
    conn->Shutdown();
}

} // namespace core
} // namespace wsproxy
