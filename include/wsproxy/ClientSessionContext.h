#pragma once

#include "wsproxy/protocol/HttpContext.h"
#include "wsproxy/session/WebSocketSession.h"

namespace wsproxy {

// Per-connection state of an accepted client, stored in the TcpConnection
// context:
// 1. HTTP upgrade request parsing
// 2. WebSocket session once upgraded
// 3. Rejected (response sent, waiting for the peer to hang up)
struct ClientSessionContext {
    enum Phase {
        kHandshake,
        kUpgraded,
        kRejected,
    };

    Phase phase = kHandshake;
    protocol::HttpContext http;
    session::WebSocketSessionPtr session;
};

} // namespace wsproxy
