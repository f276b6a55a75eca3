#pragma once

#include "wsproxy/core/ProxyOptions.h"
#include "wsproxy/core/ProxyState.h"
#include "wsproxy/protocol/WebSocketCodec.h"
#include "wsproxy/session/WebSocketSession.h"

#include <atomic>
#include <cstdint>
#include <string>

namespace wsproxy {
namespace core {

// Moves data messages between the clients and the shared backend session.
// Payloads are forwarded untouched with their original message type.
class MessageForwarder {
public:
    MessageForwarder(ProxyState* state, FanoutMode fanout)
        : state_(state), fanout_(fanout), toBackend_(0), toClients_(0) {}

    // Per-client read path: refreshes the client's activity and writes the
    // message to the current backend. Ends the client if there is no usable
    // backend.
    void OnClientMessage(const session::WebSocketSessionPtr& client,
                         protocol::Opcode opcode,
                         const std::string& payload);

    // Delivery path of one backend session lifetime.
    void OnBackendMessage(const BackendSessionPtr& backend,
                          protocol::Opcode opcode,
                          const std::string& payload);

    FanoutMode fanout() const { return fanout_; }
    uint64_t messagesToBackend() const { return toBackend_.load(); }
    uint64_t messagesToClients() const { return toClients_.load(); }

private:
    ProxyState* state_;
    const FanoutMode fanout_;
    std::atomic<uint64_t> toBackend_;
    std::atomic<uint64_t> toClients_;
};

} // namespace core
} // namespace wsproxy
