#include "wsproxy/core/ProxyState.h"
#include "wsproxy/core/BackendSession.h"
#include "wsproxy/common/Logger.h"

namespace wsproxy {
namespace core {

void ReleaseClient(ProxyState& state,
                   const session::WebSocketSessionPtr& client,
                   uint16_t code,
                   const std::string& reason) {
    if (!client) return;

    bool removed = false;
    size_t remaining = 0;
    BackendSessionPtr detached;
    {
        std::lock_guard<std::mutex> lock(state.mutex);
        removed = static_cast<bool>(state.registry.Remove(client->id()));
        remaining = state.registry.size();
        if (removed && state.registry.empty() && state.backend) {
            detached.swap(state.backend);
            state.backendTrigger.reset();
        }
    }

    client->Close(code, reason);
    if (removed) {
        LOG_INFO << "client " << client->id() << " [" << client->name() << "] released: " << reason
                 << ", active clients: " << remaining;
    }
    if (detached) {
        LOG_INFO << "no active clients, closing backend session " << detached->id();
        detached->Close();
    }
}

} // namespace core
} // namespace wsproxy
