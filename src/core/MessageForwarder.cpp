#include "wsproxy/core/MessageForwarder.h"
#include "wsproxy/core/BackendSession.h"
#include "wsproxy/common/Logger.h"

#include <vector>

namespace wsproxy {
namespace core {

void MessageForwarder::OnClientMessage(const session::WebSocketSessionPtr& client,
                                       protocol::Opcode opcode,
                                       const std::string& payload) {
    BackendSessionPtr backend;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->registry.Touch(client->id(), SessionRegistry::Clock::now())) {
            // Already evicted; the eviction closes it.
            return;
        }
        backend = state_->backend;
    }

    if (!backend) {
        LOG_WARN << "client " << client->id() << ": no backend session for " << payload.size() << " byte message";
        ReleaseClient(*state_, client, protocol::kCloseInternalError, "no backend session");
        return;
    }
    if (!backend->Send(opcode, payload)) {
        LOG_WARN << "client " << client->id() << ": write to backend session " << backend->id() << " failed";
        ReleaseClient(*state_, client, protocol::kCloseInternalError, "backend write failed");
        return;
    }
    ++toBackend_;
    LOG_DEBUG << "client " << client->id() << " -> backend " << backend->id() << " "
              << protocol::OpcodeName(opcode) << " " << payload.size() << " bytes";
}

void MessageForwarder::OnBackendMessage(const BackendSessionPtr& backend,
                                        protocol::Opcode opcode,
                                        const std::string& payload) {
    std::vector<session::WebSocketSessionPtr> targets;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->backend != backend) {
            // A detached backend may still drain a few frames.
            return;
        }
        if (fanout_ == FanoutMode::kBroadcast) {
            targets = state_->registry.Snapshot();
        } else if (auto trigger = state_->backendTrigger.lock()) {
            if (state_->registry.Contains(trigger->id())) targets.push_back(trigger);
        }
    }

    for (const auto& client : targets) {
        if (client->SendMessage(opcode, payload)) {
            ++toClients_;
        } else {
            ReleaseClient(*state_, client, protocol::kCloseInternalError, "client write failed");
        }
    }
    LOG_DEBUG << "backend " << backend->id() << " -> " << targets.size() << " client(s) "
              << protocol::OpcodeName(opcode) << " " << payload.size() << " bytes";
}

} // namespace core
} // namespace wsproxy
