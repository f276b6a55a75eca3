#include "wsproxy/core/BackendSessionManager.h"
#include "wsproxy/core/MessageForwarder.h"
#include "wsproxy/common/Logger.h"

namespace wsproxy {
namespace core {

BackendSessionManager::BackendSessionManager(wsproxy::network::EventLoop* loop,
                                             ProxyState* state,
                                             MessageForwarder* forwarder,
                                             const ProxyOptions& options)
    : loop_(loop),
      state_(state),
      forwarder_(forwarder),
      monitorIntervalSec_(options.monitorIntervalSec),
      dialTimeoutSec_(options.dialTimeoutSec),
      maxMessageBytes_(options.maxMessageBytes),
      monitorTimer_(0),
      monitoring_(false) {
}

BackendSessionManager::~BackendSessionManager() {
    Stop();
}

BackendSessionPtr BackendSessionManager::InstallLocked(const session::WebSocketSessionPtr& trigger, bool lazy) {
    if (state_->backend) return BackendSessionPtr();

    auto backend = std::make_shared<BackendSession>(loop_, state_->backendUrl, dialTimeoutSec_, maxMessageBytes_);
    state_->backend = backend;
    state_->backendTrigger = trigger;
    ++state_->dialAttempts;
    LOG_INFO << (lazy ? "dialing" : "monitor redialing") << " backend " << state_->backendUrl.toString()
             << " as session " << backend->id() << " (attempt " << state_->dialAttempts << ")";
    return backend;
}

void BackendSessionManager::Dial(const BackendSessionPtr& backend,
                                 const session::WebSocketSessionPtr& trigger,
                                 bool lazy) {
    std::weak_ptr<session::WebSocketSession> weakTrigger(trigger);
    MessageForwarder* forwarder = forwarder_;
    backend->SetMessageCallback([forwarder](const BackendSessionPtr& b,
                                            protocol::Opcode opcode,
                                            const std::string& payload) {
        forwarder->OnBackendMessage(b, opcode, payload);
    });
    backend->SetDialFailedCallback([this, weakTrigger, lazy](const BackendSessionPtr& b, const std::string& err) {
        OnDialFailed(b, weakTrigger, lazy, err);
    });
    backend->SetClosedCallback([this](const BackendSessionPtr& b, const std::string& reason) {
        OnBackendLost(b, reason);
    });
    backend->Start();
}

void BackendSessionManager::EnsureBackend(const session::WebSocketSessionPtr& client) {
    BackendSessionPtr fresh;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->registry.Contains(client->id())) return;
        fresh = InstallLocked(client, true);
    }
    if (fresh) Dial(fresh, client, true);
}

bool BackendSessionManager::MonitorTick() {
    BackendSessionPtr fresh;
    session::WebSocketSessionPtr trigger;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->backend || state_->registry.empty()) return false;
        trigger = state_->registry.Oldest();
        fresh = InstallLocked(trigger, false);
    }
    if (!fresh) return false;
    Dial(fresh, trigger, false);
    return true;
}

void BackendSessionManager::OnDialFailed(const BackendSessionPtr& backend,
                                         const std::weak_ptr<session::WebSocketSession>& trigger,
                                         bool lazy,
                                         const std::string& err) {
    bool current = false;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->backend == backend) {
            state_->backend.reset();
            state_->backendTrigger.reset();
            current = true;
        }
    }
    LOG_ERROR << "backend dial " << backend->id() << " failed: " << err
              << (current ? "" : " (already detached)");

    if (lazy) {
        if (auto client = trigger.lock()) {
            ReleaseClient(*state_, client, protocol::kCloseInternalError, "backend unavailable");
        }
    }
}

void BackendSessionManager::OnBackendLost(const BackendSessionPtr& backend, const std::string& reason) {
    bool current = false;
    size_t clients = 0;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->backend == backend) {
            state_->backend.reset();
            state_->backendTrigger.reset();
            current = true;
        }
        clients = state_->registry.size();
    }
    if (current) {
        LOG_WARN << "backend session " << backend->id() << " lost (" << reason << "), "
                 << clients << " client(s) waiting for the monitor to redial";
    }
}

void BackendSessionManager::Start() {
    if (monitoring_) return;
    monitoring_ = true;
    monitorTimer_ = loop_->RunEvery(monitorIntervalSec_, [this]() { MonitorTick(); });
}

void BackendSessionManager::Stop() {
    if (!monitoring_) return;
    monitoring_ = false;
    loop_->Cancel(monitorTimer_);
}

uint64_t BackendSessionManager::DialAttempts() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->dialAttempts;
}

} // namespace core
} // namespace wsproxy
