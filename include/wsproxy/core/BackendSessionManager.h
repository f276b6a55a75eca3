#pragma once

#include "wsproxy/common/noncopyable.h"
#include "wsproxy/core/BackendSession.h"
#include "wsproxy/core/ProxyOptions.h"
#include "wsproxy/core/ProxyState.h"
#include "wsproxy/network/EventLoop.h"

#include <memory>

namespace wsproxy {
namespace core {

class MessageForwarder;

// Owns the at-most-one backend session: dials it when the first client
// arrives, redials it from a periodic monitor while clients remain, and
// forgets it when it is lost.
//
// Dialing is check-and-install: under ProxyState::mutex a connecting
// BackendSession is put into the backend field, and the caller starts it
// after unlocking.
class BackendSessionManager : wsproxy::common::noncopyable {
public:
    BackendSessionManager(wsproxy::network::EventLoop* loop,
                          ProxyState* state,
                          MessageForwarder* forwarder,
                          const ProxyOptions& options);
    ~BackendSessionManager();

    // Requires state->mutex. Returns the newly installed session, or null if
    // a backend session already exists. lazy marks a dial caused by the
    // trigger's arrival; if it fails, the trigger is released.
    BackendSessionPtr InstallLocked(const session::WebSocketSessionPtr& trigger, bool lazy);
    // Wires the forwarder and failure handling, then starts the dial.
    void Dial(const BackendSessionPtr& backend, const session::WebSocketSessionPtr& trigger, bool lazy);

    // Dials lazily for client if no backend session exists. Must be called
    // without state->mutex.
    void EnsureBackend(const session::WebSocketSessionPtr& client);

    // One monitor pass: dial if the field is null and clients are registered.
    // Returns true if a dial was started.
    bool MonitorTick();

    void Start();
    void Stop();

    uint64_t DialAttempts() const;

private:
    void OnDialFailed(const BackendSessionPtr& backend,
                      const std::weak_ptr<session::WebSocketSession>& trigger,
                      bool lazy,
                      const std::string& err);
    void OnBackendLost(const BackendSessionPtr& backend, const std::string& reason);

    wsproxy::network::EventLoop* loop_;
    ProxyState* state_;
    MessageForwarder* forwarder_;
    const double monitorIntervalSec_;
    const double dialTimeoutSec_;
    const size_t maxMessageBytes_;
    wsproxy::network::EventLoop::TimerId monitorTimer_;
    bool monitoring_;
};

} // namespace core
} // namespace wsproxy
