#pragma once

#include "wsproxy/core/SessionRegistry.h"
#include "wsproxy/protocol/BackendUrl.h"

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace wsproxy {
namespace core {

class BackendSession;
using BackendSessionPtr = std::shared_ptr<BackendSession>;

// Everything the proxy components share, guarded by one mutex.
//
// Invariants, checked at every unlock:
//  - backend is non-null only while registry is non-empty;
//  - at most one BackendSession is installed at a time (connecting or open).
//
// No socket I/O and no session Close() happens while mutex is held; code
// collects what must be closed and closes it after unlocking.
struct ProxyState {
    std::mutex mutex;
    SessionRegistry registry;
    BackendSessionPtr backend;
    // Client whose arrival (or, for a monitor redial, the oldest client)
    // caused the current backend to be dialed.
    std::weak_ptr<session::WebSocketSession> backendTrigger;
    SessionRegistry::Clock::duration idleTimeout{std::chrono::seconds(30)};
    protocol::BackendUrl backendUrl;
    uint64_t dialAttempts{0};
};

// Removes the client from the registry and closes it. When that empties the
// registry the backend is detached and closed as well. Safe to call more than
// once and from any thread; must not be called with state.mutex held.
void ReleaseClient(ProxyState& state,
                   const session::WebSocketSessionPtr& client,
                   uint16_t code,
                   const std::string& reason);

} // namespace core
} // namespace wsproxy
