#pragma once

#include "wsproxy/session/WebSocketSession.h"

#include <chrono>
#include <cstdint>
#include <map>
#include <vector>

namespace wsproxy {
namespace core {

// Live client sessions and their last inbound activity. Not synchronized:
// every access happens under ProxyState::mutex.
class SessionRegistry {
public:
    using Clock = std::chrono::steady_clock;

    struct Entry {
        session::WebSocketSessionPtr session;
        Clock::time_point lastActive;
    };

    // Returns false if the session is already registered.
    bool Add(const session::WebSocketSessionPtr& session, Clock::time_point now);
    // Returns the removed session, or null if it was not registered.
    session::WebSocketSessionPtr Remove(uint64_t id);
    // Refreshes the activity timestamp. Returns false if not registered.
    bool Touch(uint64_t id, Clock::time_point now);

    bool Contains(uint64_t id) const { return entries_.count(id) != 0; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    // Removes and returns every session idle for strictly longer than timeout.
    std::vector<session::WebSocketSessionPtr> RemoveIdle(Clock::time_point now, Clock::duration timeout);
    std::vector<session::WebSocketSessionPtr> Snapshot() const;
    // Earliest registered session still present.
    session::WebSocketSessionPtr Oldest() const;
    std::vector<session::WebSocketSessionPtr> Clear();

    bool LastActive(uint64_t id, Clock::time_point* out) const;

private:
    // Session ids grow monotonically, so map order is registration order.
    std::map<uint64_t, Entry> entries_;
};

} // namespace core
} // namespace wsproxy
