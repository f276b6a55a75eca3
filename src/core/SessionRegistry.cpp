#include "wsproxy/core/SessionRegistry.h"

namespace wsproxy {
namespace core {

bool SessionRegistry::Add(const session::WebSocketSessionPtr& session, Clock::time_point now) {
    Entry entry;
    entry.session = session;
    entry.lastActive = now;
    return entries_.emplace(session->id(), std::move(entry)).second;
}

session::WebSocketSessionPtr SessionRegistry::Remove(uint64_t id) {
    auto it = entries_.find(id);
    if (it == entries_.end()) return session::WebSocketSessionPtr();
    session::WebSocketSessionPtr removed = std::move(it->second.session);
    entries_.erase(it);
    return removed;
}

bool SessionRegistry::Touch(uint64_t id, Clock::time_point now) {
    auto it = entries_.find(id);
    if (it == entries_.end()) return false;
    it->second.lastActive = now;
    return true;
}

std::vector<session::WebSocketSessionPtr> SessionRegistry::RemoveIdle(Clock::time_point now,
                                                                      Clock::duration timeout) {
    std::vector<session::WebSocketSessionPtr> idle;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (now - it->second.lastActive > timeout) {
            idle.push_back(std::move(it->second.session));
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }
    return idle;
}

std::vector<session::WebSocketSessionPtr> SessionRegistry::Snapshot() const {
    std::vector<session::WebSocketSessionPtr> all;
    all.reserve(entries_.size());
    for (const auto& item : entries_) {
        all.push_back(item.second.session);
    }
    return all;
}

session::WebSocketSessionPtr SessionRegistry::Oldest() const {
    if (entries_.empty()) return session::WebSocketSessionPtr();
    return entries_.begin()->second.session;
}

std::vector<session::WebSocketSessionPtr> SessionRegistry::Clear() {
    std::vector<session::WebSocketSessionPtr> all = Snapshot();
    entries_.clear();
    return all;
}

bool SessionRegistry::LastActive(uint64_t id, Clock::time_point* out) const {
    auto it = entries_.find(id);
    if (it == entries_.end()) return false;
    *out = it->second.lastActive;
    return true;
}

} // namespace core
} // namespace wsproxy
