#pragma once

#include "wsproxy/core/ProxyOptions.h"
#include "wsproxy/core/ProxyState.h"
#include "wsproxy/network/Callbacks.h"

#include <chrono>
#include <cstdint>
#include <atomic>
#include <string>

namespace wsproxy {
namespace network {
class Buffer;
}
namespace core {

class BackendSessionManager;
class MessageForwarder;

// Turns accepted TCP connections into registered client sessions: parses the
// upgrade request, answers it, registers the session and makes sure a
// backend session exists. Installed as the TcpServer's connection and
// message callbacks.
class ConnectionAcceptor {
public:
    ConnectionAcceptor(ProxyState* state,
                       BackendSessionManager* backends,
                       MessageForwarder* forwarder,
                       const ProxyOptions& options);

    void OnConnection(const wsproxy::network::TcpConnectionPtr& conn);
    void OnMessage(const wsproxy::network::TcpConnectionPtr& conn,
                   wsproxy::network::Buffer* buf,
                   std::chrono::system_clock::time_point receiveTime);

    uint64_t upgradesAccepted() const { return accepted_.load(); }
    uint64_t upgradesRejected() const { return rejected_.load(); }

private:
    void Upgrade(const wsproxy::network::TcpConnectionPtr& conn, wsproxy::network::Buffer* buf);
    void Reject(const wsproxy::network::TcpConnectionPtr& conn, int status, const std::string& detail);

    ProxyState* state_;
    BackendSessionManager* backends_;
    MessageForwarder* forwarder_;
    const std::string path_;
    const size_t maxMessageBytes_;
    const size_t highWaterMarkBytes_;
    std::atomic<uint64_t> accepted_;
    std::atomic<uint64_t> rejected_;
};

} // namespace core
} // namespace wsproxy
