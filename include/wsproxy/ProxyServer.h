#pragma once

#include "wsproxy/common/noncopyable.h"
#include "wsproxy/core/BackendSessionManager.h"
#include "wsproxy/core/ConnectionAcceptor.h"
#include "wsproxy/core/IdleReaper.h"
#include "wsproxy/core/MessageForwarder.h"
#include "wsproxy/core/ProxyOptions.h"
#include "wsproxy/core/ProxyState.h"
#include "wsproxy/network/EventLoop.h"
#include "wsproxy/network/TcpServer.h"

#include <memory>
#include <string>

namespace wsproxy {

// WebSocket proxy that shares one backend WebSocket between all of its
// clients. Timers and the backend connection live on the base loop; client
// connections are spread over `threads` I/O loops.
//
// Stop() must be called (and the loop must have stopped) before the server
// is destroyed.
class ProxyServer : wsproxy::common::noncopyable {
public:
    ProxyServer(network::EventLoop* loop,
                const core::ProxyOptions& options,
                const std::string& name = "WsProxy");
    ~ProxyServer();

    // Binds the listener and starts the reaper and the backend monitor.
    // Must run in the loop thread. Returns false if the proxy cannot serve.
    bool Start();
    // Stops accepting, closes every client and the backend session.
    void Stop();

    size_t ClientCount();
    bool HasBackend();
    uint64_t DialAttempts() const { return manager_.DialAttempts(); }

    const core::MessageForwarder& forwarder() const { return forwarder_; }
    const core::ConnectionAcceptor& acceptor() const { return acceptor_; }

private:
    network::EventLoop* loop_;
    const core::ProxyOptions options_;
    bool urlValid_;
    bool started_;

    core::ProxyState state_;
    core::MessageForwarder forwarder_;
    core::BackendSessionManager manager_;
    core::IdleReaper reaper_;
    core::ConnectionAcceptor acceptor_;
    network::TcpServer server_;
};

} // namespace wsproxy
