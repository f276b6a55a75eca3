#include "wsproxy/ProxyServer.h"
#include "wsproxy/core/BackendSession.h"
#include "wsproxy/common/Logger.h"

#include <chrono>
#include <vector>

namespace wsproxy {

namespace {

std::chrono::steady_clock::duration ToDuration(double sec) {
    return std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(sec));
}

} // namespace

ProxyServer::ProxyServer(network::EventLoop* loop,
                         const core::ProxyOptions& options,
                         const std::string& name)
    : loop_(loop),
      options_(options),
      urlValid_(false),
      started_(false),
      forwarder_(&state_, options.fanout),
      manager_(loop, &state_, &forwarder_, options),
      reaper_(loop, &state_, options.sweepIntervalSec),
      acceptor_(&state_, &manager_, &forwarder_, options),
      server_(loop, network::InetAddress(options.listenAddr, options.listenPort), name) {
    state_.idleTimeout = ToDuration(options.idleTimeoutSec);

    std::string err;
    urlValid_ = protocol::BackendUrl::Parse(options.backendUrl, &state_.backendUrl, &err);
    if (!urlValid_) {
        LOG_ERROR << "ProxyServer: invalid backend url '" << options.backendUrl << "': " << err;
    }

    server_.SetThreadNum(options.threads);
    server_.SetConnectionCallback(
        [this](const network::TcpConnectionPtr& conn) { acceptor_.OnConnection(conn); });
    server_.SetMessageCallback(
        [this](const network::TcpConnectionPtr& conn,
               network::Buffer* buf,
               std::chrono::system_clock::time_point receiveTime) {
            acceptor_.OnMessage(conn, buf, receiveTime);
        });
}

ProxyServer::~ProxyServer() {
    Stop();
}

bool ProxyServer::Start() {
    if (started_) return true;
    if (!urlValid_) return false;
    if (!server_.Start()) {
        LOG_ERROR << "ProxyServer: cannot listen on " << server_.hostport();
        return false;
    }
    started_ = true;
    reaper_.Start();
    manager_.Start();
    LOG_INFO << "ProxyServer listening on " << server_.hostport() << options_.path
             << ", backend " << state_.backendUrl.toString()
             << ", fanout " << core::FanoutModeName(options_.fanout)
             << ", idle timeout " << options_.idleTimeoutSec << "s";
    return true;
}

void ProxyServer::Stop() {
    if (!started_) return;
    started_ = false;

    manager_.Stop();
    reaper_.Stop();
    server_.Stop();

    std::vector<session::WebSocketSessionPtr> clients;
    core::BackendSessionPtr backend;
    {
        std::lock_guard<std::mutex> lock(state_.mutex);
        clients = state_.registry.Clear();
        backend.swap(state_.backend);
        state_.backendTrigger.reset();
    }
    for (const auto& client : clients) {
        client->Close(protocol::kCloseGoingAway, "proxy shutting down");
    }
    if (backend) backend->Close();
    LOG_INFO << "ProxyServer stopped, closed " << clients.size() << " client(s)";
}

size_t ProxyServer::ClientCount() {
    std::lock_guard<std::mutex> lock(state_.mutex);
    return state_.registry.size();
}

bool ProxyServer::HasBackend() {
    std::lock_guard<std::mutex> lock(state_.mutex);
    return static_cast<bool>(state_.backend);
}

} // namespace wsproxy
