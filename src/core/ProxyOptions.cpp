#include "wsproxy/core/ProxyOptions.h"
#include "wsproxy/common/Config.h"
#include "wsproxy/network/InetAddress.h"
#include "wsproxy/protocol/BackendUrl.h"

namespace wsproxy {
namespace core {

const char* FanoutModeName(FanoutMode mode) {
    switch (mode) {
        case FanoutMode::kBroadcast: return "broadcast";
        case FanoutMode::kTrigger: return "trigger";
    }
    return "unknown";
}

bool ParseFanoutMode(const std::string& name, FanoutMode* out) {
    if (name == "broadcast") {
        *out = FanoutMode::kBroadcast;
        return true;
    }
    if (name == "trigger") {
        *out = FanoutMode::kTrigger;
        return true;
    }
    return false;
}

ProxyOptions ProxyOptions::FromConfig(common::Config& config) {
    ProxyOptions opts;
    opts.listenAddr = config.GetString("global", "listen_addr", opts.listenAddr);
    const int port = config.GetInt("global", "listen_port", opts.listenPort);
    opts.listenPort = (port > 0 && port <= 65535) ? static_cast<uint16_t>(port) : 0;
    opts.threads = config.GetInt("global", "threads", opts.threads);
    opts.logLevel = config.GetString("global", "log_level", opts.logLevel);

    opts.backendUrl = config.GetString("proxy", "backend_url", opts.backendUrl);
    opts.path = config.GetString("proxy", "path", opts.path);
    opts.idleTimeoutSec = config.GetDouble("proxy", "idle_timeout_sec", opts.idleTimeoutSec);
    opts.sweepIntervalSec = config.GetDouble("proxy", "sweep_interval_sec", opts.sweepIntervalSec);
    opts.monitorIntervalSec = config.GetDouble("proxy", "monitor_interval_sec", opts.monitorIntervalSec);
    opts.dialTimeoutSec = config.GetDouble("proxy", "dial_timeout_sec", opts.dialTimeoutSec);
    opts.fanoutText = config.GetString("proxy", "fanout", FanoutModeName(opts.fanout));
    if (!ParseFanoutMode(opts.fanoutText, &opts.fanout)) {
        opts.fanout = FanoutMode::kBroadcast;
    }
    const int maxBytes = config.GetInt("proxy", "max_message_bytes", static_cast<int>(opts.maxMessageBytes));
    opts.maxMessageBytes = maxBytes > 0 ? static_cast<size_t>(maxBytes) : 0;
    const int hwm = config.GetInt("proxy", "client_high_water_mark_bytes",
                                  static_cast<int>(opts.clientHighWaterMarkBytes));
    opts.clientHighWaterMarkBytes = hwm > 0 ? static_cast<size_t>(hwm) : 0;
    return opts;
}

bool ProxyOptions::Validate(std::string* err) const {
    if (listenPort == 0) {
        if (err) *err = "listen_port must be in 1..65535";
        return false;
    }
    if (!network::InetAddress::Parse(listenAddr, listenPort, nullptr)) {
        if (err) *err = "listen_addr '" + listenAddr + "' is not an IPv4 address";
        return false;
    }
    if (threads < 0) {
        if (err) *err = "threads must not be negative";
        return false;
    }
    if (path.empty() || path[0] != '/') {
        if (err) *err = "path must start with '/'";
        return false;
    }
    if (idleTimeoutSec <= 0.0 || sweepIntervalSec <= 0.0 ||
        monitorIntervalSec <= 0.0 || dialTimeoutSec <= 0.0) {
        if (err) *err = "timeouts and intervals must be positive";
        return false;
    }
    FanoutMode mode;
    if (!fanoutText.empty() && !ParseFanoutMode(fanoutText, &mode)) {
        if (err) *err = "unknown fanout mode '" + fanoutText + "'";
        return false;
    }
    if (maxMessageBytes == 0) {
        if (err) *err = "max_message_bytes must be positive";
        return false;
    }
    if (clientHighWaterMarkBytes == 0) {
        if (err) *err = "client_high_water_mark_bytes must be positive";
        return false;
    }
    protocol::BackendUrl url;
    std::string urlErr;
    if (!protocol::BackendUrl::Parse(backendUrl, &url, &urlErr)) {
        if (err) *err = "backend_url: " + urlErr;
        return false;
    }
    return true;
}

} // namespace core
} // namespace wsproxy
