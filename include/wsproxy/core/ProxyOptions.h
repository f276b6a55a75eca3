#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace wsproxy {
namespace common {
class Config;
}
namespace core {

enum class FanoutMode {
    kBroadcast, // every registered client receives backend messages
    kTrigger,   // only the client that caused the current backend dial
};

const char* FanoutModeName(FanoutMode mode);
bool ParseFanoutMode(const std::string& name, FanoutMode* out);

struct ProxyOptions {
    std::string listenAddr{"0.0.0.0"};
    uint16_t listenPort{8080};
    int threads{0};
    std::string logLevel{"INFO"};

    std::string backendUrl{"ws://127.0.0.1:9000/"};
    std::string path{"/ws"};
    double idleTimeoutSec{30.0};
    double sweepIntervalSec{5.0};
    double monitorIntervalSec{10.0};
    double dialTimeoutSec{10.0};
    FanoutMode fanout{FanoutMode::kBroadcast};
    size_t maxMessageBytes{16 * 1024 * 1024};
    // A client whose unsent output reaches this many bytes is dropped.
    size_t clientHighWaterMarkBytes{8 * 1024 * 1024};

    // Reads [global] and [proxy]. Values that do not parse keep their
    // defaults, except an unknown fanout which Validate() reports.
    static ProxyOptions FromConfig(common::Config& config);

    bool Validate(std::string* err) const;

    // Raw [proxy] fanout value as read by FromConfig(); empty otherwise.
    std::string fanoutText;
};

} // namespace core
} // namespace wsproxy
