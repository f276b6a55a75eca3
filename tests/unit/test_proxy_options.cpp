#include "wsproxy/core/ProxyOptions.h"
#include "wsproxy/common/Config.h"
#include "wsproxy/common/Logger.h"

#include <cassert>
#include <string>

using wsproxy::common::Config;
using wsproxy::common::Logger;
using wsproxy::common::LogLevel;
using wsproxy::core::FanoutMode;
using wsproxy::core::ProxyOptions;

static ProxyOptions load(const std::string& ini) {
    Config& conf = Config::Instance();
    assert(conf.LoadFromString(ini));
    return ProxyOptions::FromConfig(conf);
}

static void testDefaults() {
    ProxyOptions opts = load("");
    assert(opts.listenAddr == "0.0.0.0");
    assert(opts.listenPort == 8080);
    assert(opts.threads == 0);
    assert(opts.logLevel == "INFO");
    assert(opts.backendUrl == "ws://127.0.0.1:9000/");
    assert(opts.path == "/ws");
    assert(opts.idleTimeoutSec == 30.0);
    assert(opts.sweepIntervalSec == 5.0);
    assert(opts.monitorIntervalSec == 10.0);
    assert(opts.dialTimeoutSec == 10.0);
    assert(opts.fanout == FanoutMode::kBroadcast);
    assert(opts.maxMessageBytes == 16u * 1024u * 1024u);
    assert(opts.clientHighWaterMarkBytes == 8u * 1024u * 1024u);

    std::string err;
    assert(opts.Validate(&err));
}

static void testFromConfig() {
    ProxyOptions opts = load(
        "# comment\n"
        "[global]\n"
        "listen_addr = 127.0.0.1\n"
        "listen_port = 9100\n"
        "threads = 4\n"
        "log_level = DEBUG\n"
        "\n"
        "[proxy]\n"
        "backend_url = ws://10.0.0.5:7000/feed\n"
        "path = /live\n"
        "idle_timeout_sec = 2.5\n"
        "sweep_interval_sec = 0.5\n"
        "monitor_interval_sec = 3\n"
        "dial_timeout_sec = 1\n"
        "fanout = trigger\n"
        "max_message_bytes = 4096\n"
        "client_high_water_mark_bytes = 65536\n");
    assert(opts.listenAddr == "127.0.0.1");
    assert(opts.listenPort == 9100);
    assert(opts.threads == 4);
    assert(opts.logLevel == "DEBUG");
    assert(opts.backendUrl == "ws://10.0.0.5:7000/feed");
    assert(opts.path == "/live");
    assert(opts.idleTimeoutSec == 2.5);
    assert(opts.sweepIntervalSec == 0.5);
    assert(opts.monitorIntervalSec == 3.0);
    assert(opts.dialTimeoutSec == 1.0);
    assert(opts.fanout == FanoutMode::kTrigger);
    assert(opts.maxMessageBytes == 4096);
    assert(opts.clientHighWaterMarkBytes == 65536);

    std::string err;
    assert(opts.Validate(&err));
}

static void expectInvalid(const std::string& ini, const std::string& needle) {
    ProxyOptions opts = load(ini);
    std::string err;
    assert(!opts.Validate(&err));
    assert(err.find(needle) != std::string::npos);
}

static void testValidate() {
    expectInvalid("[proxy]\nfanout = everyone\n", "fanout");
    expectInvalid("[proxy]\nbackend_url = wss://secure/\n", "backend_url");
    expectInvalid("[proxy]\nbackend_url = not a url\n", "backend_url");
    expectInvalid("[proxy]\nidle_timeout_sec = 0\n", "positive");
    expectInvalid("[proxy]\nsweep_interval_sec = -1\n", "positive");
    expectInvalid("[proxy]\nmonitor_interval_sec = 0\n", "positive");
    expectInvalid("[proxy]\ndial_timeout_sec = 0\n", "positive");
    expectInvalid("[proxy]\npath = ws\n", "path");
    expectInvalid("[proxy]\nmax_message_bytes = 0\n", "max_message_bytes");
    expectInvalid("[proxy]\nclient_high_water_mark_bytes = 0\n", "client_high_water_mark_bytes");
    expectInvalid("[global]\nlisten_port = 70000\n", "listen_port");
    expectInvalid("[global]\nlisten_addr = localhost\n", "listen_addr");
    expectInvalid("[global]\nthreads = -2\n", "threads");

    // Unparsable numbers keep their defaults.
    ProxyOptions opts = load("[proxy]\nidle_timeout_sec = soon\n");
    assert(opts.idleTimeoutSec == 30.0);
    std::string err;
    assert(opts.Validate(&err));
}

static void testOverrides() {
    // What the command line does for -b and -l.
    Config& conf = Config::Instance();
    assert(conf.LoadFromString("[proxy]\nbackend_url = ws://a:1/\n"));
    conf.SetString("proxy", "backend_url", "ws://b:2/x");
    conf.SetString("global", "listen_port", "9555");
    ProxyOptions opts = ProxyOptions::FromConfig(conf);
    assert(opts.backendUrl == "ws://b:2/x");
    assert(opts.listenPort == 9555);
}

static void testFanoutNames() {
    FanoutMode mode = FanoutMode::kBroadcast;
    assert(wsproxy::core::ParseFanoutMode("trigger", &mode));
    assert(mode == FanoutMode::kTrigger);
    assert(std::string(wsproxy::core::FanoutModeName(mode)) == "trigger");
    assert(!wsproxy::core::ParseFanoutMode("Broadcast ", &mode));
    assert(mode == FanoutMode::kTrigger);
}

int main() {
    Logger::Instance().SetLevel(LogLevel::ERROR);
    testDefaults();
    testFromConfig();
    testValidate();
    testOverrides();
    testFanoutNames();
    return 0;
}
