#include "wsproxy/ProxyServer.h"
#include "wsproxy/network/Channel.h"
#include "wsproxy/network/EventLoop.h"
#include "wsproxy/common/Logger.h"
#include "wsproxy/common/Config.h"

#include <unistd.h>
#include <getopt.h>
#include <signal.h>
#include <sys/signalfd.h>
#include <cstdio>
#include <cstdlib>
#include <memory>

namespace {

void Usage(const char* prog) {
    printf("Usage: %s [-c config_file] [-b backend_url] [-l listen_port] [-C]\n", prog);
    printf("  -c  configuration file (default ../config/wsproxy.conf)\n");
    printf("  -b  backend WebSocket url, overrides [proxy] backend_url\n");
    printf("  -l  listen port, overrides [global] listen_port\n");
    printf("  -C  check config and exit\n");
}

// SIGINT/SIGTERM are blocked and read from a signalfd on the base loop, so
// shutdown runs as an ordinary loop callback.
int WatchTerminationSignals(wsproxy::network::EventLoop* loop,
                            std::unique_ptr<wsproxy::network::Channel>* channel) {
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    if (::pthread_sigmask(SIG_BLOCK, &mask, nullptr) != 0) {
        return -1;
    }
    int fd = ::signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (fd < 0) {
        return -1;
    }
    channel->reset(new wsproxy::network::Channel(loop, fd));
    (*channel)->SetReadCallback([loop, fd](std::chrono::system_clock::time_point) {
        struct signalfd_siginfo info;
        ssize_t n = ::read(fd, &info, sizeof info);
        if (n != static_cast<ssize_t>(sizeof info)) return;
        LOG_INFO << "received signal " << info.ssi_signo << ", shutting down";
        loop->Quit();
    });
    (*channel)->EnableReading();
    return fd;
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace wsproxy;

    std::string configFile = "../config/wsproxy.conf";
    std::string backendOverride;
    std::string portOverride;
    bool checkOnly = false;
    int ch;
    while ((ch = getopt(argc, argv, "c:b:l:hC")) != -1) {
        switch (ch) {
            case 'c':
                configFile = optarg;
                break;
            case 'b':
                backendOverride = optarg;
                break;
            case 'l':
                portOverride = optarg;
                break;
            case 'C':
                checkOnly = true;
                break;
            case 'h':
                Usage(argv[0]);
                return 0;
            default:
                Usage(argv[0]);
                return 2;
        }
    }

    auto& conf = common::Config::Instance();
    if (!conf.Load(configFile)) {
        LOG_WARN << "Failed to load config " << configFile << ", using defaults.";
    }
    if (!backendOverride.empty()) conf.SetString("proxy", "backend_url", backendOverride);
    if (!portOverride.empty()) conf.SetString("global", "listen_port", portOverride);

    core::ProxyOptions options = core::ProxyOptions::FromConfig(conf);
    common::Logger::Instance().SetLevel(common::Logger::Instance().ParseLevel(options.logLevel));

    std::string err;
    if (!options.Validate(&err)) {
        LOG_ERROR << "invalid configuration: " << err;
        if (checkOnly) printf("ERROR: %s\n", err.c_str());
        return 1;
    }
    if (checkOnly) {
        printf("OK\n");
        return 0;
    }

    network::EventLoop loop;
    std::unique_ptr<network::Channel> signalChannel;
    int signalFd = WatchTerminationSignals(&loop, &signalChannel);
    if (signalFd < 0) {
        LOG_WARN << "cannot watch SIGINT/SIGTERM, stop the proxy with SIGKILL";
    }

    int status = 0;
    {
        ProxyServer server(&loop, options);
        if (server.Start()) {
            loop.Loop();
        } else {
            status = 1;
        }
        server.Stop();
    }

    if (signalChannel) {
        signalChannel->DisableAll();
        signalChannel->Remove();
        signalChannel.reset();
        ::close(signalFd);
    }
    return status;
}
