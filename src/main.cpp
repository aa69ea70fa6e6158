#include "devproxy/DevServer.h"
#include "devproxy/network/Channel.h"
#include "devproxy/network/EventLoop.h"
#include "devproxy/network/InetAddress.h"
#include "devproxy/router/ProxyRuleSet.h"
#include "devproxy/monitor/Stats.h"
#include "devproxy/common/Config.h"
#include "devproxy/common/ConfigError.h"
#include "devproxy/common/Logger.h"

#include <cerrno>
#include <csignal>
#include <cstdio>
#include <getopt.h>
#include <sys/signalfd.h>
#include <unistd.h>

int main(int argc, char* argv[]) {
    using namespace devproxy;

    std::string configFile = "../config/devproxy.conf";
    bool checkOnly = false;
    int ch;
    while ((ch = getopt(argc, argv, "c:hC")) != -1) {
        switch (ch) {
            case 'c':
                configFile = optarg;
                break;
            case 'C':
                checkOnly = true;
                break;
            case 'h':
            default:
                printf("Usage: %s [-c config_file] [-C]\n", argv[0]);
                printf("  -C  check config (including proxy rules) and exit\n");
                return 0;
        }
    }

    auto& conf = common::Config::Instance();
    if (!conf.Load(configFile)) {
        if (checkOnly) return 1;
        LOG_ERROR << "Failed to load config, using defaults.";
    }

    auto& logger = common::Logger::Instance();
    logger.SetLevel(logger.ParseLevel(conf.GetString("global", "log_level", "INFO")));
    const std::string logFile = conf.GetString("global", "log_file", "");
    if (!logFile.empty() && !logger.SetOutputFile(logFile)) {
        LOG_ERROR << "Cannot open log file " << logFile;
        return 1;
    }

    router::ProxyRuleSetPtr rules;
    try {
        rules = router::ProxyRuleSet::FromConfig(conf);
    } catch (const common::ConfigError& e) {
        LOG_ERROR << "Invalid proxy configuration: " << e.what();
        return 1;
    }

    if (checkOnly) {
        printf("OK\n");
        return 0;
    }

    const int port = conf.GetInt("global", "listen_port", 8000);
    if (port <= 0 || port > 65535) {
        LOG_ERROR << "listen_port out of range: " << port;
        return 1;
    }
    const int threads = conf.GetInt("global", "threads", 2);

    DevServer::Options opts;
    opts.router.pool.maxIdlePerOrigin = static_cast<size_t>(conf.GetInt("global", "upstream_max_idle", 16));
    opts.router.session.highWaterMark = static_cast<size_t>(conf.GetInt("global", "high_water_mark_kb", 1024)) * 1024;

    ::signal(SIGPIPE, SIG_IGN);

    network::EventLoop loop;

    // SIGINT/SIGTERM arrive as readable events instead of async handlers.
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    if (::sigprocmask(SIG_BLOCK, &mask, nullptr) != 0) {
        LOG_ERROR << "sigprocmask failed errno=" << errno;
        return 1;
    }
    const int sigfd = ::signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (sigfd < 0) {
        LOG_ERROR << "signalfd failed errno=" << errno;
        return 1;
    }
    network::Channel sigChannel(&loop, sigfd);
    sigChannel.SetReadCallback([&loop, sigfd](std::chrono::system_clock::time_point) {
        struct signalfd_siginfo info;
        if (::read(sigfd, &info, sizeof info) == static_cast<ssize_t>(sizeof info)) {
            LOG_INFO << "Received signal " << info.ssi_signo << ", shutting down";
        }
        loop.Quit();
    });
    sigChannel.EnableReading();

    {
        DevServer server(&loop, network::InetAddress(static_cast<uint16_t>(port)), rules, opts);
        server.SetThreadNum(threads);
        if (!server.Start()) {
            sigChannel.DisableAll();
            sigChannel.Remove();
            ::close(sigfd);
            return 1;
        }

        loop.Loop();
    }

    sigChannel.DisableAll();
    sigChannel.Remove();
    ::close(sigfd);
    LOG_INFO << monitor::Stats::Instance().Summary();
    return 0;
}
