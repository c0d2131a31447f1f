#include "gateway/GatewayServer.h"
#include "gateway/common/Config.h"
#include "gateway/common/Logger.h"
#include "gateway/network/EventLoop.h"
#include "gateway/network/InetAddress.h"

#include <getopt.h>
#include <unistd.h>

#include <cstdio>
#include <exception>
#include <string>

int main(int argc, char* argv[]) {
    using namespace gateway;

    std::string configFile = "../config/gateway.conf";
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
                printf("  -C  check config and exit\n");
                return 0;
        }
    }

    auto& conf = common::Config::Instance();
    if (!conf.Load(configFile)) {
        if (checkOnly) {
            printf("FAILED: cannot read %s\n", configFile.c_str());
            return 1;
        }
        LOG_ERROR << "Failed to load config " << configFile << ", using defaults.";
    }
    common::Logger::Instance().SetLevel(common::Logger::Instance().ParseLevel(conf.GetString("global", "log_level", "INFO")));

    uint16_t port = static_cast<uint16_t>(conf.GetInt("global", "listen_port", 8080));
    int threads = conf.GetInt("global", "threads", 4);
    std::string name = conf.GetString("global", "service_name", "datum-gateway");
    double idleTimeoutSec = conf.GetDouble("global", "idle_timeout_sec", 0.0);

    network::EventLoop loop;

    if (checkOnly) {
        // Parse everything into a throwaway server without listening.
        GatewayServer dryRun(&loop, network::InetAddress(0, true), name);
        dryRun.EnableHealthMonitor(false);
        if (!dryRun.ApplyConfig(conf)) {
            printf("FAILED: see log for the offending sections\n");
            return 1;
        }
        printf("OK\n");
        return 0;
    }

    LOG_INFO << "Starting " << name << " on port " << port << "...";

    try {
        GatewayServer server(&loop, network::InetAddress(port), name);
        server.SetThreadNum(threads);
        if (idleTimeoutSec > 0) {
            server.SetIdleTimeout(idleTimeoutSec);
        }
        server.SetStatusPaths(conf.GetString("global", "live_path", "/healthz"),
                             conf.GetString("global", "ready_path", "/readyz"),
                             conf.GetString("global", "metrics_path", "/metrics"));
        if (!server.ApplyConfig(conf)) {
            LOG_WARN << "Some configuration sections were skipped";
        }
        server.HandleSignals(configFile);
        server.Start();
        loop.Loop();
    } catch (const std::exception& e) {
        LOG_ERROR << "Fatal: " << e.what();
        return 1;
    }

    LOG_INFO << name << " stopped";
    return 0;
}
