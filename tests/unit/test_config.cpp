#include "gateway/GatewayServer.h"
#include "gateway/common/Config.h"
#include "gateway/common/Logger.h"
#include "gateway/network/EventLoop.h"
#include "gateway/network/InetAddress.h"

#include <cassert>
#include <string>

using gateway::GatewayServer;
using gateway::common::Config;
using gateway::route::HashKeySource;
using gateway::route::LbStrategy;
using gateway::route::PathMatchKind;
using gateway::route::Route;

static const char* kConfig =
    "; comment\n"
    "[global]\n"
    "listen_port = 8088\n"
    "log_level = WARN\n"
    "[health_check]\n"
    "mode = tcp\n"
    "interval = 2.5\n"
    "[circuit_breaker]\n"
    "failure_threshold = 2\n"
    "cooldown_ms = 500\n"
    "[service:default/users]\n"
    "endpoints = 127.0.0.1:9001, 127.0.0.1:9002\n"
    "health_path = /ping\n"
    "[route:zeta]\n"
    "path = /z/\n"
    "destinations = default/users\n"
    "[endpoint:extra]\n"
    "service = default/orders\n"
    "ip = 127.0.0.1\n"
    "port = 9101\n"
    "ready = 0\n"
    "[route:alpha]\n"
    "path = /a/*\n"
    "methods = get, post\n"
    "headers = X-Tenant=acme; X-Env=prod\n"
    "destinations = default/users:70, default/orders:30\n"
    "strategy = consistent-hash\n"
    "hash_key = header:X-User\n"
    "timeout_ms = 2000\n"
    "connect_timeout_ms = 300\n"
    "max_retries = 1\n"
    "retry_on = 503, timeout\n"
    "backoff_initial_ms = 20\n"
    "backoff_max_ms = 80\n"
    "[route:broken]\n"
    "path = /broken\n"
    "strategy = fastest\n"
    "destinations = default/users\n";

void testSectionsKeepDeclarationOrder() {
    Config& conf = Config::Instance();
    assert(conf.LoadFromString(kConfig));
    assert(conf.GetInt("global", "listen_port", 0) == 8088);
    assert(conf.GetDouble("health_check", "interval", 0) == 2.5);
    assert(conf.GetString("global", "missing", "dflt") == "dflt");

    auto routes = conf.GetSectionsWithPrefix("route:");
    assert(routes.size() == 3);
    assert(routes[0].first == "route:zeta");
    assert(routes[1].first == "route:alpha");
    assert(routes[2].first == "route:broken");

    auto items = Config::SplitList(" a, ,b ,c ");
    assert(items.size() == 3 && items[1] == "b");
    LOG_INFO << "Config order PASS";
}

void testParseRoute() {
    Config& conf = Config::Instance();
    auto routes = conf.GetSectionsWithPrefix("route:");

    Route alpha;
    std::string error;
    assert(GatewayServer::ParseRoute("alpha", routes[1].second, &alpha, &error));
    assert(alpha.match.kind == PathMatchKind::kWildcard);
    assert(alpha.match.methods.count("GET") == 1 && alpha.match.methods.count("POST") == 1);
    assert(alpha.match.headers.size() == 2);
    assert(alpha.match.headers[1].first == "X-Env" && alpha.match.headers[1].second == "prod");
    assert(alpha.destinations.size() == 2);
    assert(alpha.destinations[0].serviceId == "default/users" && alpha.destinations[0].weight == 70);
    assert(alpha.strategy == LbStrategy::kConsistentHash);
    assert(alpha.hashKey.kind == HashKeySource::kHeader && alpha.hashKey.header == "X-User");
    assert(alpha.timeout.requestTimeoutMs == 2000);
    assert(alpha.timeout.connectTimeoutMs == 300);
    assert(alpha.retry.maxRetries == 1);
    assert(alpha.retry.retryableStatuses.size() == 1 && alpha.retry.retryableStatuses.count(503) == 1);
    assert(alpha.retry.retryOnTimeout);
    assert(!alpha.retry.retryOnConnectFailure);
    assert(alpha.retry.initialBackoffMs == 20 && alpha.retry.maxBackoffMs == 80);

    Route zeta;
    assert(GatewayServer::ParseRoute("zeta", routes[0].second, &zeta, &error));
    assert(zeta.match.kind == PathMatchKind::kPrefix);
    assert(zeta.strategy == LbStrategy::kRoundRobin);
    assert(zeta.retry.retryableStatuses.size() == 3);

    Route broken;
    error.clear();
    assert(!GatewayServer::ParseRoute("broken", routes[2].second, &broken, &error));
    assert(!error.empty());

    Config::Section noDest;
    noDest["path"] = "/x";
    Route r;
    assert(!GatewayServer::ParseRoute("nodest", noDest, &r, &error));
    LOG_INFO << "ParseRoute PASS";
}

void testApplyConfig() {
    gateway::network::EventLoop loop;
    GatewayServer server(&loop, gateway::network::InetAddress(0, true));
    server.EnableHealthMonitor(false);

    // the broken route is skipped and reported
    assert(!server.ApplyConfig(Config::Instance()));

    auto snapshot = server.routes().Snapshot();
    assert(snapshot->size() == 2);
    assert((*snapshot)[0]->id == "zeta");
    assert((*snapshot)[1]->id == "alpha");

    assert(server.registry().Lookup("default/users").size() == 2);
    assert(server.registry().HealthCheckFor("default/users").path == "/ping");
    assert(server.registry().HealthCheckFor("default/users").mode == "tcp");
    auto orders = server.registry().Lookup("default/orders");
    assert(orders.size() == 1 && !orders[0]->healthy());
    assert(server.breakers().Get("127.0.0.1:9001")->config().failureThreshold == 2);

    const std::string dump = server.DumpRoutes();
    assert(dump.find("alpha wildcard /a/*") != std::string::npos);
    assert(server.DumpEndpoints().find("127.0.0.1:9002 UP") != std::string::npos);
    LOG_INFO << "ApplyConfig PASS";
}

void testEndpointAddressParsing() {
    using gateway::network::InetAddress;
    std::string host;
    uint16_t port = 0;
    assert(InetAddress::ParseHostPort("10.0.0.7:8080", &host, &port));
    assert(host == "10.0.0.7" && port == 8080);
    assert(InetAddress::ParseHostPort("users.internal:65535", &host, &port));
    assert(host == "users.internal" && port == 65535);

    assert(!InetAddress::ParseHostPort("10.0.0.7", &host, &port));
    assert(!InetAddress::ParseHostPort(":80", &host, &port));
    assert(!InetAddress::ParseHostPort("10.0.0.7:0", &host, &port));
    assert(!InetAddress::ParseHostPort("10.0.0.7:65536", &host, &port));
    assert(!InetAddress::ParseHostPort("10.0.0.7:80x", &host, &port));
    assert(!InetAddress::ParseHostPort("fe80::1:80", &host, &port));

    assert(InetAddress::ParsePort(" 9001 ", &port) && port == 9001);
    assert(!InetAddress::ParsePort("", &port));
    assert(!InetAddress::ParsePort("-1", &port));
    assert(!InetAddress::ParsePort("99999999999999999999", &port));
    LOG_INFO << "Endpoint address parsing PASS";
}

int main() {
    gateway::common::Logger::Instance().SetLevel(gateway::common::LogLevel::INFO);
    testSectionsKeepDeclarationOrder();
    testParseRoute();
    testApplyConfig();
    testEndpointAddressParsing();
    return 0;
}
