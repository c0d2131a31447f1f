#pragma once

#include "gateway/balancer/EndpointRegistry.h"
#include "gateway/balancer/HealthMonitor.h"
#include "gateway/common/Config.h"
#include "gateway/common/noncopyable.h"
#include "gateway/forward/Middleware.h"
#include "gateway/protocol/HttpServer.h"
#include "gateway/resilience/CircuitBreakerRegistry.h"
#include "gateway/route/RouteTable.h"

#include <memory>
#include <string>

namespace gateway {

namespace network {
class Channel;
}

// The HTTP listener plus everything a request needs on its way to a
// backend: route table, endpoint registry, breakers, health monitor and the
// middleware chain. Also serves liveness, readiness, metrics and the admin
// API, and re-reads its configuration on SIGHUP.
class GatewayServer : gateway::common::noncopyable {
public:
    GatewayServer(network::EventLoop* loop,
                  const network::InetAddress& listenAddr,
                  const std::string& name = "datum-gateway");
    ~GatewayServer();

    void SetThreadNum(int numThreads) { server_.setThreadNum(numThreads); }
    void SetIdleTimeout(double sec) { server_.setIdleTimeout(sec); }
    void SetStatusPaths(const std::string& live, const std::string& ready, const std::string& metrics);
    // Replaces the default chain. Call before Start.
    void SetMiddleware(std::shared_ptr<forward::MiddlewareChain> chain) { middleware_ = std::move(chain); }
    void EnableHealthMonitor(bool on) { healthMonitorEnabled_ = on; }

    // Applies [health_check], [circuit_breaker], [service:*], [endpoint:*]
    // and [route:*]: services and endpoints are upserted, the route table is
    // replaced. Invalid sections are logged and skipped; returns false if
    // any were.
    bool ApplyConfig(const common::Config& conf);

    // Blocks SIGHUP/SIGINT/SIGTERM in the calling thread (and the I/O threads
    // started after it) and handles them on the base loop: SIGHUP reloads
    // configPath, the others quit the loop. Call before Start.
    void HandleSignals(const std::string& configPath);

    void Start();

    uint16_t port() const { return server_.port(); }
    network::EventLoop* loop() const { return loop_; }

    route::RouteTable& routes() { return routes_; }
    balancer::EndpointRegistry& registry() { return registry_; }
    resilience::CircuitBreakerRegistry& breakers() { return breakers_; }
    balancer::HealthMonitor& healthMonitor() { return healthMonitor_; }

    // One [route:<id>] section. false (with *error) on a malformed section.
    static bool ParseRoute(const std::string& id,
                           const common::Config::Section& section,
                           route::Route* out,
                           std::string* error);

    std::string DumpRoutes() const;
    std::string DumpEndpoints() const;

private:
    void OnRequest(const network::TcpConnectionPtr& conn, const protocol::HttpRequest& req);
    void OnConnection(const network::TcpConnectionPtr& conn);
    void HandleProxy(const network::TcpConnectionPtr& conn, const protocol::HttpRequest& req);
    void HandleAdmin(const network::TcpConnectionPtr& conn, const protocol::HttpRequest& req);
    void Reply(const network::TcpConnectionPtr& conn,
               const forward::RequestContextPtr& ctx,
               protocol::HttpResponse& response);
    void OnSignal();

    network::EventLoop* loop_;
    route::RouteTable routes_;
    balancer::EndpointRegistry registry_;
    resilience::CircuitBreakerRegistry breakers_;
    balancer::HealthMonitor healthMonitor_;
    std::shared_ptr<forward::MiddlewareChain> middleware_;
    balancer::HealthCheckSpec defaultHealthCheck_;
    bool healthMonitorEnabled_;

    std::string livePath_;
    std::string readyPath_;
    std::string metricsPath_;

    std::string configPath_;
    int signalFd_;
    std::unique_ptr<network::Channel> signalChannel_;

    // Destroyed first: closing its connections cancels exchanges that still
    // use the registry, the breakers and the middleware.
    protocol::HttpServer server_;
};

} // namespace gateway
