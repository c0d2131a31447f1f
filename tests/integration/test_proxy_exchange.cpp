#include "gateway/balancer/EndpointRegistry.h"
#include "gateway/common/Logger.h"
#include "gateway/forward/ProxyExchange.h"
#include "gateway/monitor/Stats.h"
#include "gateway/network/EventLoop.h"
#include "gateway/network/InetAddress.h"
#include "gateway/network/TcpConnection.h"
#include "gateway/network/Timer.h"
#include "gateway/protocol/HttpServer.h"
#include "gateway/resilience/CircuitBreakerRegistry.h"

#include <arpa/inet.h>
#include <fcntl.h>
#include <sys/resource.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <cassert>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

using gateway::balancer::EndpointPtr;
using gateway::balancer::EndpointRegistry;
using gateway::balancer::HealthCheckSpec;
using gateway::forward::GatewayError;
using gateway::forward::ProxyExchange;
using gateway::forward::RequestContext;
using gateway::network::EventLoop;
using gateway::network::InetAddress;
using gateway::network::TcpConnectionPtr;
using gateway::network::Timer;
using gateway::protocol::HttpRequest;
using gateway::protocol::HttpResponse;
using gateway::protocol::HttpServer;
using gateway::resilience::CircuitBreaker;
using gateway::resilience::CircuitBreakerConfig;
using gateway::resilience::CircuitBreakerRegistry;
using gateway::resilience::CircuitState;

// Listens but never accepts: connects complete through the backlog and the
// request is never answered.
static int hungListener(uint16_t* port) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    assert(fd >= 0);
    sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    assert(::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
    assert(::listen(fd, 16) == 0);
    socklen_t len = sizeof(addr);
    assert(::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0);
    *port = ntohs(addr.sin_port);
    return fd;
}

static std::shared_ptr<gateway::route::Route> makeRoute(const std::string& id, int64_t timeoutMs, int maxRetries) {
    auto route = std::make_shared<gateway::route::Route>();
    route->id = id;
    route->match.path = "/";
    route->destinations.push_back(gateway::route::Destination{"test/svc", 100});
    route->timeout.requestTimeoutMs = timeoutMs;
    route->timeout.connectTimeoutMs = timeoutMs;
    route->retry.maxRetries = maxRetries;
    route->retry.initialBackoffMs = 10;
    route->retry.maxBackoffMs = 10;
    return route;
}

static HttpRequest makeRequest() {
    HttpRequest req;
    req.setMethod(std::string("GET"));
    req.setPath(std::string("/hang"));
    req.setHeader("Host", "test");
    return req;
}

static EndpointPtr registerEndpoint(EndpointRegistry* registry, uint16_t port) {
    HealthCheckSpec spec;
    spec.mode = "off";
    registry->UpsertService("test/svc", spec);
    return registry->UpsertEndpoint("test/svc", "127.0.0.1", port, true);
}

// Lets queued teardown work run before the loop goes away.
static void drain(EventLoop* loop, double sec) {
    Timer stop(loop);
    stop.Start(sec, [loop]() { loop->Quit(); });
    loop->Loop();
}

// With no retries left, the overall deadline and the attempt deadline are the
// same instant. The hung endpoint must still be charged with a timeout.
void testDeadlineChargesHungEndpoint() {
    EventLoop loop;
    uint16_t port = 0;
    int listenFd = hungListener(&port);

    EndpointRegistry registry;
    EndpointPtr ep = registerEndpoint(&registry, port);
    CircuitBreakerConfig config;
    config.failureThreshold = 1;
    config.cooldownMs = 60000;
    CircuitBreakerRegistry breakers(config);
    gateway::monitor::Stats::Instance().Reset();

    int status = 0;
    std::string errorKind;
    {
        auto exchange = std::make_shared<ProxyExchange>(&loop, makeRoute("hang", 200, 0), makeRequest(),
                                                        std::make_shared<RequestContext>(), &registry, &breakers);
        exchange->Start([&](HttpResponse& resp, const GatewayError* error) {
            status = resp.statusCode();
            errorKind = error ? error->name() : "";
            loop.QueueInLoop([&loop]() { loop.Quit(); });
        });
        loop.Loop();
    }

    assert(status == 504);
    assert(errorKind == "Timeout");
    assert(ep->ActiveConnections() == 0);
    assert(breakers.Get(ep->id())->GetState() == CircuitState::kOpen);
    assert(gateway::monitor::Stats::Instance().GetAttempts(ep->id(), "timeout") == 1);
    assert(gateway::monitor::Stats::Instance().GetAttempts(ep->id(), "cancelled") == 0);

    drain(&loop, 0.05);
    ::close(listenFd);
    LOG_INFO << "Deadline charges hung endpoint PASS";
}

// An exchange dropped mid-attempt without Cancel gives back the active slot
// and the half-open trial.
void testDroppedExchangeReleasesAttempt() {
    EventLoop loop;
    uint16_t port = 0;
    int listenFd = hungListener(&port);

    EndpointRegistry registry;
    EndpointPtr ep = registerEndpoint(&registry, port);
    CircuitBreakerConfig config;
    config.failureThreshold = 1;
    config.cooldownMs = 0;
    CircuitBreakerRegistry breakers(config);
    auto breaker = breakers.Get(ep->id());
    breaker->RecordFailure(false);
    assert(breaker->GetState() == CircuitState::kOpen);

    bool answered = false;
    auto exchange = std::make_shared<ProxyExchange>(&loop, makeRoute("drop", 5000, 0), makeRequest(),
                                                    std::make_shared<RequestContext>(), &registry, &breakers);
    exchange->Start([&](HttpResponse&, const GatewayError*) { answered = true; });
    assert(ep->ActiveConnections() == 1);
    assert(breaker->GetState() == CircuitState::kHalfOpen);
    assert(!breaker->IsAvailable());

    exchange.reset();
    assert(!answered);
    assert(ep->ActiveConnections() == 0);
    assert(breaker->IsAvailable());
    assert(breaker->TryAcquire() == CircuitBreaker::Admission::kTrial);
    breaker->ReleaseTrial();

    drain(&loop, 0.05);
    ::close(listenFd);
    LOG_INFO << "Dropped exchange releases attempt PASS";
}

// A half-open trial that succeeds closes the breaker again.
void testTrialSuccessClosesBreaker() {
    EventLoop loop;
    HttpServer backend(&loop, InetAddress(0, true), "healthy-backend");
    backend.setRequestCallback([](const TcpConnectionPtr& conn, const HttpRequest&) {
        HttpResponse resp = HttpResponse::Plain(200, "back\n");
        HttpServer::SendResponse(conn, resp);
    });
    backend.start();

    EndpointRegistry registry;
    EndpointPtr ep = registerEndpoint(&registry, backend.port());
    CircuitBreakerConfig config;
    config.failureThreshold = 1;
    config.cooldownMs = 0;
    CircuitBreakerRegistry breakers(config);
    auto breaker = breakers.Get(ep->id());
    breaker->RecordFailure(false);
    assert(breaker->GetState() == CircuitState::kOpen);

    int status = 0;
    bool sawError = true;
    auto exchange = std::make_shared<ProxyExchange>(&loop, makeRoute("trial", 1000, 0), makeRequest(),
                                                    std::make_shared<RequestContext>(), &registry, &breakers);
    exchange->Start([&](HttpResponse& resp, const GatewayError* error) {
        status = resp.statusCode();
        sawError = error != nullptr;
        loop.QueueInLoop([&loop]() { loop.Quit(); });
    });
    assert(breaker->GetState() == CircuitState::kHalfOpen);
    loop.Loop();

    assert(status == 200);
    assert(!sawError);
    assert(breaker->GetState() == CircuitState::kClosed);
    assert(breaker->ConsecutiveFailures() == 0);
    assert(ep->ActiveConnections() == 0);

    exchange.reset();
    drain(&loop, 0.02);
    LOG_INFO << "Trial success closes breaker PASS";
}

// Retries are left, but the next backoff would end past the overall
// deadline: the client gets a timeout instead of another attempt.
void testDeadlineAbortsRemainingRetries() {
    EventLoop loop;
    std::atomic<int> hits{0};
    HttpServer backend(&loop, InetAddress(0, true), "busy-backend");
    backend.setRequestCallback([&](const TcpConnectionPtr& conn, const HttpRequest&) {
        ++hits;
        HttpResponse resp = HttpResponse::Plain(503, "busy\n");
        HttpServer::SendResponse(conn, resp);
    });
    backend.start();

    EndpointRegistry registry;
    EndpointPtr ep = registerEndpoint(&registry, backend.port());
    CircuitBreakerConfig config;
    config.failureThreshold = 1000;
    CircuitBreakerRegistry breakers(config);

    auto route = makeRoute("budget", 100, 5);
    route->retry.initialBackoffMs = 40;
    route->retry.maxBackoffMs = 40;
    // budget is 6 * 100 + 5 * 40 = 800ms; only the last 100ms are left
    auto ctx = std::make_shared<RequestContext>();
    ctx->start = RequestContext::Clock::now() - std::chrono::milliseconds(700);

    int status = 0;
    std::string errorKind;
    auto exchange = std::make_shared<ProxyExchange>(&loop, route, makeRequest(), ctx, &registry, &breakers);
    const auto began = std::chrono::steady_clock::now();
    exchange->Start([&](HttpResponse& resp, const GatewayError* error) {
        status = resp.statusCode();
        errorKind = error ? error->name() : "";
        loop.QueueInLoop([&loop]() { loop.Quit(); });
    });
    loop.Loop();
    const auto tookMs = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - began).count();

    assert(status == 504);
    assert(errorKind == "Timeout");
    assert(exchange->retriesUsed() < route->retry.maxRetries);
    assert(hits == exchange->retriesUsed() + 1);
    assert(tookMs < 400);
    assert(ep->ActiveConnections() == 0);

    exchange.reset();
    drain(&loop, 0.02);
    LOG_INFO << "Deadline aborts remaining retries PASS";
}

// The process runs out of descriptors between breaker admission and the
// attempt's first timer. The request fails, and nothing stays held.
void testDescriptorExhaustionReleasesTrial() {
    EventLoop loop;
    EndpointRegistry registry;
    EndpointPtr ep = registerEndpoint(&registry, 1);
    CircuitBreakerConfig config;
    config.failureThreshold = 1;
    config.cooldownMs = 0;
    CircuitBreakerRegistry breakers(config);
    auto breaker = breakers.Get(ep->id());
    breaker->RecordFailure(false);

    rlimit saved;
    assert(::getrlimit(RLIMIT_NOFILE, &saved) == 0);
    rlimit capped = saved;
    if (capped.rlim_cur > 256) capped.rlim_cur = 256;
    assert(::setrlimit(RLIMIT_NOFILE, &capped) == 0);

    std::vector<int> hogs;
    while (true) {
        int fd = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
        if (fd < 0) {
            assert(errno == EMFILE);
            break;
        }
        hogs.push_back(fd);
    }
    // room for the exchange's own deadline and backoff timers, nothing more
    assert(hogs.size() >= 2);
    ::close(hogs.back());
    hogs.pop_back();
    ::close(hogs.back());
    hogs.pop_back();

    int status = 0;
    std::string errorKind;
    auto exchange = std::make_shared<ProxyExchange>(&loop, makeRoute("fds", 1000, 0), makeRequest(),
                                                    std::make_shared<RequestContext>(), &registry, &breakers);
    exchange->Start([&](HttpResponse& resp, const GatewayError* error) {
        status = resp.statusCode();
        errorKind = error ? error->name() : "";
    });

    for (int fd : hogs) {
        ::close(fd);
    }
    assert(::setrlimit(RLIMIT_NOFILE, &saved) == 0);

    assert(status == 502);
    assert(errorKind == "ConnectionFailure");
    assert(ep->ActiveConnections() == 0);
    assert(breaker->GetState() == CircuitState::kHalfOpen);
    assert(breaker->IsAvailable());
    assert(breaker->TryAcquire() == CircuitBreaker::Admission::kTrial);
    breaker->ReleaseTrial();

    exchange.reset();
    drain(&loop, 0.02);
    LOG_INFO << "Descriptor exhaustion releases trial PASS";
}

int main() {
    gateway::common::Logger::Instance().SetLevel(gateway::common::LogLevel::WARN);
    testDeadlineChargesHungEndpoint();
    testDroppedExchangeReleasesAttempt();
    testTrialSuccessClosesBreaker();
    testDeadlineAbortsRemainingRetries();
    testDescriptorExhaustionReleasesTrial();
    return 0;
}
