#include "gateway/GatewayServer.h"
#include "gateway/common/Config.h"
#include "gateway/common/Logger.h"
#include "gateway/monitor/Stats.h"
#include "gateway/network/EventLoop.h"
#include "gateway/network/InetAddress.h"
#include "gateway/network/TcpConnection.h"
#include "gateway/protocol/HttpRequest.h"
#include "gateway/protocol/HttpResponse.h"
#include "gateway/protocol/HttpServer.h"

#include <arpa/inet.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <cassert>
#include <chrono>
#include <cstring>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using gateway::network::EventLoop;
using gateway::network::InetAddress;
using gateway::network::TcpConnectionPtr;
using gateway::protocol::HttpRequest;
using gateway::protocol::HttpResponse;
using gateway::protocol::HttpServer;
using gateway::resilience::CircuitState;

static int connectTo(uint16_t port) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    assert(fd >= 0);

    sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    assert(::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr) == 1);

    int ret = ::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    assert(ret == 0);
    return fd;
}

static void sendRequest(int fd, const std::string& path) {
    std::string raw = "GET " + path + " HTTP/1.1\r\nHost: test\r\nConnection: close\r\n\r\n";
    ssize_t n = ::send(fd, raw.data(), raw.size(), 0);
    assert(n == (ssize_t)raw.size());
}

static std::string recvUntilClose(int fd, int timeoutMs = 5000) {
    std::string out;
    pollfd pfd;
    pfd.fd = fd;
    pfd.events = POLLIN | POLLHUP | POLLERR;
    while (true) {
        int pret = ::poll(&pfd, 1, timeoutMs);
        assert(pret == 1);
        char buf[4096];
        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n > 0) {
            out.append(buf, buf + n);
            continue;
        }
        break;
    }
    return out;
}

static std::string httpGet(uint16_t port, const std::string& path) {
    int fd = connectTo(port);
    sendRequest(fd, path);
    std::string resp = recvUntilClose(fd);
    ::close(fd);
    return resp;
}

static bool waitFor(const std::function<bool()>& pred, int timeoutMs = 3000) {
    const auto until = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    while (std::chrono::steady_clock::now() < until) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

static bool has(const std::string& s, const std::string& needle) {
    return s.find(needle) != std::string::npos;
}

// Backend on the base loop: /park is never answered, /flap is always 503,
// anything else is 200.
struct Backend {
    explicit Backend(EventLoop* loop) : server(loop, InetAddress(0, true), "backend") {
        server.setRequestCallback([this](const TcpConnectionPtr& conn, const HttpRequest& req) {
            if (req.path() == "/park") {
                parkedConns.push_back(conn);
                ++parked;
                return;
            }
            HttpResponse resp;
            if (req.path() == "/flap") {
                ++flaps;
                resp = HttpResponse::Plain(503, "flapping\n");
            } else {
                resp = HttpResponse::Plain(200, "ok\n");
            }
            HttpServer::SendResponse(conn, resp);
        });
        server.start();
    }

    std::string addr() const { return "127.0.0.1:" + std::to_string(server.port()); }

    HttpServer server;
    std::vector<TcpConnectionPtr> parkedConns;
    std::atomic<int> parked{0};
    std::atomic<int> flaps{0};
};

// Many clients at once against one endpoint, half answered and half timing
// out, over four I/O loops. Every attempt gives its active slot back.
void testConcurrentMixedOutcomes() {
    EventLoop loop;
    Backend backend(&loop);

    std::string ini =
        "[circuit_breaker]\nfailure_threshold = 1000\ncooldown_ms = 60000\n"
        "[health_check]\nmode = off\n"
        "[service:test/svc]\nendpoints = " + backend.addr() + "\n"
        "[route:ok]\npath = /ok\ndestinations = test/svc\n"
        "[route:park]\npath = /park\ndestinations = test/svc\ntimeout_ms = 150\nmax_retries = 0\n";
    assert(gateway::common::Config::Instance().LoadFromString(ini));

    gateway::monitor::Stats::Instance().Reset();
    gateway::GatewayServer server(&loop, InetAddress(0, true), "ConcurrentGateway");
    server.EnableHealthMonitor(false);
    server.SetThreadNum(4);
    assert(server.ApplyConfig(gateway::common::Config::Instance()));
    server.Start();
    const uint16_t port = server.port();
    gateway::balancer::EndpointPtr ep = server.registry().Find(backend.addr());
    assert(ep);

    std::thread client([&]() {
        const int kClients = 16;
        std::vector<std::string> replies(kClients);
        std::vector<std::thread> workers;
        for (int i = 0; i < kClients; ++i) {
            workers.emplace_back([&, i]() { replies[i] = httpGet(port, i % 2 == 0 ? "/ok" : "/park"); });
        }
        for (auto& w : workers) {
            w.join();
        }

        int ok = 0;
        int timedOut = 0;
        for (const auto& r : replies) {
            if (has(r, "HTTP/1.1 200")) ++ok;
            if (has(r, "HTTP/1.1 504")) ++timedOut;
        }
        assert(ok == kClients / 2);
        assert(timedOut == kClients / 2);
        assert(waitFor([&]() { return ep->ActiveConnections() == 0; }));
        auto& stats = gateway::monitor::Stats::Instance();
        assert(stats.GetAttempts(ep->id(), "success") == static_cast<unsigned long long>(kClients / 2));
        assert(stats.GetAttempts(ep->id(), "timeout") == static_cast<unsigned long long>(kClients / 2));
        assert(stats.GetAttempts(ep->id(), "cancelled") == 0);

        loop.QueueInLoop([&]() { loop.Quit(); });
    });

    loop.Loop();
    client.join();
    LOG_INFO << "Concurrent mixed outcomes PASS";
}

// Clients that hang up mid-backoff and mid-trial, then a gateway torn down
// while a client is still waiting on a parked backend.
void testClientDisconnectAndShutdown() {
    EventLoop loop;
    Backend backend(&loop);

    std::string ini =
        "[circuit_breaker]\nfailure_threshold = 1\ncooldown_ms = 0\n"
        "[health_check]\nmode = off\n"
        "[service:test/svc]\nendpoints = " + backend.addr() + "\n"
        "[route:flap]\npath = /flap\ndestinations = test/svc\nmax_retries = 3\n"
        "backoff_initial_ms = 500\nbackoff_max_ms = 500\n"
        "[route:park]\npath = /park\ndestinations = test/svc\ntimeout_ms = 5000\nmax_retries = 0\n";
    assert(gateway::common::Config::Instance().LoadFromString(ini));

    gateway::monitor::Stats::Instance().Reset();
    std::unique_ptr<gateway::GatewayServer> server(
        new gateway::GatewayServer(&loop, InetAddress(0, true), "CancelGateway"));
    server->EnableHealthMonitor(false);
    assert(server->ApplyConfig(gateway::common::Config::Instance()));
    server->Start();
    const uint16_t port = server->port();
    gateway::balancer::EndpointPtr ep = server->registry().Find(backend.addr());
    assert(ep);
    gateway::resilience::CircuitBreakerPtr breaker = server->breakers().Get(ep->id());

    std::atomic<bool> destroyed{false};
    std::thread client([&]() {
        // Hang up while the exchange waits out its first backoff.
        int fd = connectTo(port);
        sendRequest(fd, "/flap");
        assert(waitFor([&]() { return backend.flaps == 1; }));
        assert(waitFor([&]() { return ep->ActiveConnections() == 0; }));
        ::close(fd);
        std::this_thread::sleep_for(std::chrono::milliseconds(800));
        assert(backend.flaps == 1);
        assert(ep->ActiveConnections() == 0);
        assert(breaker->GetState() == CircuitState::kOpen);

        // The breaker is open with no cooldown: the next request is the
        // half-open trial. Hang up while it is parked on the backend.
        fd = connectTo(port);
        sendRequest(fd, "/park");
        assert(waitFor([&]() { return backend.parked == 1; }));
        assert(ep->ActiveConnections() == 1);
        assert(breaker->GetState() == CircuitState::kHalfOpen);
        assert(!breaker->IsAvailable());
        ::close(fd);
        assert(waitFor([&]() { return ep->ActiveConnections() == 0; }));
        assert(waitFor([&]() { return breaker->IsAvailable(); }));
        assert(breaker->GetState() == CircuitState::kHalfOpen);

        // Tear the gateway down under a parked request.
        fd = connectTo(port);
        sendRequest(fd, "/park");
        assert(waitFor([&]() { return backend.parked == 2; }));
        assert(ep->ActiveConnections() == 1);
        loop.RunInLoop([&]() {
            server.reset();
            destroyed = true;
        });
        assert(waitFor([&]() { return destroyed.load(); }));
        assert(ep->ActiveConnections() == 0);
        assert(breaker->IsAvailable());
        assert(gateway::monitor::Stats::Instance().GetActiveConnections() == 0);
        std::string rest = recvUntilClose(fd);
        assert(rest.empty());
        ::close(fd);

        loop.QueueInLoop([&]() { loop.Quit(); });
    });

    loop.Loop();
    client.join();
    LOG_INFO << "Client disconnect and shutdown PASS";
}

int main() {
    gateway::common::Logger::Instance().SetLevel(gateway::common::LogLevel::WARN);
    testConcurrentMixedOutcomes();
    testClientDisconnectAndShutdown();
    return 0;
}
