#pragma once

#include "gateway/network/EventLoop.h"
#include "gateway/network/InetAddress.h"

#include <functional>
#include <memory>
#include <string>

namespace gateway {
namespace network {
class Channel;
class Timer;
}

namespace balancer {

class HealthChecker {
public:
    using CheckCallback = std::function<void(bool healthy, const gateway::network::InetAddress& addr)>;

    HealthChecker(gateway::network::EventLoop* loop, double timeoutSec)
        : loop_(loop), timeoutSec_(timeoutSec) {}
    virtual ~HealthChecker() = default;

    // Async check. The callback runs exactly once, on the loop thread.
    virtual void Check(const gateway::network::InetAddress& addr, CheckCallback cb) = 0;

    double timeoutSec() const { return timeoutSec_; }

protected:
    // One check: a non-blocking socket, its channel and a deadline timer.
    struct CheckContext {
        int sockfd{-1};
        std::shared_ptr<gateway::network::Channel> channel;
        std::unique_ptr<gateway::network::Timer> timer;
        CheckCallback cb;
        gateway::network::InetAddress addr;
        bool connected{false};
        bool finished{false};

        std::string out;
        size_t outOffset{0};
        std::string in;
    };
    using CheckContextPtr = std::shared_ptr<CheckContext>;

    // Opens the socket, arms the deadline and starts connecting. onConnected
    // runs once the connection is established. Returns nullptr after having
    // already reported failure.
    CheckContextPtr BeginCheck(const gateway::network::InetAddress& addr,
                               CheckCallback cb,
                               std::function<void(const CheckContextPtr&)> onConnected);

    // Reports the result unless the check already finished.
    static void Finish(const CheckContextPtr& ctx, bool healthy);

    gateway::network::EventLoop* loop_;
    double timeoutSec_;
};

using HealthCheckerPtr = std::shared_ptr<HealthChecker>;

// Healthy when a TCP connection can be established within the timeout.
class TcpHealthChecker : public HealthChecker {
public:
    TcpHealthChecker(gateway::network::EventLoop* loop, double timeoutSec = 5.0);

    void Check(const gateway::network::InetAddress& addr, CheckCallback cb) override;
};

} // namespace balancer
} // namespace gateway
