#pragma once

#include "gateway/balancer/EndpointRegistry.h"
#include "gateway/common/noncopyable.h"
#include "gateway/forward/GatewayError.h"
#include "gateway/forward/RequestForwarder.h"
#include "gateway/resilience/CircuitBreakerRegistry.h"
#include "gateway/route/Route.h"

#include <functional>
#include <memory>

namespace gateway {
namespace network {
class EventLoop;
class Timer;
}

namespace forward {

// Drives one client request against its matched route:
// select endpoint -> breaker admission -> attempt -> classify -> maybe
// back off and retry, until success, a non-retryable outcome, an exhausted
// budget or the overall deadline. Retries are strictly sequential. All work
// happens on the client connection's loop.
class ProxyExchange : gateway::common::noncopyable,
                      public std::enable_shared_from_this<ProxyExchange> {
public:
    // error is null on success and when a backend response is relayed as is.
    using FinishCallback = std::function<void(gateway::protocol::HttpResponse& response, const GatewayError* error)>;

    ProxyExchange(gateway::network::EventLoop* loop,
                  gateway::route::RoutePtr route,
                  gateway::protocol::HttpRequest request,
                  RequestContextPtr ctx,
                  gateway::balancer::EndpointRegistry* registry,
                  gateway::resilience::CircuitBreakerRegistry* breakers);
    ~ProxyExchange();

    void Start(FinishCallback done);
    // Client went away: abort whatever is in progress, answer nothing.
    void Cancel();

    bool finished() const { return finished_; }
    int retriesUsed() const { return retriesUsed_; }

private:
    void StartAttempt();
    void OnAttemptDone(const gateway::balancer::EndpointPtr& endpoint,
                       const gateway::resilience::CircuitBreakerPtr& breaker,
                       bool trial,
                       const AttemptResult& result);
    // Consumes one retry and arms the backoff timer. Returns false when the
    // budget is spent; if the backoff would overrun the deadline it finishes
    // with Timeout instead and returns true.
    bool ScheduleRetry();
    void OnDeadline();
    void RecordAttemptEvent(const std::string& endpointId, const std::string& outcome, int status, double latencyMs);

    void FinishWithError(const GatewayError& error);
    void FinishWithBackendResponse(gateway::protocol::HttpResponse& response, const GatewayError* error);
    void TearDown();

    gateway::network::EventLoop* loop_;
    gateway::route::RoutePtr route_;
    gateway::protocol::HttpRequest request_;
    RequestContextPtr ctx_;
    gateway::balancer::EndpointRegistry* registry_;
    gateway::resilience::CircuitBreakerRegistry* breakers_;

    FinishCallback done_;
    ForwardAttemptPtr attempt_;
    std::unique_ptr<gateway::network::Timer> backoffTimer_;
    std::unique_ptr<gateway::network::Timer> deadlineTimer_;
    int retriesUsed_;
    bool deadlineReached_;
    bool finished_;
};

using ProxyExchangePtr = std::shared_ptr<ProxyExchange>;

} // namespace forward
} // namespace gateway
