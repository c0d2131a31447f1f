#pragma once

#include "gateway/balancer/Endpoint.h"
#include "gateway/common/noncopyable.h"
#include "gateway/forward/RequestContext.h"
#include "gateway/network/Callbacks.h"
#include "gateway/protocol/HttpHeaders.h"
#include "gateway/protocol/HttpRequest.h"
#include "gateway/protocol/HttpResponseContext.h"
#include "gateway/route/Route.h"

#include <functional>
#include <memory>
#include <set>
#include <string>

namespace gateway {
namespace network {
class Buffer;
class EventLoop;
class TcpClient;
class Timer;
}

namespace forward {

enum class AttemptOutcome {
    kSuccess,
    kBackendError,
    kTimeout,
    kConnectionFailure,
    kCancelled,
};

const char* AttemptOutcomeName(AttemptOutcome outcome);

struct AttemptResult {
    AttemptOutcome outcome = AttemptOutcome::kCancelled;
    int status = 0;
    gateway::protocol::HttpResponse response;  // set for kSuccess and kBackendError
    std::string detail;
    double latencyMs = 0.0;
};

// One request sent to one endpoint over a fresh connection. Lives on the
// client connection's loop. Prepare allocates the timers and the client and
// throws std::system_error when the process is out of descriptors; nothing
// is counted yet at that point. The endpoint's active count goes up in Start
// and down exactly once when the attempt finishes, whatever the outcome.
class ForwardAttempt : gateway::common::noncopyable,
                       public std::enable_shared_from_this<ForwardAttempt> {
public:
    using DoneCallback = std::function<void(const AttemptResult&)>;

    ForwardAttempt(gateway::network::EventLoop* loop,
                   gateway::balancer::EndpointPtr endpoint,
                   std::string wireRequest,
                   bool headRequest,
                   const gateway::route::TimeoutPolicy& timeouts,
                   const std::set<int>& failureStatuses,
                   std::string logTag);
    ~ForwardAttempt();

    void Prepare();
    void Start(DoneCallback done);
    // Aborts with kCancelled. No-op once finished.
    void Cancel();
    // Aborts with kTimeout, as if the attempt timer had fired.
    void Expire(const std::string& detail);

    bool finished() const { return finished_; }
    const gateway::balancer::EndpointPtr& endpoint() const { return endpoint_; }

private:
    void OnConnection(const gateway::network::TcpConnectionPtr& conn);
    void OnMessage(const gateway::network::TcpConnectionPtr& conn, gateway::network::Buffer* buf);
    void OnConnectFailure(int err);
    void CompleteWithResponse();
    void Finish(AttemptOutcome outcome, const std::string& detail);

    gateway::network::EventLoop* loop_;
    gateway::balancer::EndpointPtr endpoint_;
    std::string wireRequest_;
    gateway::route::TimeoutPolicy timeouts_;
    std::set<int> failureStatuses_;
    std::string logTag_;
    bool headRequest_;

    std::unique_ptr<gateway::network::TcpClient> client_;
    std::unique_ptr<gateway::network::Timer> connectTimer_;
    std::unique_ptr<gateway::network::Timer> attemptTimer_;
    gateway::protocol::HttpResponseContext parser_;
    bool connected_;
    bool counted_;
    bool finished_;
    std::chrono::steady_clock::time_point startedAt_;
    DoneCallback done_;
};

using ForwardAttemptPtr = std::shared_ptr<ForwardAttempt>;

// Request and response rewriting at the proxy boundary.
class RequestForwarder {
public:
    // Connection, Keep-Alive, Proxy-Connection, Proxy-Authenticate,
    // Proxy-Authorization, TE, Trailer, Transfer-Encoding, Upgrade, and any
    // header listed in Connection.
    static void StripHopByHop(gateway::protocol::HttpHeaders* headers);
    static bool IsHopByHop(const std::string& name);

    // Serialised upstream request: hop-by-hop headers removed; traceparent,
    // X-Forwarded-For, X-Forwarded-Proto and X-Request-Start added; body
    // framed by Content-Length; Connection: close.
    static std::string BuildUpstreamRequest(const gateway::protocol::HttpRequest& req,
                                            const RequestContext& ctx,
                                            const gateway::balancer::Endpoint& endpoint);

    // Backend response prepared for the client. A reply to HEAD keeps its
    // Content-Length.
    static void PrepareDownstreamResponse(gateway::protocol::HttpResponse* response, bool headRequest);
};

} // namespace forward
} // namespace gateway
