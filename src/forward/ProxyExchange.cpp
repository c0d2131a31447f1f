#include "gateway/forward/ProxyExchange.h"
#include "gateway/balancer/LoadBalancer.h"
#include "gateway/common/Logger.h"
#include "gateway/monitor/Stats.h"
#include "gateway/network/EventLoop.h"
#include "gateway/network/Timer.h"
#include "gateway/resilience/RetryPolicy.h"

namespace gateway {
namespace forward {

using gateway::balancer::CandidateSet;
using gateway::balancer::EndpointPtr;
using gateway::balancer::LoadBalancer;
using gateway::protocol::HttpResponse;
using gateway::resilience::CircuitBreaker;
using gateway::resilience::CircuitBreakerPtr;

ProxyExchange::ProxyExchange(gateway::network::EventLoop* loop,
                             gateway::route::RoutePtr route,
                             gateway::protocol::HttpRequest request,
                             RequestContextPtr ctx,
                             gateway::balancer::EndpointRegistry* registry,
                             gateway::resilience::CircuitBreakerRegistry* breakers)
    : loop_(loop),
      route_(std::move(route)),
      request_(std::move(request)),
      ctx_(std::move(ctx)),
      registry_(registry),
      breakers_(breakers),
      retriesUsed_(0),
      deadlineReached_(false),
      finished_(false) {
}

ProxyExchange::~ProxyExchange() {
    // dropped without Cancel (handler unwound by an exception): the attempt's
    // done callback can no longer reach us and releases a held trial itself
    if (attempt_) {
        ForwardAttemptPtr attempt = std::move(attempt_);
        attempt->Cancel();
    }
}

void ProxyExchange::Start(FinishCallback done) {
    done_ = std::move(done);
    const int64_t budgetMs = gateway::resilience::OverallDeadlineMs(route_->retry, route_->timeout);
    ctx_->deadline = ctx_->start + std::chrono::milliseconds(budgetMs);

    std::weak_ptr<ProxyExchange> weak(shared_from_this());
    deadlineTimer_.reset(new gateway::network::Timer(loop_));
    backoffTimer_.reset(new gateway::network::Timer(loop_));
    const double remainingSec =
        std::chrono::duration<double>(ctx_->deadline - RequestContext::Clock::now()).count();
    deadlineTimer_->Start(remainingSec > 0.0 ? remainingSec : 0.0, [weak]() {
        if (auto self = weak.lock()) self->OnDeadline();
    });
    StartAttempt();
}

void ProxyExchange::Cancel() {
    if (finished_) return;
    finished_ = true;
    LOG_INFO << ctx_->LogTag() << "client disconnected, cancelling exchange on route " << route_->id;
    TearDown();
    done_ = FinishCallback();
}

void ProxyExchange::TearDown() {
    if (backoffTimer_) backoffTimer_->Cancel();
    if (deadlineTimer_) deadlineTimer_->Cancel();
    if (attempt_) {
        ForwardAttemptPtr attempt = std::move(attempt_);
        attempt->Cancel();
    }
}

void ProxyExchange::StartAttempt() {
    if (finished_) return;
    if (RequestContext::Clock::now() >= ctx_->deadline) {
        FinishWithError(GatewayError(GatewayErrorKind::kTimeout, "request deadline exceeded before attempt"));
        return;
    }

    CandidateSet candidates = LoadBalancer::Candidates(*route_, *registry_, *breakers_);
    if (candidates.status == CandidateSet::kNoHealthyEndpoint) {
        FinishWithError(GatewayError(GatewayErrorKind::kNoHealthyEndpoint,
                                     "no healthy endpoint for route " + route_->id));
        return;
    }
    if (candidates.status == CandidateSet::kCircuitOpen) {
        FinishWithError(GatewayError(GatewayErrorKind::kCircuitOpen,
                                     "all " + std::to_string(candidates.healthyCount) +
                                         " healthy endpoints of route " + route_->id + " are open"));
        return;
    }

    gateway::balancer::SelectionInput input;
    input.clientIp = ctx_->clientIp;
    input.path = request_.path();
    input.headers = &request_.headers();
    EndpointPtr endpoint = LoadBalancer::Select(*route_, candidates.endpoints, input);
    if (!endpoint) {
        FinishWithError(GatewayError(GatewayErrorKind::kNoHealthyEndpoint,
                                     "no endpoint selected for route " + route_->id));
        return;
    }

    ++ctx_->attempts;
    ctx_->lastEndpointId = endpoint->id();
    CircuitBreakerPtr breaker = breakers_->Get(endpoint->id());
    const CircuitBreaker::Admission admission = breaker->TryAcquire();
    if (admission == CircuitBreaker::Admission::kRejected) {
        // short-circuited: no backend connection, but it still uses up an attempt
        LOG_WARN << ctx_->LogTag() << "circuit open for " << endpoint->id() << ", attempt " << ctx_->attempts;
        RecordAttemptEvent(endpoint->id(), "circuit_open", 0, 0.0);
        if (!ScheduleRetry()) {
            FinishWithError(GatewayError(GatewayErrorKind::kCircuitOpen, "endpoint " + endpoint->id()));
        }
        return;
    }
    const bool trial = admission == CircuitBreaker::Admission::kTrial;
    if (trial) {
        LOG_INFO << ctx_->LogTag() << "half-open trial to " << endpoint->id();
    }

    // the attempt never outlives the overall deadline
    gateway::route::TimeoutPolicy timeouts = route_->timeout;
    const int64_t remainingMs = std::chrono::duration_cast<std::chrono::milliseconds>(
        ctx_->deadline - RequestContext::Clock::now()).count();
    if (remainingMs < timeouts.requestTimeoutMs) {
        timeouts.requestTimeoutMs = remainingMs > 0 ? remainingMs : 1;
    }

    ForwardAttemptPtr attempt;
    try {
        std::string wire = RequestForwarder::BuildUpstreamRequest(request_, *ctx_, *endpoint);
        attempt = std::make_shared<ForwardAttempt>(loop_, endpoint, std::move(wire),
                                                   request_.method() == "HEAD",
                                                   timeouts, route_->retry.retryableStatuses,
                                                   ctx_->LogTag());
        attempt->Prepare();
    } catch (const std::exception& e) {
        // nothing reached the backend: hand the trial back untouched
        if (trial) breaker->ReleaseTrial();
        LOG_ERROR << ctx_->LogTag() << "cannot start attempt to " << endpoint->id() << ": " << e.what();
        FinishWithError(GatewayError(GatewayErrorKind::kConnectionFailure,
                                     "cannot open upstream connection to " + endpoint->id()));
        return;
    }

    attempt_ = attempt;
    std::weak_ptr<ProxyExchange> weak(shared_from_this());
    attempt->Start([weak, endpoint, breaker, trial](const AttemptResult& result) {
        auto self = weak.lock();
        if (self) {
            self->OnAttemptDone(endpoint, breaker, trial, result);
            return;
        }
        // exchange already gone: only the breaker bookkeeping remains
        if (trial) breaker->ReleaseTrial();
    });
}

void ProxyExchange::OnAttemptDone(const EndpointPtr& endpoint,
                                  const CircuitBreakerPtr& breaker,
                                  bool trial,
                                  const AttemptResult& result) {
    switch (result.outcome) {
        case AttemptOutcome::kSuccess:
            breaker->RecordSuccess(trial);
            break;
        case AttemptOutcome::kBackendError:
        case AttemptOutcome::kTimeout:
        case AttemptOutcome::kConnectionFailure:
            breaker->RecordFailure(trial);
            break;
        case AttemptOutcome::kCancelled:
            if (trial) breaker->ReleaseTrial();
            break;
    }
    RecordAttemptEvent(endpoint->id(), AttemptOutcomeName(result.outcome), result.status, result.latencyMs);

    if (finished_) return;
    attempt_.reset();

    const gateway::route::RetryPolicy& retry = route_->retry;
    switch (result.outcome) {
        case AttemptOutcome::kSuccess: {
            HttpResponse response = result.response;
            FinishWithBackendResponse(response, nullptr);
            return;
        }
        case AttemptOutcome::kBackendError:
            if (gateway::resilience::IsRetryableStatus(retry, result.status) && ScheduleRetry()) {
                return;
            }
            {
                HttpResponse response = result.response;
                GatewayError error(GatewayErrorKind::kBackendError, result.detail, result.status);
                FinishWithBackendResponse(response, &error);
            }
            return;
        case AttemptOutcome::kTimeout:
            if (retry.retryOnTimeout && ScheduleRetry()) {
                return;
            }
            FinishWithError(GatewayError(GatewayErrorKind::kTimeout, endpoint->id() + ": " + result.detail));
            return;
        case AttemptOutcome::kConnectionFailure:
            if (retry.retryOnConnectFailure && ScheduleRetry()) {
                return;
            }
            FinishWithError(GatewayError(GatewayErrorKind::kConnectionFailure, endpoint->id() + ": " + result.detail));
            return;
        case AttemptOutcome::kCancelled:
            // only Cancel() and the destructor abort attempts, and neither gets here
            LOG_WARN << ctx_->LogTag() << "attempt to " << endpoint->id() << " cancelled unexpectedly";
            FinishWithError(GatewayError(GatewayErrorKind::kConnectionFailure, "attempt aborted"));
            return;
    }
}

bool ProxyExchange::ScheduleRetry() {
    if (retriesUsed_ >= route_->retry.maxRetries) {
        return false;
    }
    const int64_t delayMs = gateway::resilience::BackoffMs(route_->retry, retriesUsed_);
    if (deadlineReached_ ||
        RequestContext::Clock::now() + std::chrono::milliseconds(delayMs) >= ctx_->deadline) {
        LOG_WARN << ctx_->LogTag() << "no time left for retry " << (retriesUsed_ + 1);
        FinishWithError(GatewayError(GatewayErrorKind::kTimeout, "request deadline exceeded"));
        return true;
    }
    ++retriesUsed_;
    LOG_INFO << ctx_->LogTag() << "retry " << retriesUsed_ << "/" << route_->retry.maxRetries
             << " on route " << route_->id << " in " << delayMs << "ms";

    std::weak_ptr<ProxyExchange> weak(shared_from_this());
    backoffTimer_->Start(delayMs / 1000.0, [weak]() {
        if (auto self = weak.lock()) self->StartAttempt();
    });
    return true;
}

void ProxyExchange::OnDeadline() {
    if (finished_) return;
    LOG_WARN << ctx_->LogTag() << "overall deadline reached on route " << route_->id
             << " after " << ctx_->attempts << " attempt(s)";
    deadlineReached_ = true;
    if (attempt_ && !attempt_->finished()) {
        // the endpoint is charged with a timeout; OnAttemptDone finds no time
        // left and answers 504
        ForwardAttemptPtr attempt = attempt_;
        attempt->Expire("request deadline exceeded");
    }
    FinishWithError(GatewayError(GatewayErrorKind::kTimeout, "request deadline exceeded"));
}

void ProxyExchange::RecordAttemptEvent(const std::string& endpointId, const std::string& outcome,
                                       int status, double latencyMs) {
    gateway::monitor::Stats::AttemptEvent event;
    event.time = std::chrono::system_clock::now();
    event.traceId = ctx_->trace.traceId;
    event.routeId = route_->id;
    event.endpointId = endpointId;
    event.outcome = outcome;
    event.status = status;
    event.latencyMs = latencyMs;
    gateway::monitor::Stats::Instance().RecordAttemptCompleted(std::move(event));
}

void ProxyExchange::FinishWithError(const GatewayError& error) {
    if (finished_) return;
    finished_ = true;
    auto guard = shared_from_this();
    TearDown();
    HttpResponse response = error.ToResponse();
    FinishCallback done;
    done.swap(done_);
    if (done) done(response, &error);
}

void ProxyExchange::FinishWithBackendResponse(HttpResponse& response, const GatewayError* error) {
    if (finished_) return;
    finished_ = true;
    auto guard = shared_from_this();
    TearDown();
    FinishCallback done;
    done.swap(done_);
    if (done) done(response, error);
}

} // namespace forward
} // namespace gateway
