#pragma once

#include "gateway/forward/GatewayError.h"
#include "gateway/forward/RequestContext.h"
#include "gateway/protocol/HttpRequest.h"
#include "gateway/protocol/HttpResponse.h"

#include <memory>
#include <vector>

namespace gateway {
namespace forward {

// Observer around the forwarding of one request. Hooks may annotate the
// context and the response; they cannot change routing.
class Middleware {
public:
    virtual ~Middleware() = default;

    virtual const char* name() const = 0;

    // Return false to answer with *reject instead of forwarding.
    virtual bool OnRequest(RequestContext& ctx, const gateway::protocol::HttpRequest& req,
                           gateway::protocol::HttpResponse* reject) {
        (void)ctx;
        (void)req;
        (void)reject;
        return true;
    }
    virtual void OnResponse(RequestContext& ctx, gateway::protocol::HttpResponse& resp) {
        (void)ctx;
        (void)resp;
    }
    virtual void OnError(RequestContext& ctx, const GatewayError& error) {
        (void)ctx;
        (void)error;
    }
};

using MiddlewarePtr = std::shared_ptr<Middleware>;

// Runs OnRequest in declared order, OnResponse in reverse, OnError in
// declared order. A hook that throws is logged and skipped; the rest of the
// chain still runs.
class MiddlewareChain {
public:
    void Add(MiddlewarePtr mw) { middleware_.push_back(std::move(mw)); }
    size_t size() const { return middleware_.size(); }

    bool RunRequest(RequestContext& ctx, const gateway::protocol::HttpRequest& req,
                    gateway::protocol::HttpResponse* reject) const;
    void RunResponse(RequestContext& ctx, gateway::protocol::HttpResponse& resp) const;
    void RunError(RequestContext& ctx, const GatewayError& error) const;

    // Tracing, header inspection, access log and metrics, in that order.
    static std::shared_ptr<MiddlewareChain> Default();

private:
    std::vector<MiddlewarePtr> middleware_;
};

using MiddlewareChainPtr = std::shared_ptr<const MiddlewareChain>;

// Echoes traceparent on the response.
class TracingMiddleware : public Middleware {
public:
    const char* name() const override { return "tracing"; }
    bool OnRequest(RequestContext& ctx, const gateway::protocol::HttpRequest& req,
                   gateway::protocol::HttpResponse* reject) override;
    void OnResponse(RequestContext& ctx, gateway::protocol::HttpResponse& resp) override;
};

class AccessLogMiddleware : public Middleware {
public:
    const char* name() const override { return "access_log"; }
    void OnResponse(RequestContext& ctx, gateway::protocol::HttpResponse& resp) override;
    void OnError(RequestContext& ctx, const GatewayError& error) override;
};

// Debug dump of request headers; credentials are masked.
class HeaderInspectionMiddleware : public Middleware {
public:
    const char* name() const override { return "header_inspection"; }
    bool OnRequest(RequestContext& ctx, const gateway::protocol::HttpRequest& req,
                   gateway::protocol::HttpResponse* reject) override;
};

class MetricsMiddleware : public Middleware {
public:
    const char* name() const override { return "metrics"; }
    void OnResponse(RequestContext& ctx, gateway::protocol::HttpResponse& resp) override;
    void OnError(RequestContext& ctx, const GatewayError& error) override;
};

} // namespace forward
} // namespace gateway
