#include "gateway/forward/Middleware.h"
#include "gateway/common/Logger.h"
#include "gateway/common/StringUtil.h"
#include "gateway/monitor/Stats.h"

#include <exception>

namespace gateway {
namespace forward {

using gateway::protocol::HttpRequest;
using gateway::protocol::HttpResponse;

bool MiddlewareChain::RunRequest(RequestContext& ctx, const HttpRequest& req, HttpResponse* reject) const {
    for (const auto& mw : middleware_) {
        try {
            if (!mw->OnRequest(ctx, req, reject)) {
                LOG_INFO << ctx.LogTag() << "middleware " << mw->name() << " rejected request";
                return false;
            }
        } catch (const std::exception& e) {
            LOG_ERROR << ctx.LogTag() << "middleware " << mw->name() << " OnRequest threw: " << e.what();
        } catch (...) {
            LOG_ERROR << ctx.LogTag() << "middleware " << mw->name() << " OnRequest threw a non-standard exception";
        }
    }
    return true;
}

void MiddlewareChain::RunResponse(RequestContext& ctx, HttpResponse& resp) const {
    for (auto it = middleware_.rbegin(); it != middleware_.rend(); ++it) {
        try {
            (*it)->OnResponse(ctx, resp);
        } catch (const std::exception& e) {
            LOG_ERROR << ctx.LogTag() << "middleware " << (*it)->name() << " OnResponse threw: " << e.what();
        } catch (...) {
            LOG_ERROR << ctx.LogTag() << "middleware " << (*it)->name() << " OnResponse threw a non-standard exception";
        }
    }
}

void MiddlewareChain::RunError(RequestContext& ctx, const GatewayError& error) const {
    for (const auto& mw : middleware_) {
        try {
            mw->OnError(ctx, error);
        } catch (const std::exception& e) {
            LOG_ERROR << ctx.LogTag() << "middleware " << mw->name() << " OnError threw: " << e.what();
        } catch (...) {
            LOG_ERROR << ctx.LogTag() << "middleware " << mw->name() << " OnError threw a non-standard exception";
        }
    }
}

std::shared_ptr<MiddlewareChain> MiddlewareChain::Default() {
    auto chain = std::make_shared<MiddlewareChain>();
    chain->Add(std::make_shared<TracingMiddleware>());
    chain->Add(std::make_shared<HeaderInspectionMiddleware>());
    chain->Add(std::make_shared<AccessLogMiddleware>());
    chain->Add(std::make_shared<MetricsMiddleware>());
    return chain;
}

bool TracingMiddleware::OnRequest(RequestContext& ctx, const HttpRequest&, HttpResponse*) {
    ctx.metadata["trace_id"] = ctx.trace.traceId;
    ctx.metadata["span_id"] = ctx.trace.spanId;
    if (!ctx.trace.parentSpanId.empty()) {
        ctx.metadata["parent_span_id"] = ctx.trace.parentSpanId;
    }
    return true;
}

void TracingMiddleware::OnResponse(RequestContext& ctx, HttpResponse& resp) {
    resp.addHeader("traceparent", ctx.trace.ToTraceparent());
}

void AccessLogMiddleware::OnResponse(RequestContext& ctx, HttpResponse& resp) {
    LOG_INFO << ctx.LogTag() << ctx.clientIp << " \"" << ctx.method << " " << ctx.path << "\" "
             << resp.statusCode() << " " << resp.body().size() << "B " << ctx.ElapsedMs() << "ms"
             << " route=" << (ctx.routeId.empty() ? "-" : ctx.routeId)
             << " endpoint=" << (ctx.lastEndpointId.empty() ? "-" : ctx.lastEndpointId)
             << " attempts=" << ctx.attempts;
}

void AccessLogMiddleware::OnError(RequestContext& ctx, const GatewayError& error) {
    LOG_WARN << ctx.LogTag() << error.name() << ": " << error.message();
}

bool HeaderInspectionMiddleware::OnRequest(RequestContext& ctx, const HttpRequest& req, HttpResponse*) {
    if (gateway::common::Logger::Instance().GetLevel() > gateway::common::LogLevel::DEBUG) {
        return true;
    }
    for (const auto& h : req.headers()) {
        const bool secret = gateway::common::IEquals(h.first, "Authorization") ||
                            gateway::common::IEquals(h.first, "Proxy-Authorization") ||
                            gateway::common::IEquals(h.first, "Cookie");
        LOG_DEBUG << ctx.LogTag() << "header " << h.first << ": " << (secret ? "<redacted>" : h.second);
    }
    return true;
}

void MetricsMiddleware::OnResponse(RequestContext& ctx, HttpResponse& resp) {
    auto& stats = gateway::monitor::Stats::Instance();
    stats.RecordRequest(ctx.method, ctx.routeId, ctx.requestBytes);
    stats.RecordResponse(resp.statusCode(), resp.body().size(), ctx.ElapsedMs() / 1000.0);
}

void MetricsMiddleware::OnError(RequestContext&, const GatewayError& error) {
    gateway::monitor::Stats::Instance().RecordError(error.name());
}

} // namespace forward
} // namespace gateway
