#include "gateway/forward/RequestForwarder.h"
#include "gateway/common/Logger.h"
#include "gateway/common/StringUtil.h"
#include "gateway/monitor/Stats.h"
#include "gateway/network/Buffer.h"
#include "gateway/network/EventLoop.h"
#include "gateway/network/TcpClient.h"
#include "gateway/network/TcpConnection.h"
#include "gateway/network/Timer.h"

#include <cstring>
#include <sstream>
#include <vector>

namespace gateway {
namespace forward {

using gateway::common::IEquals;
using gateway::network::Buffer;
using gateway::network::TcpConnectionPtr;
using gateway::protocol::HttpHeaders;

namespace {

const char* const kHopByHop[] = {
    "Connection", "Keep-Alive", "Proxy-Connection", "Proxy-Authenticate",
    "Proxy-Authorization", "TE", "Trailer", "Transfer-Encoding", "Upgrade",
};

} // namespace

const char* AttemptOutcomeName(AttemptOutcome outcome) {
    switch (outcome) {
        case AttemptOutcome::kSuccess: return "success";
        case AttemptOutcome::kBackendError: return "backend_error";
        case AttemptOutcome::kTimeout: return "timeout";
        case AttemptOutcome::kConnectionFailure: return "connection_failure";
        case AttemptOutcome::kCancelled: return "cancelled";
    }
    return "unknown";
}

bool RequestForwarder::IsHopByHop(const std::string& name) {
    for (const char* h : kHopByHop) {
        if (IEquals(name, h)) return true;
    }
    return false;
}

void RequestForwarder::StripHopByHop(HttpHeaders* headers) {
    auto conn = headers->find("Connection");
    if (conn != headers->end()) {
        std::istringstream iss(conn->second);
        std::string token;
        std::vector<std::string> named;
        while (std::getline(iss, token, ',')) {
            const size_t b = token.find_first_not_of(" \t");
            const size_t e = token.find_last_not_of(" \t");
            if (b != std::string::npos) {
                named.push_back(token.substr(b, e - b + 1));
            }
        }
        for (const auto& n : named) {
            headers->erase(n);
        }
    }
    for (const char* h : kHopByHop) {
        headers->erase(h);
    }
}

std::string RequestForwarder::BuildUpstreamRequest(const gateway::protocol::HttpRequest& req,
                                                   const RequestContext& ctx,
                                                   const gateway::balancer::Endpoint& endpoint) {
    HttpHeaders headers = req.headers();
    const bool hadBodyFraming = headers.count("Content-Length") != 0 || headers.count("Transfer-Encoding") != 0;
    StripHopByHop(&headers);
    headers.erase("Content-Length");

    if (headers.count("Host") == 0) {
        headers["Host"] = endpoint.id();
    }
    headers["traceparent"] = ctx.trace.ToTraceparent();

    auto xff = headers.find("X-Forwarded-For");
    if (xff == headers.end() || xff->second.empty()) {
        headers["X-Forwarded-For"] = ctx.clientIp;
    } else {
        xff->second += ", " + ctx.clientIp;
    }
    if (headers.count("X-Forwarded-Proto") == 0) {
        headers["X-Forwarded-Proto"] = "http";
    }
    const auto startUs = std::chrono::duration_cast<std::chrono::microseconds>(
        req.receiveTime().time_since_epoch()).count();
    headers["X-Request-Start"] = "t=" + std::to_string(startUs);

    std::string out;
    out.reserve(256 + req.body().size());
    out += req.method();
    out += ' ';
    out += req.path().empty() ? "/" : req.path();
    out += req.query();
    out += " HTTP/1.1\r\n";
    for (const auto& h : headers) {
        out += h.first;
        out += ": ";
        out += h.second;
        out += "\r\n";
    }
    if (!req.body().empty() || hadBodyFraming) {
        out += "Content-Length: " + std::to_string(req.body().size()) + "\r\n";
    }
    // one request per upstream connection
    out += "Connection: close\r\n\r\n";
    out += req.body();
    return out;
}

void RequestForwarder::PrepareDownstreamResponse(gateway::protocol::HttpResponse* response, bool headRequest) {
    HttpHeaders& headers = response->mutableHeaders();
    StripHopByHop(&headers);
    if (headRequest && headers.count("Content-Length") != 0) {
        response->setHeadOnly(true);
    } else {
        // the body is re-framed on the way out
        headers.erase("Content-Length");
    }
}

ForwardAttempt::ForwardAttempt(gateway::network::EventLoop* loop,
                               gateway::balancer::EndpointPtr endpoint,
                               std::string wireRequest,
                               bool headRequest,
                               const gateway::route::TimeoutPolicy& timeouts,
                               const std::set<int>& failureStatuses,
                               std::string logTag)
    : loop_(loop),
      endpoint_(std::move(endpoint)),
      wireRequest_(std::move(wireRequest)),
      timeouts_(timeouts),
      failureStatuses_(failureStatuses),
      logTag_(std::move(logTag)),
      headRequest_(headRequest),
      parser_(headRequest),
      connected_(false),
      counted_(false),
      finished_(false) {
}

ForwardAttempt::~ForwardAttempt() {
    if (counted_) {
        LOG_WARN << logTag_ << "attempt to " << endpoint_->id() << " destroyed before finishing";
        endpoint_->DecrementActive();
    }
}

void ForwardAttempt::Prepare() {
    if (client_) return;
    std::weak_ptr<ForwardAttempt> weak(shared_from_this());
    connectTimer_.reset(new gateway::network::Timer(loop_));
    attemptTimer_.reset(new gateway::network::Timer(loop_));
    client_.reset(new gateway::network::TcpClient(loop_, endpoint_->address(), "upstream-" + endpoint_->id()));
    client_->SetConnectionCallback([weak](const TcpConnectionPtr& conn) {
        if (auto self = weak.lock()) self->OnConnection(conn);
    });
    client_->SetMessageCallback([weak](const TcpConnectionPtr& conn, Buffer* buf, std::chrono::system_clock::time_point) {
        if (auto self = weak.lock()) {
            self->OnMessage(conn, buf);
        } else {
            buf->RetrieveAll();
        }
    });
    client_->SetConnectFailureCallback([weak](int err) {
        if (auto self = weak.lock()) self->OnConnectFailure(err);
    });
}

void ForwardAttempt::Start(DoneCallback done) {
    Prepare();
    done_ = std::move(done);
    startedAt_ = std::chrono::steady_clock::now();
    endpoint_->IncrementActive();
    counted_ = true;
    gateway::monitor::Stats::Instance().RecordAttemptStarted(endpoint_->id());
    LOG_DEBUG << logTag_ << "attempt -> " << endpoint_->id();

    std::weak_ptr<ForwardAttempt> weak(shared_from_this());
    connectTimer_->Start(timeouts_.connectTimeoutMs / 1000.0, [weak]() {
        if (auto self = weak.lock()) {
            if (!self->connected_) {
                self->Finish(AttemptOutcome::kConnectionFailure, "connect timeout");
            }
        }
    });
    attemptTimer_->Start(timeouts_.requestTimeoutMs / 1000.0, [weak]() {
        if (auto self = weak.lock()) {
            self->Finish(AttemptOutcome::kTimeout, "attempt deadline exceeded");
        }
    });
    client_->Connect();
}

void ForwardAttempt::Cancel() {
    Finish(AttemptOutcome::kCancelled, "cancelled");
}

void ForwardAttempt::Expire(const std::string& detail) {
    Finish(AttemptOutcome::kTimeout, detail);
}

void ForwardAttempt::OnConnection(const TcpConnectionPtr& conn) {
    if (finished_) return;
    if (conn->connected()) {
        connected_ = true;
        if (connectTimer_) connectTimer_->Cancel();
        conn->SetTcpNoDelay(true);
        conn->Send(wireRequest_);
        return;
    }
    // backend closed
    if (parser_.finishOnEof()) {
        CompleteWithResponse();
    } else if (parser_.headersComplete()) {
        Finish(AttemptOutcome::kConnectionFailure, "backend closed mid-body");
    } else {
        Finish(AttemptOutcome::kConnectionFailure, "backend closed before responding");
    }
}

void ForwardAttempt::OnMessage(const TcpConnectionPtr&, Buffer* buf) {
    if (finished_) {
        buf->RetrieveAll();
        return;
    }
    if (!parser_.parseResponse(buf)) {
        buf->RetrieveAll();
        parser_.response() = gateway::protocol::HttpResponse::Plain(502, "Bad Gateway: invalid response from upstream\n");
        Finish(AttemptOutcome::kBackendError, "malformed response");
        return;
    }
    if (parser_.gotAll()) {
        buf->RetrieveAll();
        CompleteWithResponse();
    }
}

void ForwardAttempt::OnConnectFailure(int err) {
    Finish(AttemptOutcome::kConnectionFailure, std::string("connect failed: ") + std::strerror(err));
}

void ForwardAttempt::CompleteWithResponse() {
    const int status = parser_.statusCode();
    if (status >= 500 || failureStatuses_.count(status) != 0) {
        Finish(AttemptOutcome::kBackendError, "status " + std::to_string(status));
    } else {
        Finish(AttemptOutcome::kSuccess, "status " + std::to_string(status));
    }
}

void ForwardAttempt::Finish(AttemptOutcome outcome, const std::string& detail) {
    if (finished_) return;
    finished_ = true;
    auto guard = shared_from_this();

    if (connectTimer_) connectTimer_->Cancel();
    if (attemptTimer_) attemptTimer_->Cancel();
    if (counted_) {
        counted_ = false;
        endpoint_->DecrementActive();
    }

    // may be inside the client's own callback: destroy it on a later turn
    if (client_) {
        std::shared_ptr<gateway::network::TcpClient> client(client_.release());
        loop_->QueueInLoop([client]() {});
    }

    AttemptResult result;
    result.outcome = outcome;
    result.detail = detail;
    result.latencyMs = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - startedAt_).count();
    if (outcome == AttemptOutcome::kSuccess || outcome == AttemptOutcome::kBackendError) {
        result.response = std::move(parser_.response());
        result.status = result.response.statusCode();
        RequestForwarder::PrepareDownstreamResponse(&result.response, headRequest_);
    }

    if (outcome == AttemptOutcome::kSuccess) {
        LOG_DEBUG << logTag_ << "attempt " << endpoint_->id() << " " << AttemptOutcomeName(outcome)
                  << " (" << detail << ", " << static_cast<long>(result.latencyMs) << "ms)";
    } else {
        LOG_WARN << logTag_ << "attempt " << endpoint_->id() << " " << AttemptOutcomeName(outcome)
                 << " (" << detail << ", " << static_cast<long>(result.latencyMs) << "ms)";
    }

    DoneCallback done;
    done.swap(done_);
    if (done) done(result);
}

} // namespace forward
} // namespace gateway
