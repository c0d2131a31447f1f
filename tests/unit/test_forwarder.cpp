#include "gateway/balancer/Endpoint.h"
#include "gateway/common/Logger.h"
#include "gateway/forward/GatewayError.h"
#include "gateway/forward/RequestForwarder.h"
#include "gateway/network/InetAddress.h"
#include "gateway/protocol/HttpRequest.h"
#include "gateway/protocol/HttpResponse.h"

#include <cassert>
#include <string>

using namespace gateway::forward;
using gateway::balancer::Endpoint;
using gateway::network::InetAddress;
using gateway::protocol::HttpHeaders;
using gateway::protocol::HttpRequest;
using gateway::protocol::HttpResponse;

static bool contains(const std::string& s, const std::string& needle) {
    return s.find(needle) != std::string::npos;
}

void testStripHopByHop() {
    HttpHeaders h;
    h["Connection"] = "keep-alive, X-Session-Hint";
    h["Keep-Alive"] = "timeout=5";
    h["Proxy-Authorization"] = "Basic abc";
    h["TE"] = "trailers";
    h["Transfer-Encoding"] = "chunked";
    h["Upgrade"] = "websocket";
    h["X-Session-Hint"] = "abc";
    h["Accept"] = "*/*";
    h["Authorization"] = "Bearer t";

    RequestForwarder::StripHopByHop(&h);
    assert(h.size() == 2);
    assert(h.count("accept") == 1);
    assert(h.count("Authorization") == 1);
    assert(RequestForwarder::IsHopByHop("proxy-connection"));
    assert(!RequestForwarder::IsHopByHop("Content-Type"));
    LOG_INFO << "StripHopByHop PASS";
}

void testBuildUpstreamRequest() {
    Endpoint ep("default/a", "127.0.0.1", 9001, InetAddress("127.0.0.1", 9001), true);
    RequestContext ctx;
    ctx.trace = TraceContext::ForIncoming("");
    ctx.clientIp = "10.0.0.7";

    HttpRequest req;
    req.setMethod("POST");
    req.setPath("/api/items");
    const char q[] = "?a=1";
    req.setQuery(q, q + 4);
    req.addHeader("Host", "shop.example");
    req.addHeader("Connection", "keep-alive");
    req.addHeader("X-Forwarded-For", "192.0.2.1");
    req.addHeader("Content-Length", "5");
    req.setBody("hello");

    std::string wire = RequestForwarder::BuildUpstreamRequest(req, ctx, ep);
    assert(wire.find("POST /api/items?a=1 HTTP/1.1\r\n") == 0);
    assert(contains(wire, "Host: shop.example\r\n"));
    assert(contains(wire, "X-Forwarded-For: 192.0.2.1, 10.0.0.7\r\n"));
    assert(contains(wire, "X-Forwarded-Proto: http\r\n"));
    assert(contains(wire, "traceparent: " + ctx.trace.ToTraceparent() + "\r\n"));
    assert(contains(wire, "X-Request-Start: t="));
    assert(contains(wire, "Content-Length: 5\r\n"));
    assert(!contains(wire, "keep-alive"));
    assert(contains(wire, "Connection: close\r\n\r\nhello"));

    HttpRequest bare;
    bare.setMethod("GET");
    bare.setPath("/");
    std::string wire2 = RequestForwarder::BuildUpstreamRequest(bare, ctx, ep);
    assert(contains(wire2, "Host: 127.0.0.1:9001\r\n"));
    assert(contains(wire2, "X-Forwarded-For: 10.0.0.7\r\n"));
    assert(!contains(wire2, "Content-Length"));
    LOG_INFO << "BuildUpstreamRequest PASS";
}

void testPrepareDownstreamResponse() {
    HttpResponse resp = HttpResponse::Plain(200, "body");
    resp.addHeader("Content-Length", "4");
    resp.addHeader("Connection", "keep-alive");
    resp.addHeader("X-App", "1");
    RequestForwarder::PrepareDownstreamResponse(&resp, false);
    assert(resp.getHeader("Content-Length").empty());
    assert(resp.getHeader("Connection").empty());
    assert(resp.getHeader("X-App") == "1");

    HttpResponse head(false);
    head.setStatusCode(200);
    head.addHeader("Content-Length", "1234");
    RequestForwarder::PrepareDownstreamResponse(&head, true);
    assert(head.getHeader("Content-Length") == "1234");
    LOG_INFO << "PrepareDownstreamResponse PASS";
}

void testGatewayErrorMapping() {
    assert(GatewayError(GatewayErrorKind::kRouteNotFound, "").ToStatus() == 404);
    assert(GatewayError(GatewayErrorKind::kNoHealthyEndpoint, "").ToStatus() == 503);
    assert(GatewayError(GatewayErrorKind::kCircuitOpen, "").ToStatus() == 502);
    assert(GatewayError(GatewayErrorKind::kTimeout, "").ToStatus() == 504);
    assert(GatewayError(GatewayErrorKind::kConnectionFailure, "").ToStatus() == 502);
    assert(GatewayError(GatewayErrorKind::kBadRequest, "").ToStatus() == 400);
    assert(GatewayError(GatewayErrorKind::kBackendError, "", 503).ToStatus() == 503);
    assert(GatewayError(GatewayErrorKind::kBackendError, "").ToStatus() == 502);

    HttpResponse resp = GatewayError(GatewayErrorKind::kTimeout, "deadline exceeded").ToResponse();
    assert(resp.statusCode() == 504);
    assert(resp.getHeader(GatewayError::kHeader) == "Timeout");
    assert(resp.body() == "Gateway Timeout: deadline exceeded\n");
    LOG_INFO << "GatewayError PASS";
}

void testAttemptOutcomeNames() {
    assert(std::string(AttemptOutcomeName(AttemptOutcome::kSuccess)) == "success");
    assert(std::string(AttemptOutcomeName(AttemptOutcome::kBackendError)) == "backend_error");
    assert(std::string(AttemptOutcomeName(AttemptOutcome::kConnectionFailure)) == "connection_failure");
    LOG_INFO << "Outcome names PASS";
}

int main() {
    testStripHopByHop();
    testBuildUpstreamRequest();
    testPrepareDownstreamResponse();
    testGatewayErrorMapping();
    testAttemptOutcomeNames();
    return 0;
}
