#include "gateway/forward/GatewayError.h"

namespace gateway {
namespace forward {

const char* const GatewayError::kHeader = "X-Gateway-Error";

const char* GatewayErrorKindName(GatewayErrorKind kind) {
    switch (kind) {
        case GatewayErrorKind::kRouteNotFound: return "RouteNotFound";
        case GatewayErrorKind::kNoHealthyEndpoint: return "NoHealthyEndpoint";
        case GatewayErrorKind::kCircuitOpen: return "CircuitOpen";
        case GatewayErrorKind::kTimeout: return "Timeout";
        case GatewayErrorKind::kBackendError: return "BackendError";
        case GatewayErrorKind::kConnectionFailure: return "ConnectionFailure";
        case GatewayErrorKind::kBadRequest: return "BadRequest";
    }
    return "Unknown";
}

int GatewayError::ToStatus() const {
    switch (kind_) {
        case GatewayErrorKind::kRouteNotFound: return 404;
        case GatewayErrorKind::kNoHealthyEndpoint: return 503;
        case GatewayErrorKind::kCircuitOpen: return 502;
        case GatewayErrorKind::kTimeout: return 504;
        case GatewayErrorKind::kBackendError: return backendStatus_ > 0 ? backendStatus_ : 502;
        case GatewayErrorKind::kConnectionFailure: return 502;
        case GatewayErrorKind::kBadRequest: return 400;
    }
    return 500;
}

gateway::protocol::HttpResponse GatewayError::ToResponse() const {
    const int status = ToStatus();
    std::string body;
    switch (kind_) {
        case GatewayErrorKind::kRouteNotFound: body = "Not Found: "; break;
        case GatewayErrorKind::kNoHealthyEndpoint: body = "Service Unavailable: "; break;
        case GatewayErrorKind::kCircuitOpen: body = "Bad Gateway: circuit open: "; break;
        case GatewayErrorKind::kTimeout: body = "Gateway Timeout: "; break;
        case GatewayErrorKind::kConnectionFailure: body = "Bad Gateway: "; break;
        case GatewayErrorKind::kBadRequest: body = "Bad Request: "; break;
        case GatewayErrorKind::kBackendError:
            body = std::string(gateway::protocol::HttpResponse::DefaultReason(status)) + ": ";
            break;
    }
    body += message_;
    body += "\n";
    gateway::protocol::HttpResponse resp = gateway::protocol::HttpResponse::Plain(status, body);
    resp.addHeader(kHeader, name());
    return resp;
}

} // namespace forward
} // namespace gateway
