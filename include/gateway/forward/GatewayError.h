#pragma once

#include "gateway/protocol/HttpResponse.h"

#include <string>

namespace gateway {
namespace forward {

enum class GatewayErrorKind {
    kRouteNotFound,
    kNoHealthyEndpoint,
    kCircuitOpen,
    kTimeout,
    kBackendError,
    kConnectionFailure,
    kBadRequest,
};

const char* GatewayErrorKindName(GatewayErrorKind kind);

// A request-path failure as the client sees it.
class GatewayError {
public:
    GatewayError(GatewayErrorKind kind, std::string message, int backendStatus = 0)
        : kind_(kind), message_(std::move(message)), backendStatus_(backendStatus) {}

    GatewayErrorKind kind() const { return kind_; }
    const char* name() const { return GatewayErrorKindName(kind_); }
    const std::string& message() const { return message_; }
    int backendStatus() const { return backendStatus_; }

    // 404, 503, 502, 504, backend status, 502, 400.
    int ToStatus() const;

    // Plain-text reply carrying X-Gateway-Error. A BackendError is normally
    // answered with the backend's own response instead.
    gateway::protocol::HttpResponse ToResponse() const;

    static const char* const kHeader;

private:
    GatewayErrorKind kind_;
    std::string message_;
    int backendStatus_;
};

} // namespace forward
} // namespace gateway
