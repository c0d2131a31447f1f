#pragma once

#include "gateway/forward/TraceContext.h"

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <string>

namespace gateway {
namespace forward {

// Per-request state owned by the request's exchange. Middleware may add
// metadata but does not influence routing.
struct RequestContext {
    using Clock = std::chrono::steady_clock;

    TraceContext trace;
    std::string clientIp;
    uint16_t clientPort = 0;
    std::string method;
    std::string path;
    size_t requestBytes = 0;

    Clock::time_point start = Clock::now();
    Clock::time_point deadline = Clock::time_point::max();
    int attempts = 0;

    std::string routeId;
    std::string lastEndpointId;
    std::map<std::string, std::string> metadata;

    // Prefix for every log line on the request path.
    std::string LogTag() const { return "[trace=" + trace.traceId + "] "; }

    int64_t ElapsedMs() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count();
    }
};

using RequestContextPtr = std::shared_ptr<RequestContext>;

} // namespace forward
} // namespace gateway
