#pragma once

#include <optional>
#include <string>

namespace gateway {
namespace forward {

// W3C trace context: traceparent = "00-<32 hex trace>-<16 hex span>-<2 hex flags>".
struct TraceContext {
    std::string traceId;
    std::string spanId;
    std::string parentSpanId;  // empty when the request arrived without one
    std::string flags = "01";

    std::string ToTraceparent() const;

    // nullopt on malformed headers, version ff, or all-zero ids.
    static std::optional<TraceContext> Parse(const std::string& traceparent);

    // Continues a valid incoming trace with a fresh span of our own, or
    // starts a new trace.
    static TraceContext ForIncoming(const std::string& traceparent);

    // Lower-case hex of `bytes` random bytes.
    static std::string RandomHex(size_t bytes);
};

} // namespace forward
} // namespace gateway
