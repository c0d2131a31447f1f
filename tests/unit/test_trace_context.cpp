#include "gateway/common/Logger.h"
#include "gateway/forward/TraceContext.h"

#include <cassert>
#include <string>

using gateway::forward::TraceContext;

static const char* kValid = "00-4bf92f3577b34da6a3ce929d0e0e4736-00f067aa0ba902b7-01";

void testParse() {
    auto tc = TraceContext::Parse(kValid);
    assert(tc);
    assert(tc->traceId == "4bf92f3577b34da6a3ce929d0e0e4736");
    assert(tc->spanId == "00f067aa0ba902b7");
    assert(tc->flags == "01");
    assert(tc->ToTraceparent() == kValid);

    assert(!TraceContext::Parse(""));
    assert(!TraceContext::Parse("garbage"));
    // upper-case hex
    assert(!TraceContext::Parse("00-4BF92F3577B34DA6A3CE929D0E0E4736-00f067aa0ba902b7-01"));
    // all-zero ids
    assert(!TraceContext::Parse("00-00000000000000000000000000000000-00f067aa0ba902b7-01"));
    assert(!TraceContext::Parse("00-4bf92f3577b34da6a3ce929d0e0e4736-0000000000000000-01"));
    // forbidden version
    assert(!TraceContext::Parse("ff-4bf92f3577b34da6a3ce929d0e0e4736-00f067aa0ba902b7-01"));
    // version 00 must not carry trailing data
    assert(!TraceContext::Parse(std::string(kValid) + "-extra"));
    LOG_INFO << "Parse PASS";
}

void testForIncoming() {
    TraceContext continued = TraceContext::ForIncoming(kValid);
    assert(continued.traceId == "4bf92f3577b34da6a3ce929d0e0e4736");
    assert(continued.parentSpanId == "00f067aa0ba902b7");
    assert(continued.spanId.size() == 16);
    assert(continued.spanId != continued.parentSpanId);
    assert(TraceContext::Parse(continued.ToTraceparent()));

    TraceContext fresh = TraceContext::ForIncoming("not-a-traceparent");
    assert(fresh.traceId.size() == 32);
    assert(fresh.spanId.size() == 16);
    assert(fresh.parentSpanId.empty());
    assert(TraceContext::Parse(fresh.ToTraceparent()));

    TraceContext other = TraceContext::ForIncoming("");
    assert(other.traceId != fresh.traceId);
    LOG_INFO << "ForIncoming PASS";
}

void testRandomHex() {
    std::string hex = TraceContext::RandomHex(8);
    assert(hex.size() == 16);
    for (char c : hex) {
        assert((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'));
    }
    LOG_INFO << "RandomHex PASS";
}

int main() {
    testParse();
    testForIncoming();
    testRandomHex();
    return 0;
}
