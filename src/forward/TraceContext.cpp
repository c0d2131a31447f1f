#include "gateway/forward/TraceContext.h"
#include "gateway/common/Logger.h"

#include <openssl/err.h>
#include <openssl/rand.h>

#include <chrono>
#include <random>
#include <vector>

namespace gateway {
namespace forward {

namespace {

bool IsLowerHex(const std::string& s, size_t pos, size_t len) {
    if (pos + len > s.size()) return false;
    for (size_t i = pos; i < pos + len; ++i) {
        const char c = s[i];
        if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) return false;
    }
    return true;
}

bool AllZero(const std::string& s) {
    return s.find_first_not_of('0') == std::string::npos;
}

} // namespace

std::string TraceContext::ToTraceparent() const {
    return "00-" + traceId + "-" + spanId + "-" + flags;
}

std::optional<TraceContext> TraceContext::Parse(const std::string& header) {
    // version(2) '-' trace(32) '-' span(16) '-' flags(2)
    if (header.size() < 55 || header[2] != '-' || header[35] != '-' || header[52] != '-') {
        return std::nullopt;
    }
    if (!IsLowerHex(header, 0, 2) || header.compare(0, 2, "ff") == 0) {
        return std::nullopt;
    }
    // version 00 has exactly four fields; later versions may append more
    if (header.compare(0, 2, "00") == 0 ? header.size() != 55 : (header.size() > 55 && header[55] != '-')) {
        return std::nullopt;
    }
    if (!IsLowerHex(header, 3, 32) || !IsLowerHex(header, 36, 16) || !IsLowerHex(header, 53, 2)) {
        return std::nullopt;
    }
    TraceContext ctx;
    ctx.traceId = header.substr(3, 32);
    ctx.spanId = header.substr(36, 16);
    ctx.flags = header.substr(53, 2);
    if (AllZero(ctx.traceId) || AllZero(ctx.spanId)) {
        return std::nullopt;
    }
    return ctx;
}

TraceContext TraceContext::ForIncoming(const std::string& traceparent) {
    TraceContext ctx;
    if (!traceparent.empty()) {
        if (auto incoming = Parse(traceparent)) {
            ctx.traceId = incoming->traceId;
            ctx.parentSpanId = incoming->spanId;
            ctx.flags = incoming->flags;
        } else {
            LOG_DEBUG << "Ignoring malformed traceparent: " << traceparent;
        }
    }
    if (ctx.traceId.empty()) {
        do {
            ctx.traceId = RandomHex(16);
        } while (AllZero(ctx.traceId));
    }
    do {
        ctx.spanId = RandomHex(8);
    } while (AllZero(ctx.spanId));
    return ctx;
}

std::string TraceContext::RandomHex(size_t bytes) {
    static const char kHex[] = "0123456789abcdef";
    std::vector<unsigned char> raw(bytes);
    if (RAND_bytes(raw.data(), static_cast<int>(raw.size())) != 1) {
        // ids only need to be unique, so a failed CSPRNG degrades instead of failing the request
        LOG_WARN << "RAND_bytes failed: " << ERR_get_error();
        thread_local std::mt19937_64 gen(
            static_cast<uint64_t>(std::chrono::steady_clock::now().time_since_epoch().count()) ^ std::random_device{}());
        for (auto& b : raw) {
            b = static_cast<unsigned char>(gen());
        }
    }
    std::string out;
    out.reserve(bytes * 2);
    for (unsigned char b : raw) {
        out.push_back(kHex[b >> 4]);
        out.push_back(kHex[b & 0x0f]);
    }
    return out;
}

} // namespace forward
} // namespace gateway
