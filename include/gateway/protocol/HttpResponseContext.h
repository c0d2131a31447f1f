#pragma once

#include "gateway/protocol/HttpResponse.h"

#include <cstddef>

namespace gateway {
namespace network {
class Buffer;
}

namespace protocol {

// Incremental HTTP/1.x response parser for backend replies. Collects status,
// headers and the de-chunked body into an HttpResponse.
// - Content-Length and Transfer-Encoding: chunked are framed exactly.
// - Without either, the body runs until the backend closes (FinishOnEof).
class HttpResponseContext {
public:
    enum ParseState { kExpectStatusLine, kExpectHeaders, kExpectBody, kGotAll, kError };

    static const size_t kMaxHeaderBytes = 64 * 1024;
    static const size_t kMaxBodyBytes = 64 * 1024 * 1024;

    // A reply to HEAD carries no body whatever its headers say.
    explicit HttpResponseContext(bool headRequest = false)
        : headRequest_(headRequest) {}

    // false once the stream is malformed
    bool parseResponse(gateway::network::Buffer* buf);
    // Connection closed by the backend; true if that completes the response.
    bool finishOnEof();

    bool gotAll() const { return state_ == kGotAll; }
    bool hasError() const { return state_ == kError; }
    bool headersComplete() const { return state_ == kExpectBody || state_ == kGotAll; }

    int statusCode() const { return response_.statusCode(); }
    const HttpResponse& response() const { return response_; }
    HttpResponse& response() { return response_; }

private:
    bool processStatusLine(const char* begin, const char* end);
    void beginBody();
    bool consumeChunked(gateway::network::Buffer* buf);
    bool fail() { state_ = kError; return false; }

    bool headRequest_;
    ParseState state_{kExpectStatusLine};
    HttpResponse response_;
    size_t headerBytes_{0};

    bool chunked_{false};
    bool untilClose_{false};
    size_t bodyRemaining_{0};
    bool expectingChunkSize_{true};
    bool inTrailers_{false};
    size_t chunkSize_{0};
};

} // namespace protocol
} // namespace gateway
