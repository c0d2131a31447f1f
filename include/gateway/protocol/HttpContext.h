#pragma once

#include "gateway/network/Callbacks.h"
#include "gateway/protocol/HttpRequest.h"

#include <chrono>
#include <deque>
#include <functional>

namespace gateway {
namespace network {
class Buffer;
}

namespace protocol {

// Per-connection HTTP/1.1 request parser plus the pipelining queue: requests
// parsed ahead of the in-flight one wait in order.
class HttpContext {
public:
    enum HttpRequestParseState {
        kExpectRequestLine,
        kExpectHeaders,
        kExpectBody,
        kGotAll,
    };

    static const size_t kMaxHeaderBytes = 64 * 1024;
    static const size_t kMaxBodyBytes = 16 * 1024 * 1024;

    HttpContext()
        : state_(kExpectRequestLine) {}

    // false on a malformed or oversized request
    bool parseRequest(gateway::network::Buffer* buf, std::chrono::system_clock::time_point receiveTime);

    bool gotAll() const { return state_ == kGotAll; }
    void reset();

    const HttpRequest& request() const { return request_; }
    HttpRequest& request() { return request_; }

    std::deque<HttpRequest>& pending() { return pending_; }
    bool inFlight() const { return inFlight_; }
    void setInFlight(bool on) { inFlight_ = on; }
    bool closeAfterResponse() const { return closeAfterResponse_; }
    void setCloseAfterResponse(bool on) { closeAfterResponse_ = on; }

    // Invoked if the connection drops while a request is in flight.
    void setCancelHandler(std::function<void()> cb) { cancelHandler_ = std::move(cb); }
    std::function<void()> takeCancelHandler() {
        std::function<void()> cb;
        cb.swap(cancelHandler_);
        return cb;
    }

    // Hands the next queued request to the server once a response is out.
    using Dispatcher = std::function<void(const gateway::network::TcpConnectionPtr&)>;
    void setDispatcher(Dispatcher d) { dispatcher_ = std::move(d); }
    const Dispatcher& dispatcher() const { return dispatcher_; }

private:
    bool processRequestLine(const char* begin, const char* end);
    bool processChunkedBody(gateway::network::Buffer* buf, bool* hasMore);

    HttpRequestParseState state_;
    HttpRequest request_;
    size_t headerBytes_{0};

    bool chunked_{false};
    size_t bodyRemaining_{0};
    size_t chunkSize_{0};
    bool expectingChunkSize_{true};

    std::deque<HttpRequest> pending_;
    bool inFlight_{false};
    bool closeAfterResponse_{false};
    std::function<void()> cancelHandler_;
    Dispatcher dispatcher_;
};

} // namespace protocol
} // namespace gateway
