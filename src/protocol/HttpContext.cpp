#include "gateway/protocol/HttpContext.h"
#include "gateway/network/Buffer.h"
#include "gateway/common/StringUtil.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace gateway {
namespace protocol {

bool HttpRequest::keepAlive() const {
    const std::string connection = getHeader("Connection");
    if (gateway::common::HeaderContainsToken(connection, "close")) {
        return false;
    }
    if (version_ == kHttp10) {
        return gateway::common::HeaderContainsToken(connection, "keep-alive");
    }
    return true;
}

void HttpContext::reset() {
    state_ = kExpectRequestLine;
    HttpRequest dummy;
    request_.swap(dummy);
    headerBytes_ = 0;
    chunked_ = false;
    bodyRemaining_ = 0;
    chunkSize_ = 0;
    expectingChunkSize_ = true;
}

bool HttpContext::processRequestLine(const char* begin, const char* end) {
    bool succeed = false;
    const char* start = begin;
    const char* space = std::find(start, end, ' ');
    if (space != end && request_.setMethod(start, space)) {
        start = space + 1;
        space = std::find(start, end, ' ');
        if (space != end && start != space && *start == '/') {
            const char* question = std::find(start, space, '?');
            if (question != space) {
                request_.setPath(start, question);
                request_.setQuery(question, space);
            } else {
                request_.setPath(start, space);
            }
            start = space + 1;
            succeed = end - start == 8 && std::equal(start, end - 1, "HTTP/1.");
            if (succeed) {
                if (*(end - 1) == '1') {
                    request_.setVersion(HttpRequest::kHttp11);
                } else if (*(end - 1) == '0') {
                    request_.setVersion(HttpRequest::kHttp10);
                } else {
                    succeed = false;
                }
            }
        }
    }
    return succeed;
}

bool HttpContext::processChunkedBody(gateway::network::Buffer* buf, bool* hasMore) {
    while (true) {
        if (expectingChunkSize_) {
            std::string line;
            if (!buf->RetrieveLine(&line)) {
                *hasMore = false;
                return true;
            }

            auto semi = line.find(';');
            if (semi != std::string::npos) line.resize(semi);
            char* endp = nullptr;
            unsigned long long sz = std::strtoull(line.c_str(), &endp, 16);
            if (endp == line.c_str()) {
                return false;
            }
            if (request_.body().size() + sz > kMaxBodyBytes) {
                return false;
            }
            chunkSize_ = static_cast<size_t>(sz);
            expectingChunkSize_ = false;
            if (chunkSize_ == 0) {
                // trailers (ignored) end with an empty line
                while (true) {
                    std::string trailer;
                    if (!buf->RetrieveLine(&trailer)) {
                        // keep waiting; re-enter at the terminal chunk
                        expectingChunkSize_ = false;
                        *hasMore = false;
                        return true;
                    }
                    if (trailer.empty()) {
                        state_ = kGotAll;
                        *hasMore = false;
                        return true;
                    }
                }
            }
        }

        if (chunkSize_ == 0) {
            // re-entered while waiting for trailers
            std::string trailer;
            if (!buf->RetrieveLine(&trailer)) {
                *hasMore = false;
                return true;
            }
            if (trailer.empty()) {
                state_ = kGotAll;
                *hasMore = false;
                return true;
            }
            continue;
        }

        if (buf->ReadableBytes() < chunkSize_ + 2) {
            *hasMore = false;
            return true;
        }
        request_.appendBody(buf->Peek(), chunkSize_);
        buf->Retrieve(chunkSize_);
        if (!buf->RetrieveCRLF()) {
            return false;
        }
        expectingChunkSize_ = true;
    }
}

bool HttpContext::parseRequest(gateway::network::Buffer* buf, std::chrono::system_clock::time_point receiveTime) {
    bool ok = true;
    bool hasMore = true;
    while (hasMore && ok) {
        if (state_ == kExpectRequestLine) {
            const char* crlf = buf->FindCRLF();
            if (crlf) {
                request_.setReceiveTime(receiveTime);
                headerBytes_ += crlf + 2 - buf->Peek();
                ok = processRequestLine(buf->Peek(), crlf);
                if (ok) {
                    buf->RetrieveUntil(crlf + 2);
                    state_ = kExpectHeaders;
                }
            } else {
                ok = buf->ReadableBytes() <= kMaxHeaderBytes;
                hasMore = false;
            }
        } else if (state_ == kExpectHeaders) {
            const char* crlf = buf->FindCRLF();
            if (crlf == nullptr) {
                ok = headerBytes_ + buf->ReadableBytes() <= kMaxHeaderBytes;
                hasMore = false;
                continue;
            }
            headerBytes_ += crlf + 2 - buf->Peek();
            if (headerBytes_ > kMaxHeaderBytes) {
                ok = false;
                continue;
            }
            const char* colon = std::find(buf->Peek(), crlf, ':');
            if (colon != crlf) {
                request_.addHeader(buf->Peek(), colon, crlf);
                buf->RetrieveUntil(crlf + 2);
                continue;
            }
            if (crlf != buf->Peek()) {
                // header line without a colon
                ok = false;
                continue;
            }
            buf->RetrieveUntil(crlf + 2);

            const std::string te = request_.getHeader("Transfer-Encoding");
            if (gateway::common::HeaderContainsToken(te, "chunked")) {
                chunked_ = true;
            } else {
                const std::string cl = request_.getHeader("Content-Length");
                if (!cl.empty()) {
                    char* endp = nullptr;
                    long long v = std::strtoll(cl.c_str(), &endp, 10);
                    if (endp == cl.c_str() || *endp != '\0' || v < 0 ||
                        static_cast<unsigned long long>(v) > kMaxBodyBytes) {
                        ok = false;
                        continue;
                    }
                    bodyRemaining_ = static_cast<size_t>(v);
                }
            }
            state_ = (chunked_ || bodyRemaining_ > 0) ? kExpectBody : kGotAll;
            hasMore = (state_ != kGotAll);
        } else if (state_ == kExpectBody) {
            if (chunked_) {
                ok = processChunkedBody(buf, &hasMore);
            } else {
                const size_t n = std::min(bodyRemaining_, buf->ReadableBytes());
                if (n > 0) {
                    request_.appendBody(buf->Peek(), n);
                    buf->Retrieve(n);
                    bodyRemaining_ -= n;
                }
                if (bodyRemaining_ == 0) {
                    state_ = kGotAll;
                }
                hasMore = false;
            }
        } else {
            hasMore = false;
        }
    }
    return ok;
}

} // namespace protocol
} // namespace gateway
