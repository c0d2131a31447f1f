#include "gateway/protocol/HttpResponseContext.h"
#include "gateway/network/Buffer.h"
#include "gateway/common/StringUtil.h"

#include <algorithm>
#include <cstdlib>

namespace gateway {
namespace protocol {

bool HttpResponseContext::processStatusLine(const char* begin, const char* end) {
    // HTTP/1.1 200 OK
    std::string line(begin, end);
    if (line.compare(0, 7, "HTTP/1.") != 0 || line.size() < 12 || line[8] != ' ') {
        return false;
    }
    const std::string code = line.substr(9, 3);
    if (!std::all_of(code.begin(), code.end(), [](char c) { return c >= '0' && c <= '9'; })) {
        return false;
    }
    response_.setStatusCode(std::atoi(code.c_str()));
    response_.setStatusMessage(line.size() > 13 ? line.substr(13) : std::string());
    return true;
}

void HttpResponseContext::beginBody() {
    const int code = response_.statusCode();
    if (headRequest_ || (code >= 100 && code < 200) || code == 204 || code == 304) {
        state_ = kGotAll;
        return;
    }
    const std::string te = response_.getHeader("Transfer-Encoding");
    const std::string cl = response_.getHeader("Content-Length");
    if (gateway::common::HeaderContainsToken(te, "chunked")) {
        chunked_ = true;
        state_ = kExpectBody;
    } else if (!cl.empty()) {
        char* endp = nullptr;
        long long v = std::strtoll(cl.c_str(), &endp, 10);
        if (endp == cl.c_str() || v < 0 || static_cast<unsigned long long>(v) > kMaxBodyBytes) {
            state_ = kError;
            return;
        }
        bodyRemaining_ = static_cast<size_t>(v);
        state_ = bodyRemaining_ > 0 ? kExpectBody : kGotAll;
    } else {
        untilClose_ = true;
        state_ = kExpectBody;
    }
}

bool HttpResponseContext::consumeChunked(gateway::network::Buffer* buf) {
    while (state_ == kExpectBody) {
        if (inTrailers_) {
            std::string trailer;
            if (!buf->RetrieveLine(&trailer)) return true;
            if (trailer.empty()) {
                state_ = kGotAll;
            }
            continue;
        }
        if (expectingChunkSize_) {
            std::string line;
            if (!buf->RetrieveLine(&line)) return true;
            auto semi = line.find(';');
            if (semi != std::string::npos) line.resize(semi);
            char* endp = nullptr;
            unsigned long long n = std::strtoull(line.c_str(), &endp, 16);
            if (endp == line.c_str()) return fail();
            if (response_.body().size() + n > kMaxBodyBytes) return fail();
            chunkSize_ = static_cast<size_t>(n);
            expectingChunkSize_ = false;
            if (chunkSize_ == 0) {
                inTrailers_ = true;
            }
            continue;
        }
        if (buf->ReadableBytes() < chunkSize_ + 2) return true;
        response_.appendBody(buf->Peek(), chunkSize_);
        buf->Retrieve(chunkSize_);
        if (!buf->RetrieveCRLF()) return fail();
        expectingChunkSize_ = true;
    }
    return true;
}

bool HttpResponseContext::parseResponse(gateway::network::Buffer* buf) {
    while (state_ != kGotAll && state_ != kError) {
        if (state_ == kExpectStatusLine || state_ == kExpectHeaders) {
            const char* crlf = buf->FindCRLF();
            if (crlf == nullptr) {
                if (headerBytes_ + buf->ReadableBytes() > kMaxHeaderBytes) return fail();
                return true;
            }
            headerBytes_ += crlf + 2 - buf->Peek();
            if (headerBytes_ > kMaxHeaderBytes) return fail();
            if (state_ == kExpectStatusLine) {
                if (!processStatusLine(buf->Peek(), crlf)) return fail();
                state_ = kExpectHeaders;
            } else if (crlf == buf->Peek()) {
                beginBody();
            } else {
                const char* colon = std::find(buf->Peek(), crlf, ':');
                if (colon == crlf) return fail();
                std::string field(buf->Peek(), colon);
                std::string value(colon + 1, crlf);
                value.erase(0, value.find_first_not_of(" \t"));
                value.erase(value.find_last_not_of(" \t") + 1);
                auto& headers = response_.mutableHeaders();
                auto it = headers.find(field);
                if (it == headers.end()) {
                    headers.emplace(field, value);
                } else {
                    it->second += ", " + value;
                }
            }
            buf->RetrieveUntil(crlf + 2);
        } else if (chunked_) {
            if (!consumeChunked(buf)) return false;
            if (state_ == kExpectBody) return true;
        } else if (untilClose_) {
            if (response_.body().size() + buf->ReadableBytes() > kMaxBodyBytes) return fail();
            response_.appendBody(buf->Peek(), buf->ReadableBytes());
            buf->RetrieveAll();
            return true;
        } else {
            const size_t n = std::min(bodyRemaining_, buf->ReadableBytes());
            response_.appendBody(buf->Peek(), n);
            buf->Retrieve(n);
            bodyRemaining_ -= n;
            if (bodyRemaining_ == 0) {
                state_ = kGotAll;
            } else {
                return true;
            }
        }
    }
    return state_ != kError;
}

bool HttpResponseContext::finishOnEof() {
    if (state_ == kExpectBody && untilClose_) {
        state_ = kGotAll;
    }
    return state_ == kGotAll;
}

} // namespace protocol
} // namespace gateway
