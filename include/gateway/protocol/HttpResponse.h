#pragma once

#include "gateway/protocol/HttpHeaders.h"

#include <string>

namespace gateway {
namespace network {
class Buffer;
}

namespace protocol {

class HttpResponse {
public:
    enum HttpStatusCode {
        kUnknown,
        k200Ok = 200,
        k400BadRequest = 400,
        k404NotFound = 404,
        k405MethodNotAllowed = 405,
        k500InternalServerError = 500,
        k502BadGateway = 502,
        k503ServiceUnavailable = 503,
        k504GatewayTimeout = 504,
    };

    explicit HttpResponse(bool close = false)
        : statusCode_(kUnknown), closeConnection_(close), headOnly_(false) {}

    void setStatusCode(int code) { statusCode_ = code; }
    int statusCode() const { return statusCode_; }
    void setStatusMessage(const std::string& message) { statusMessage_ = message; }
    const std::string& statusMessage() const { return statusMessage_; }
    void setCloseConnection(bool on) { closeConnection_ = on; }
    bool closeConnection() const { return closeConnection_; }
    void setContentType(const std::string& contentType) { addHeader("Content-Type", contentType); }

    // Answer to a HEAD request: headers only, Content-Length kept as given.
    void setHeadOnly(bool on) { headOnly_ = on; }

    void addHeader(const std::string& key, const std::string& value) { headers_[key] = value; }
    void removeHeader(const std::string& key) { headers_.erase(key); }
    std::string getHeader(const std::string& key) const {
        auto it = headers_.find(key);
        return it == headers_.end() ? std::string() : it->second;
    }
    const HttpHeaders& headers() const { return headers_; }
    HttpHeaders& mutableHeaders() { return headers_; }

    void setBody(const std::string& body) { body_ = body; }
    void appendBody(const char* data, size_t len) { body_.append(data, len); }
    const std::string& body() const { return body_; }

    void appendToBuffer(gateway::network::Buffer* output) const;

    static const char* DefaultReason(int code);
    // Plain-text response with the given status and body.
    static HttpResponse Plain(int code, const std::string& body, bool close = false);

private:
    int statusCode_;
    std::string statusMessage_;
    bool closeConnection_;
    bool headOnly_;
    HttpHeaders headers_;
    std::string body_;
};

} // namespace protocol
} // namespace gateway
