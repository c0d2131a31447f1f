#include "gateway/protocol/HttpResponse.h"
#include "gateway/network/Buffer.h"
#include "gateway/common/StringUtil.h"

#include <cstdio>
#include <cstring>

namespace gateway {
namespace protocol {

namespace {

using gateway::common::IEquals;

bool StatusHasNoBody(int code) {
    return (code >= 100 && code < 200) || code == 204 || code == 304;
}

} // namespace

const char* HttpResponse::DefaultReason(int code) {
    switch (code) {
        case 200: return "OK";
        case 201: return "Created";
        case 202: return "Accepted";
        case 204: return "No Content";
        case 301: return "Moved Permanently";
        case 302: return "Found";
        case 304: return "Not Modified";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 408: return "Request Timeout";
        case 413: return "Payload Too Large";
        case 429: return "Too Many Requests";
        case 500: return "Internal Server Error";
        case 501: return "Not Implemented";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        case 504: return "Gateway Timeout";
        default: return "Unknown";
    }
}

HttpResponse HttpResponse::Plain(int code, const std::string& body, bool close) {
    HttpResponse resp(close);
    resp.setStatusCode(code);
    resp.setStatusMessage(DefaultReason(code));
    resp.setContentType("text/plain; charset=utf-8");
    resp.setBody(body);
    return resp;
}

void HttpResponse::appendToBuffer(gateway::network::Buffer* output) const {
    char buf[64];
    std::snprintf(buf, sizeof buf, "HTTP/1.1 %d ", statusCode_);
    output->Append(buf, std::strlen(buf));
    output->Append(statusMessage_.empty() ? std::string(DefaultReason(statusCode_)) : statusMessage_);
    output->Append("\r\n");

    output->Append(closeConnection_ ? "Connection: close\r\n" : "Connection: keep-alive\r\n");

    const bool explicitLength = headOnly_ && headers_.count("Content-Length") != 0;
    if (!StatusHasNoBody(statusCode_) && !explicitLength) {
        std::snprintf(buf, sizeof buf, "Content-Length: %zu\r\n", body_.size());
        output->Append(buf, std::strlen(buf));
    }

    for (const auto& header : headers_) {
        // framing headers are written above
        if (IEquals(header.first, "Connection") ||
            (!explicitLength && IEquals(header.first, "Content-Length"))) {
            continue;
        }
        output->Append(header.first);
        output->Append(": ");
        output->Append(header.second);
        output->Append("\r\n");
    }

    output->Append("\r\n");
    if (!headOnly_ && !StatusHasNoBody(statusCode_)) {
        output->Append(body_);
    }
}

} // namespace protocol
} // namespace gateway
