#pragma once

#include "gateway/protocol/HttpHeaders.h"

#include <cctype>
#include <chrono>
#include <cstddef>
#include <string>

namespace gateway {
namespace protocol {

class HttpRequest {
public:
    enum Version {
        kUnknown, kHttp10, kHttp11
    };

    HttpRequest() : version_(kUnknown) {}

    void setVersion(Version v) { version_ = v; }
    Version getVersion() const { return version_; }
    const char* versionString() const { return version_ == kHttp10 ? "HTTP/1.0" : "HTTP/1.1"; }

    // Any RFC 7230 token is accepted; routes decide which methods they take.
    bool setMethod(const char* start, const char* end) {
        if (start == end) return false;
        for (const char* p = start; p != end; ++p) {
            unsigned char c = static_cast<unsigned char>(*p);
            if (!std::isalnum(c) && std::string("!#$%&'*+-.^_`|~").find(static_cast<char>(c)) == std::string::npos) {
                return false;
            }
        }
        method_.assign(start, end);
        return true;
    }
    void setMethod(const std::string& method) { method_ = method; }
    const std::string& method() const { return method_; }

    void setPath(const char* start, const char* end) { path_.assign(start, end); }
    void setPath(const std::string& path) { path_ = path; }
    const std::string& path() const { return path_; }

    // Includes the leading '?' when present.
    void setQuery(const char* start, const char* end) { query_.assign(start, end); }
    const std::string& query() const { return query_; }

    void addHeader(const char* start, const char* colon, const char* end) {
        std::string field(start, colon);
        ++colon;
        while (colon < end && std::isspace(static_cast<unsigned char>(*colon))) {
            ++colon;
        }
        std::string value(colon, end);
        while (!value.empty() && std::isspace(static_cast<unsigned char>(value[value.size() - 1]))) {
            value.resize(value.size() - 1);
        }
        addHeader(field, value);
    }

    // Repeated fields are folded into one comma-separated value.
    void addHeader(const std::string& field, const std::string& value) {
        auto it = headers_.find(field);
        if (it == headers_.end()) {
            headers_.emplace(field, value);
        } else {
            it->second += ", " + value;
        }
    }

    std::string getHeader(const std::string& field) const {
        auto it = headers_.find(field);
        return it == headers_.end() ? std::string() : it->second;
    }
    bool hasHeader(const std::string& field) const { return headers_.count(field) != 0; }

    void setHeader(const std::string& field, const std::string& value) { headers_[field] = value; }
    void removeHeader(const std::string& field) { headers_.erase(field); }

    const HttpHeaders& headers() const { return headers_; }
    HttpHeaders& mutableHeaders() { return headers_; }

    void setBody(const std::string& body) { body_ = body; }
    void appendBody(const char* data, size_t len) { body_.append(data, len); }
    const std::string& body() const { return body_; }

    bool keepAlive() const;

    void setReceiveTime(std::chrono::system_clock::time_point t) { receiveTime_ = t; }
    std::chrono::system_clock::time_point receiveTime() const { return receiveTime_; }

    void swap(HttpRequest& that) {
        method_.swap(that.method_);
        std::swap(version_, that.version_);
        path_.swap(that.path_);
        query_.swap(that.query_);
        headers_.swap(that.headers_);
        body_.swap(that.body_);
        std::swap(receiveTime_, that.receiveTime_);
    }

private:
    std::string method_;
    Version version_;
    std::string path_;
    std::string query_;
    HttpHeaders headers_;
    std::string body_;
    std::chrono::system_clock::time_point receiveTime_;
};

} // namespace protocol
} // namespace gateway
