#include "gateway/network/InetAddress.h"

#include <arpa/inet.h>
#include <cstdio>
#include <cstring>
#include <netdb.h>

namespace gateway {
namespace network {

InetAddress::InetAddress(uint16_t port, bool loopbackOnly) {
    std::memset(&addr_, 0, sizeof addr_);
    addr_.sin_family = AF_INET;
    in_addr_t ip = loopbackOnly ? INADDR_LOOPBACK : INADDR_ANY;
    addr_.sin_addr.s_addr = htonl(ip);
    addr_.sin_port = htons(port);
}

InetAddress::InetAddress(const std::string& ip, uint16_t port) {
    std::memset(&addr_, 0, sizeof addr_);
    addr_.sin_family = AF_INET;
    addr_.sin_port = htons(port);
    if (::inet_pton(AF_INET, ip.c_str(), &addr_.sin_addr) <= 0) {
        addr_.sin_addr.s_addr = htonl(INADDR_NONE);
    }
}

std::string InetAddress::toIp() const {
    char buf[64] = "";
    ::inet_ntop(AF_INET, &addr_.sin_addr, buf, sizeof buf);
    return buf;
}

std::string InetAddress::toIpPort() const {
    char buf[64] = "";
    ::inet_ntop(AF_INET, &addr_.sin_addr, buf, sizeof buf);
    size_t end = std::strlen(buf);
    std::snprintf(buf + end, sizeof buf - end, ":%u", ntohs(addr_.sin_port));
    return buf;
}

uint16_t InetAddress::toPort() const {
    return ntohs(addr_.sin_port);
}

bool InetAddress::Resolve(const std::string& host, uint16_t port, InetAddress* out) {
    struct in_addr parsed;
    if (::inet_pton(AF_INET, host.c_str(), &parsed) == 1) {
        *out = InetAddress(host, port);
        return true;
    }

    struct addrinfo hints;
    std::memset(&hints, 0, sizeof hints);
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    struct addrinfo* result = nullptr;
    if (::getaddrinfo(host.c_str(), nullptr, &hints, &result) != 0 || result == nullptr) {
        return false;
    }
    struct sockaddr_in addr;
    std::memcpy(&addr, result->ai_addr, sizeof addr);
    ::freeaddrinfo(result);
    addr.sin_port = htons(port);
    out->setSockAddr(addr);
    return true;
}

bool InetAddress::ParsePort(const std::string& text, uint16_t* port) {
    const size_t first = text.find_first_not_of(" \t");
    if (first == std::string::npos) return false;
    const size_t last = text.find_last_not_of(" \t");
    unsigned long value = 0;
    for (size_t i = first; i <= last; ++i) {
        const char c = text[i];
        if (c < '0' || c > '9') return false;
        value = value * 10 + static_cast<unsigned long>(c - '0');
        if (value > 65535) return false;
    }
    if (value == 0) return false;
    *port = static_cast<uint16_t>(value);
    return true;
}

bool InetAddress::ParseHostPort(const std::string& hostPort, std::string* host, uint16_t* port) {
    const size_t colon = hostPort.rfind(':');
    if (colon == std::string::npos || colon == 0) return false;
    if (hostPort.find(':') != colon) return false;
    uint16_t parsed = 0;
    if (!ParsePort(hostPort.substr(colon + 1), &parsed)) return false;
    *host = hostPort.substr(0, colon);
    *port = parsed;
    return true;
}

} // namespace network
} // namespace gateway
