#include "gateway/balancer/HttpHealthChecker.h"
#include "gateway/network/Channel.h"

#include <sys/socket.h>

#include <cerrno>

namespace gateway {
namespace balancer {

HttpHealthChecker::HttpHealthChecker(gateway::network::EventLoop* loop,
                                     double timeoutSec,
                                     std::string path,
                                     int okStatusMin,
                                     int okStatusMax)
    : HealthChecker(loop, timeoutSec),
      path_(std::move(path)),
      okStatusMin_(okStatusMin),
      okStatusMax_(okStatusMax) {
    if (path_.empty() || path_[0] != '/') {
        path_ = "/" + path_;
    }
}

void HttpHealthChecker::Check(const gateway::network::InetAddress& addr, CheckCallback cb) {
    // Checks may outlive this checker when the service's settings change.
    const std::string path = path_;
    const int okMin = okStatusMin_;
    const int okMax = okStatusMax_;
    loop_->RunInLoop([this, addr, cb, path, okMin, okMax]() {
        BeginCheck(addr, cb, [path, okMin, okMax](const CheckContextPtr& ctx) {
            if (ctx->out.empty()) {
                ctx->out = "GET " + path + " HTTP/1.1\r\n"
                           "Host: " + ctx->addr.toIpPort() + "\r\n"
                           "User-Agent: datum-gateway-health\r\n"
                           "Connection: close\r\n"
                           "\r\n";
                ctx->channel->SetReadCallback(
                    [ctx, okMin, okMax](std::chrono::system_clock::time_point) { ReadResponse(ctx, okMin, okMax); });
                ctx->channel->EnableReading();
            }
            SendRequest(ctx);
        });
    });
}

void HttpHealthChecker::SendRequest(const CheckContextPtr& ctx) {
    while (ctx->outOffset < ctx->out.size()) {
        const char* p = ctx->out.data() + ctx->outOffset;
        const size_t left = ctx->out.size() - ctx->outOffset;
        const ssize_t n = ::send(ctx->sockfd, p, left, MSG_NOSIGNAL);
        if (n > 0) {
            ctx->outOffset += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            ctx->channel->EnableWriting();
            return;
        }
        Finish(ctx, false);
        return;
    }
    if (ctx->channel->IsWriting()) {
        ctx->channel->DisableWriting();
    }
}

void HttpHealthChecker::ReadResponse(const CheckContextPtr& ctx, int okMin, int okMax) {
    if (ctx->finished) return;

    char buf[4096];
    while (true) {
        const ssize_t n = ::recv(ctx->sockfd, buf, sizeof(buf), 0);
        if (n > 0) {
            ctx->in.append(buf, buf + n);
            const size_t pos = ctx->in.find("\r\n");
            if (pos != std::string::npos) {
                const int code = ParseHttpStatusCode(ctx->in.substr(0, pos));
                Finish(ctx, code >= okMin && code <= okMax);
                return;
            }
            if (ctx->in.size() > 8192) {
                Finish(ctx, false);
                return;
            }
            continue;
        }
        if (n == 0) {
            Finish(ctx, false);
            return;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return;
        }
        Finish(ctx, false);
        return;
    }
}

int HttpHealthChecker::ParseHttpStatusCode(const std::string& line) {
    if (line.compare(0, 5, "HTTP/") != 0) return -1;
    const size_t sp1 = line.find(' ');
    if (sp1 == std::string::npos) return -1;
    const size_t sp2 = line.find(' ', sp1 + 1);
    const std::string codeStr = (sp2 == std::string::npos) ? line.substr(sp1 + 1) : line.substr(sp1 + 1, sp2 - sp1 - 1);
    if (codeStr.size() != 3) return -1;
    int code = 0;
    for (char c : codeStr) {
        if (c < '0' || c > '9') return -1;
        code = code * 10 + (c - '0');
    }
    return code;
}

} // namespace balancer
} // namespace gateway
