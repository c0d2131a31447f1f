#include "gateway/balancer/HealthChecker.h"
#include "gateway/common/Logger.h"
#include "gateway/network/Channel.h"
#include "gateway/network/Socket.h"
#include "gateway/network/Timer.h"

#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>

namespace gateway {
namespace balancer {

using gateway::network::Channel;
using gateway::network::InetAddress;
using gateway::network::Socket;
using gateway::network::Timer;

HealthChecker::CheckContextPtr HealthChecker::BeginCheck(const InetAddress& addr,
                                                         CheckCallback cb,
                                                         std::function<void(const CheckContextPtr&)> onConnected) {
    const int sockfd = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, IPPROTO_TCP);
    if (sockfd < 0) {
        LOG_ERROR << "HealthChecker socket error errno=" << errno;
        cb(false, addr);
        return nullptr;
    }

    auto ctx = std::make_shared<CheckContext>();
    ctx->sockfd = sockfd;
    ctx->cb = std::move(cb);
    ctx->addr = addr;
    ctx->channel = std::make_shared<Channel>(loop_, sockfd);
    ctx->timer.reset(new Timer(loop_));

    std::weak_ptr<CheckContext> weak(ctx);
    ctx->timer->Start(timeoutSec_, [weak]() {
        if (auto c = weak.lock()) {
            LOG_DEBUG << "Health check to " << c->addr.toIpPort() << " timed out";
            Finish(c, false);
        }
    });

    // Channel callbacks hold the context until Finish breaks the cycle.
    auto connected = [ctx, onConnected]() {
        if (ctx->finished) return;
        if (!ctx->connected) {
            int err = Socket::GetSocketError(ctx->sockfd);
            if (err != 0) {
                Finish(ctx, false);
                return;
            }
            ctx->connected = true;
            ctx->channel->DisableWriting();
        }
        onConnected(ctx);
    };
    ctx->channel->SetWriteCallback(connected);
    ctx->channel->SetErrorCallback([ctx]() { Finish(ctx, false); });

    int ret = ::connect(sockfd, addr.getSockAddr(), sizeof(struct sockaddr_in));
    int savedErrno = (ret == 0) ? 0 : errno;
    if (ret == 0 || savedErrno == EISCONN) {
        connected();
    } else if (savedErrno == EINPROGRESS) {
        ctx->channel->EnableWriting();
    } else {
        Finish(ctx, false);
    }
    return ctx;
}

void HealthChecker::Finish(const CheckContextPtr& ctx, bool healthy) {
    if (ctx->finished) return;
    ctx->finished = true;

    std::shared_ptr<Channel> channel = std::move(ctx->channel);
    const int sockfd = ctx->sockfd;
    ctx->sockfd = -1;
    if (channel) {
        channel->SetReadCallback({});
        channel->SetWriteCallback({});
        channel->SetCloseCallback({});
        channel->SetErrorCallback({});
        channel->DisableAll();
        channel->Remove();
        // the poller may still hold the raw Channel pointer for this cycle
        channel->owner_loop()->QueueInLoop([channel, sockfd]() {
            ::close(sockfd);
        });
    }
    ctx->timer.reset();

    CheckCallback cb = std::move(ctx->cb);
    if (cb) cb(healthy, ctx->addr);
}

TcpHealthChecker::TcpHealthChecker(gateway::network::EventLoop* loop, double timeoutSec)
    : HealthChecker(loop, timeoutSec) {
}

void TcpHealthChecker::Check(const InetAddress& addr, CheckCallback cb) {
    loop_->RunInLoop([this, addr, cb]() {
        BeginCheck(addr, cb, [](const CheckContextPtr& ctx) { Finish(ctx, true); });
    });
}

} // namespace balancer
} // namespace gateway
