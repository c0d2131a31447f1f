#pragma once

#include "gateway/balancer/HealthChecker.h"

#include <string>

namespace gateway {
namespace balancer {

// GET <path> over a fresh connection; healthy when the status line arrives
// within the timeout with a code in [okStatusMin, okStatusMax].
class HttpHealthChecker : public HealthChecker {
public:
    HttpHealthChecker(gateway::network::EventLoop* loop,
                      double timeoutSec = 5.0,
                      std::string path = "/healthz",
                      int okStatusMin = 200,
                      int okStatusMax = 399);

    void Check(const gateway::network::InetAddress& addr, CheckCallback cb) override;

    const std::string& path() const { return path_; }

    // "HTTP/1.1 200 OK" -> 200, -1 when malformed.
    static int ParseHttpStatusCode(const std::string& statusLine);

private:
    static void SendRequest(const CheckContextPtr& ctx);
    static void ReadResponse(const CheckContextPtr& ctx, int okMin, int okMax);

    std::string path_;
    int okStatusMin_;
    int okStatusMax_;
};

} // namespace balancer
} // namespace gateway
