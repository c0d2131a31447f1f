#pragma once

#include <chrono>
#include <functional>
#include <memory>

namespace gateway {
namespace network {

class Buffer;
class TcpConnection;

using TcpConnectionPtr = std::shared_ptr<TcpConnection>;

// Downstream and upstream connections share these.
using ConnectionCallback = std::function<void(const TcpConnectionPtr&)>;
using CloseCallback = std::function<void(const TcpConnectionPtr&)>;
using MessageCallback = std::function<void(const TcpConnectionPtr&,
                                           Buffer*,
                                           std::chrono::system_clock::time_point)>;

// Upstream only. err is the errno of the failed connect (or of socket()).
using ConnectFailureCallback = std::function<void(int err)>;

} // namespace network
} // namespace gateway
