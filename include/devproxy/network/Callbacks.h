#pragma once

#include <chrono>
#include <functional>
#include <memory>

namespace devproxy {
namespace network {

class TcpConnection;
class Buffer;

using TcpConnectionPtr = std::shared_ptr<TcpConnection>;
using ConnectionCallback = std::function<void(const TcpConnectionPtr&)>;
using CloseCallback = std::function<void(const TcpConnectionPtr&)>;
using WriteCompleteCallback = std::function<void(const TcpConnectionPtr&)>;

using MessageCallback = std::function<void(const TcpConnectionPtr&,
                                           Buffer*,
                                           std::chrono::system_clock::time_point)>;

using HighWaterMarkCallback = std::function<void(const TcpConnectionPtr&, size_t)>;

// errno of the failed connect (ECONNREFUSED, ETIMEDOUT, ...).
using ConnectFailedCallback = std::function<void(int err)>;

} // namespace network
} // namespace devproxy
