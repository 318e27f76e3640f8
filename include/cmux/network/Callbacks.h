#pragma once

#include <memory>
#include <functional>
#include <chrono>

namespace cmux {
namespace network {

class TcpConnection;
class Buffer;

using TcpConnectionPtr = std::shared_ptr<TcpConnection>;
using ConnectionCallback = std::function<void(const TcpConnectionPtr&)>;
using CloseCallback = std::function<void(const TcpConnectionPtr&)>;
using WriteCompleteCallback = std::function<void(const TcpConnectionPtr&)>;
// Peer finished sending (read returned 0); the write half is still open.
using HalfCloseCallback = std::function<void(const TcpConnectionPtr&)>;

using MessageCallback = std::function<void(const TcpConnectionPtr&,
                                           Buffer*,
                                           std::chrono::system_clock::time_point)>;

using HighWaterMarkCallback = std::function<void(const TcpConnectionPtr&, size_t)>;

// errno of a failed outbound connect (ETIMEDOUT when the dial timer fired).
using ConnectErrorCallback = std::function<void(int err)>;

} // namespace network
} // namespace cmux
