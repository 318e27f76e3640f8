#pragma once

#include "cmux/common/noncopyable.h"
#include "cmux/network/InetAddress.h"
#include "cmux/network/TcpConnection.h"

#include <cstddef>
#include <functional>
#include <memory>
#include <string>

namespace cmux {
namespace network {
class Buffer;
class EventLoop;
class TcpClient;
}

namespace tunnel {

enum class DialError {
    kRefused,
    kTimeout,
    kUnreachable,
    kOther,
};

DialError DialErrorFromErrno(int err);
const char* DialErrorToString(DialError err);

// Upstream half of one exchange or tunnel: a single dial to a fixed target
// and the connection it produces. Lives on the client connection's loop;
// every callback runs there.
class UpstreamSession : public std::enable_shared_from_this<UpstreamSession>,
                        cmux::common::noncopyable {
public:
    using EventCallback = std::function<void()>;
    using DialErrorCallback = std::function<void(DialError, int err)>;
    using DataCallback = std::function<void(network::Buffer*)>;

    UpstreamSession(network::EventLoop* loop,
                    const network::InetAddress& target,
                    const std::string& name,
                    int connectTimeoutMs,
                    size_t highWaterMarkBytes);
    ~UpstreamSession();

    void SetConnectedCallback(const EventCallback& cb) { connectedCallback_ = cb; }
    void SetDialErrorCallback(const DialErrorCallback& cb) { dialErrorCallback_ = cb; }
    void SetMessageCallback(const DataCallback& cb) { messageCallback_ = cb; }
    // Upstream sent EOF; our write side is still open.
    void SetHalfCloseCallback(const EventCallback& cb) { halfCloseCallback_ = cb; }
    void SetCloseCallback(const EventCallback& cb) { closeCallback_ = cb; }
    // Output toward upstream passed / fell back under the high-water mark.
    void SetHighWaterMarkCallback(const EventCallback& cb) { highWaterMarkCallback_ = cb; }
    void SetWriteCompleteCallback(const EventCallback& cb) { writeCompleteCallback_ = cb; }

    void Start();

    void Send(const void* data, size_t len);
    void Send(network::Buffer* buf);
    // Half-close toward upstream after queued bytes are written.
    void ShutdownWrite();
    void StartRead();
    void StopRead();

    // Drops every callback and closes the connection (or cancels the dial).
    // Safe to call from inside any of this session's callbacks.
    void Close();

    // For an upstream that already sent EOF: stop reporting events, let the
    // queued output drain and the connection close on its own. The session
    // keeps itself alive until then.
    void Release();

    bool connected() const { return conn_ && conn_->connected(); }
    bool peerClosedWrite() const { return conn_ && conn_->peerClosedWrite(); }
    const network::InetAddress& target() const { return target_; }
    const network::TcpConnectionPtr& connection() const { return conn_; }

private:
    void OnConnection(const network::TcpConnectionPtr& conn);
    void OnMessage(const network::TcpConnectionPtr& conn, network::Buffer* buf);
    void OnHalfClose(const network::TcpConnectionPtr& conn);
    void OnConnectError(int err);
    void ClearCallbacks();

    network::EventLoop* loop_;
    const network::InetAddress target_;
    const std::string name_;
    const int connectTimeoutMs_;
    const size_t highWaterMark_;
    std::shared_ptr<network::TcpClient> client_;
    network::TcpConnectionPtr conn_;
    bool closed_;

    EventCallback connectedCallback_;
    DialErrorCallback dialErrorCallback_;
    DataCallback messageCallback_;
    EventCallback halfCloseCallback_;
    EventCallback closeCallback_;
    EventCallback highWaterMarkCallback_;
    EventCallback writeCompleteCallback_;
};

using UpstreamSessionPtr = std::shared_ptr<UpstreamSession>;

} // namespace tunnel
} // namespace cmux
