#pragma once

#include "cmux/common/noncopyable.h"
#include "cmux/network/TcpConnection.h"
#include <mutex>

namespace cmux {
namespace network {

class Connector;
class EventLoop;

// Outbound connection with a single, time-bounded connect attempt.
// Destroy it on its loop thread, never from inside one of its own callbacks.
class TcpClient : cmux::common::noncopyable {
public:
    TcpClient(EventLoop* loop, const InetAddress& serverAddr, const std::string& nameArg);
    ~TcpClient();

    void Connect();
    void Disconnect();
    void Stop();

    TcpConnectionPtr connection() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return connection_;
    }

    EventLoop* getLoop() const { return loop_; }
    const std::string& name() const { return name_; }
    const InetAddress& serverAddress() const;

    void SetConnectTimeoutMs(int ms);

    void SetConnectionCallback(const ConnectionCallback& cb) { connectionCallback_ = cb; }
    void SetMessageCallback(const MessageCallback& cb) { messageCallback_ = cb; }
    void SetWriteCompleteCallback(const WriteCompleteCallback& cb) { writeCompleteCallback_ = cb; }
    void SetHalfCloseCallback(const HalfCloseCallback& cb) { halfCloseCallback_ = cb; }
    void SetConnectErrorCallback(const ConnectErrorCallback& cb) { connectErrorCallback_ = cb; }

private:
    void NewConnection(int sockfd);
    void ConnectFailed(int err);
    void RemoveConnection(const TcpConnectionPtr& conn);

    EventLoop* loop_;
    std::shared_ptr<Connector> connector_;
    const std::string name_;

    ConnectionCallback connectionCallback_;
    MessageCallback messageCallback_;
    WriteCompleteCallback writeCompleteCallback_;
    HalfCloseCallback halfCloseCallback_;
    ConnectErrorCallback connectErrorCallback_;

    bool connect_;
    int nextConnId_;
    mutable std::mutex mutex_;
    TcpConnectionPtr connection_;
};

} // namespace network
} // namespace cmux
