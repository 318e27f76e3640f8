#pragma once

#include "cmux/common/noncopyable.h"
#include "cmux/network/InetAddress.h"
#include "cmux/network/Callbacks.h"
#include "cmux/network/Buffer.h"

#include <memory>
#include <string>
#include <atomic>
#include <chrono>
#include <any>

namespace cmux {
namespace network {

class Channel;
class EventLoop;
class Socket;

// One established TCP connection, owned by shared_ptr and bound to one loop.
//
// With a half-close callback installed, a read EOF only ends the read side:
// the connection stays writable until Shutdown() drains and shuts the write
// side, at which point it closes fully. Without one, EOF closes at once.
class TcpConnection : cmux::common::noncopyable,
                      public std::enable_shared_from_this<TcpConnection> {
public:
    TcpConnection(EventLoop* loop,
                  const std::string& name,
                  int sockfd,
                  const InetAddress& localAddr,
                  const InetAddress& peerAddr);
    ~TcpConnection();

    EventLoop* getLoop() const { return loop_; }
    const std::string& name() const { return name_; }
    const InetAddress& localAddress() const { return localAddr_; }
    const InetAddress& peerAddress() const { return peerAddr_; }
    bool connected() const { return state_ == kConnected; }
    bool disconnected() const { return state_ == kDisconnected; }
    bool peerClosedWrite() const { return readShut_; }
    size_t pendingOutputBytes() const { return outputBuffer_.ReadableBytes(); }

    void SetContext(const std::any& context) { context_ = context; }
    const std::any& GetContext() const { return context_; }
    std::any* GetMutableContext() { return &context_; }

    // Thread safe
    void Send(const std::string& message);
    void Send(const void* data, size_t len);
    void Send(Buffer* buf);
    // Shuts the write side once pending output has drained.
    void Shutdown();
    void ForceClose();
    void StartRead();
    void StopRead();
    void SetTcpNoDelay(bool on);

    void SetConnectionCallback(const ConnectionCallback& cb) { connectionCallback_ = cb; }
    void SetMessageCallback(const MessageCallback& cb) { messageCallback_ = cb; }
    void SetWriteCompleteCallback(const WriteCompleteCallback& cb) { writeCompleteCallback_ = cb; }
    void SetHighWaterMarkCallback(const HighWaterMarkCallback& cb, size_t highWaterMark) { highWaterMarkCallback_ = cb; highWaterMark_ = highWaterMark; }
    void SetHalfCloseCallback(const HalfCloseCallback& cb) { halfCloseCallback_ = cb; }
    void SetCloseCallback(const CloseCallback& cb) { closeCallback_ = cb; }

    // Called when TcpServer accepts a new connection
    void ConnectEstablished();
    // Called when TcpServer has removed me from its map
    void ConnectDestroyed();

private:
    enum StateE { kDisconnected, kConnecting, kConnected, kDisconnecting };

    void HandleRead(std::chrono::system_clock::time_point receiveTime);
    void HandleWrite();
    void HandleClose();
    void HandleError();

    void SendInLoop(const void* message, size_t len);
    void ShutdownInLoop();
    void ForceCloseInLoop();
    void StartReadInLoop();
    void StopReadInLoop();

    void SetState(StateE s) { state_ = s; }
    static const char* StateToString(StateE s);

    EventLoop* loop_;
    const std::string name_;
    std::atomic<StateE> state_;
    bool reading_;
    bool readShut_;
    bool writeShut_;

    std::unique_ptr<Socket> socket_;
    std::unique_ptr<Channel> channel_;

    const InetAddress localAddr_;
    const InetAddress peerAddr_;

    ConnectionCallback connectionCallback_;
    MessageCallback messageCallback_;
    WriteCompleteCallback writeCompleteCallback_;
    HighWaterMarkCallback highWaterMarkCallback_;
    HalfCloseCallback halfCloseCallback_;
    CloseCallback closeCallback_;

    size_t highWaterMark_;

    Buffer inputBuffer_;
    Buffer outputBuffer_;

    std::any context_;
};

} // namespace network
} // namespace cmux
