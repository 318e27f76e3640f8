#pragma once

#include "cmux/common/noncopyable.h"
#include "cmux/network/InetAddress.h"
#include "cmux/network/Callbacks.h"
#include "cmux/network/TcpConnection.h"
#include "cmux/network/EventLoopThreadPool.h"

#include <atomic>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace cmux {
namespace network {

class EventLoop;
class Acceptor;

// Accepts on one or more addresses from the base loop and hands each
// connection to an I/O loop chosen round robin.
class TcpServer : cmux::common::noncopyable {
public:
    enum Option {
        kNoReusePort,
        kReusePort,
    };

    // Binds listenAddr immediately; throws std::system_error on failure.
    TcpServer(EventLoop* loop,
              const InetAddress& listenAddr,
              const std::string& nameArg,
              Option option = kNoReusePort);
    ~TcpServer();

    // Additional listener sharing the same callbacks and I/O loops.
    // Throws std::system_error on bind failure.
    void AddListenAddress(const InetAddress& listenAddr);

    const std::string& hostport() const { return hostport_; }
    const std::string& name() const { return name_; }
    EventLoop* getLoop() const { return loop_; }
    const std::vector<InetAddress>& listenAddresses() const { return listenAddrs_; }

    void SetThreadNum(int numThreads);

    // Starts the I/O threads and begins listening. Idempotent.
    void Start();

    void SetConnectionCallback(const ConnectionCallback& cb) { connectionCallback_ = cb; }
    void SetMessageCallback(const MessageCallback& cb) { messageCallback_ = cb; }
    void SetWriteCompleteCallback(const WriteCompleteCallback& cb) { writeCompleteCallback_ = cb; }

private:
    void NewConnection(int sockfd, const InetAddress& peerAddr);
    void RemoveConnection(const TcpConnectionPtr& conn);
    void RemoveConnectionInLoop(const TcpConnectionPtr& conn);

    using ConnectionMap = std::map<std::string, TcpConnectionPtr>;

    EventLoop* loop_;
    const std::string hostport_;
    const std::string name_;
    const bool reusePort_;
    std::vector<std::unique_ptr<Acceptor>> acceptors_;
    std::vector<InetAddress> listenAddrs_;

    std::unique_ptr<EventLoopThreadPool> threadPool_;

    ConnectionCallback connectionCallback_;
    MessageCallback messageCallback_;
    WriteCompleteCallback writeCompleteCallback_;

    std::atomic_int started_;
    int next_conn_id_;
    ConnectionMap connections_;
};

} // namespace network
} // namespace cmux
