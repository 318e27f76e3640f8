#include "cmux/network/TcpServer.h"
#include "cmux/network/EventLoop.h"
#include "cmux/network/Acceptor.h"
#include "cmux/network/Socket.h"
#include "cmux/common/Logger.h"

#include <cstdio>
#include <functional>

namespace cmux {
namespace network {

TcpServer::TcpServer(EventLoop* loop,
                     const InetAddress& listenAddr,
                     const std::string& nameArg,
                     Option option)
    : loop_(loop),
      hostport_(listenAddr.toIpPort()),
      name_(nameArg),
      reusePort_(option == kReusePort),
      threadPool_(new EventLoopThreadPool(loop, nameArg)),
      started_(0),
      next_conn_id_(1) {
    AddListenAddress(listenAddr);
}

TcpServer::~TcpServer() {
    LOG_DEBUG << "TcpServer::~TcpServer [" << name_ << "] destructing";
    for (auto& item : connections_) {
        TcpConnectionPtr conn(item.second);
        item.second.reset();
        conn->getLoop()->RunInLoop(std::bind(&TcpConnection::ConnectDestroyed, conn));
    }
}

void TcpServer::AddListenAddress(const InetAddress& listenAddr) {
    std::unique_ptr<Acceptor> acceptor(new Acceptor(loop_, listenAddr, reusePort_));
    acceptor->SetNewConnectionCallback(
        std::bind(&TcpServer::NewConnection, this, std::placeholders::_1, std::placeholders::_2));
    Acceptor* raw = acceptor.get();
    acceptors_.push_back(std::move(acceptor));
    listenAddrs_.push_back(raw->localAddress());
    if (started_ > 0) {
        loop_->RunInLoop([raw]() { raw->Listen(); });
    }
}

void TcpServer::SetThreadNum(int numThreads) {
    threadPool_->SetThreadNum(numThreads);
}

void TcpServer::Start() {
    if (started_++ == 0) {
        threadPool_->Start();
        for (auto& acceptor : acceptors_) {
            Acceptor* raw = acceptor.get();
            loop_->RunInLoop([raw]() { raw->Listen(); });
        }
    }
}

void TcpServer::NewConnection(int sockfd, const InetAddress& peerAddr) {
    char buf[64];
    std::snprintf(buf, sizeof buf, "-%s#%d", hostport_.c_str(), next_conn_id_);
    ++next_conn_id_;
    std::string connName = name_ + buf;

    LOG_DEBUG << "TcpServer::NewConnection [" << name_ << "] - new connection [" << connName
              << "] from " << peerAddr.toIpPort();

    EventLoop* ioLoop = threadPool_->GetNextLoop();

    InetAddress localAddr(Socket::GetLocalAddr(sockfd));
    TcpConnectionPtr conn(new TcpConnection(ioLoop,
                                            connName,
                                            sockfd,
                                            localAddr,
                                            peerAddr));
    connections_[connName] = conn;
    conn->SetConnectionCallback(connectionCallback_);
    conn->SetMessageCallback(messageCallback_);
    conn->SetWriteCompleteCallback(writeCompleteCallback_);
    conn->SetCloseCallback(
        std::bind(&TcpServer::RemoveConnection, this, std::placeholders::_1));

    ioLoop->RunInLoop(std::bind(&TcpConnection::ConnectEstablished, conn));
}

void TcpServer::RemoveConnection(const TcpConnectionPtr& conn) {
    // Always defer removal to avoid re-entrancy inside TcpConnection event callbacks.
    loop_->QueueInLoop(std::bind(&TcpServer::RemoveConnectionInLoop, this, conn));
}

void TcpServer::RemoveConnectionInLoop(const TcpConnectionPtr& conn) {
    LOG_DEBUG << "TcpServer::RemoveConnectionInLoop [" << name_ << "] - connection " << conn->name();
    connections_.erase(conn->name());

    EventLoop* ioLoop = conn->getLoop();
    ioLoop->QueueInLoop(
        std::bind(&TcpConnection::ConnectDestroyed, conn));
}

} // namespace network
} // namespace cmux
