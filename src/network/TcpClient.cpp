#include "cmux/network/TcpClient.h"
#include "cmux/network/Connector.h"
#include "cmux/network/EventLoop.h"
#include "cmux/network/Socket.h"
#include "cmux/common/Logger.h"

#include <cstdio>

namespace cmux {
namespace network {

namespace detail {
void removeConnection(EventLoop* loop, const TcpConnectionPtr& conn) {
    loop->QueueInLoop(std::bind(&TcpConnection::ConnectDestroyed, conn));
}
} // namespace detail

TcpClient::TcpClient(EventLoop* loop, const InetAddress& serverAddr, const std::string& nameArg)
    : loop_(loop),
      connector_(std::make_shared<Connector>(loop, serverAddr)),
      name_(nameArg),
      connect_(true),
      nextConnId_(1) {
    connector_->SetNewConnectionCallback(
        std::bind(&TcpClient::NewConnection, this, std::placeholders::_1));
    connector_->SetErrorCallback(
        std::bind(&TcpClient::ConnectFailed, this, std::placeholders::_1));
    LOG_DEBUG << "TcpClient::TcpClient[" << name_ << "] - connector " << connector_.get();
}

TcpClient::~TcpClient() {
    LOG_DEBUG << "TcpClient::~TcpClient[" << name_ << "] - connector " << connector_.get();
    TcpConnectionPtr conn;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        conn = connection_;
    }
    if (conn) {
        // The connection may outlive us; route its teardown away from this object.
        CloseCallback cb = std::bind(&detail::removeConnection, loop_, std::placeholders::_1);
        loop_->RunInLoop([conn, cb]() {
            conn->SetCloseCallback(cb);
            conn->SetHalfCloseCallback(HalfCloseCallback());
        });
        conn->ForceClose();
    } else {
        connector_->Stop();
    }
}

const InetAddress& TcpClient::serverAddress() const {
    return connector_->serverAddress();
}

void TcpClient::SetConnectTimeoutMs(int ms) {
    connector_->SetTimeoutMs(ms);
}

void TcpClient::Connect() {
    LOG_DEBUG << "TcpClient::Connect[" << name_ << "] - connecting to "
              << connector_->serverAddress().toIpPort();
    connect_ = true;
    connector_->Start();
}

void TcpClient::Disconnect() {
    connect_ = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (connection_) {
            connection_->Shutdown();
        }
    }
}

void TcpClient::Stop() {
    connect_ = false;
    connector_->Stop();
}

void TcpClient::NewConnection(int sockfd) {
    InetAddress peerAddr(Socket::GetPeerAddr(sockfd));
    InetAddress localAddr(Socket::GetLocalAddr(sockfd));

    char buf[64];
    std::snprintf(buf, sizeof buf, ":%s#%d", peerAddr.toIpPort().c_str(), nextConnId_);
    ++nextConnId_;
    std::string connName = name_ + buf;

    TcpConnectionPtr conn(new TcpConnection(loop_,
                                            connName,
                                            sockfd,
                                            localAddr,
                                            peerAddr));

    conn->SetConnectionCallback(connectionCallback_);
    conn->SetMessageCallback(messageCallback_);
    conn->SetWriteCompleteCallback(writeCompleteCallback_);
    conn->SetHalfCloseCallback(halfCloseCallback_);
    conn->SetCloseCallback(
        std::bind(&TcpClient::RemoveConnection, this, std::placeholders::_1));

    {
        std::lock_guard<std::mutex> lock(mutex_);
        connection_ = conn;
    }
    conn->ConnectEstablished();
}

void TcpClient::ConnectFailed(int err) {
    if (connectErrorCallback_) {
        connectErrorCallback_(err);
    }
}

void TcpClient::RemoveConnection(const TcpConnectionPtr& conn) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        connection_.reset();
    }

    loop_->QueueInLoop(std::bind(&TcpConnection::ConnectDestroyed, conn));
}

} // namespace network
} // namespace cmux
