#include "cmux/tunnel/UpstreamSession.h"
#include "cmux/network/EventLoop.h"
#include "cmux/network/TcpClient.h"
#include "cmux/common/Logger.h"

#include <cerrno>

namespace cmux {
namespace tunnel {

DialError DialErrorFromErrno(int err) {
    switch (err) {
        case ECONNREFUSED: return DialError::kRefused;
        case ETIMEDOUT: return DialError::kTimeout;
        case ENETUNREACH:
        case EHOSTUNREACH:
        case EADDRNOTAVAIL: return DialError::kUnreachable;
        default: return DialError::kOther;
    }
}

const char* DialErrorToString(DialError err) {
    switch (err) {
        case DialError::kRefused: return "connection refused";
        case DialError::kTimeout: return "connect timed out";
        case DialError::kUnreachable: return "upstream unreachable";
        case DialError::kOther: return "connect failed";
    }
    return "connect failed";
}

UpstreamSession::UpstreamSession(network::EventLoop* loop,
                                 const network::InetAddress& target,
                                 const std::string& name,
                                 int connectTimeoutMs,
                                 size_t highWaterMarkBytes)
    : loop_(loop),
      target_(target),
      name_(name),
      connectTimeoutMs_(connectTimeoutMs),
      highWaterMark_(highWaterMarkBytes),
      client_(std::make_shared<network::TcpClient>(loop, target, name)),
      closed_(false) {
    client_->SetConnectTimeoutMs(connectTimeoutMs_);
}

UpstreamSession::~UpstreamSession() {
    if (client_) {
        // TcpClient may not die inside its own callbacks; let the loop drop it.
        std::shared_ptr<network::TcpClient> client = std::move(client_);
        loop_->QueueInLoop([client]() {});
    }
}

void UpstreamSession::Start() {
    std::weak_ptr<UpstreamSession> weakSelf(shared_from_this());

    client_->SetConnectionCallback([weakSelf](const network::TcpConnectionPtr& conn) {
        if (auto self = weakSelf.lock()) self->OnConnection(conn);
    });
    client_->SetMessageCallback([weakSelf](const network::TcpConnectionPtr& conn,
                                           network::Buffer* buf,
                                           std::chrono::system_clock::time_point) {
        if (auto self = weakSelf.lock()) {
            self->OnMessage(conn, buf);
        } else {
            buf->RetrieveAll();
        }
    });
    client_->SetHalfCloseCallback([weakSelf](const network::TcpConnectionPtr& conn) {
        if (auto self = weakSelf.lock()) self->OnHalfClose(conn);
    });
    client_->SetWriteCompleteCallback([weakSelf](const network::TcpConnectionPtr&) {
        auto self = weakSelf.lock();
        if (self && !self->closed_ && self->writeCompleteCallback_) self->writeCompleteCallback_();
    });
    client_->SetConnectErrorCallback([weakSelf](int err) {
        if (auto self = weakSelf.lock()) self->OnConnectError(err);
    });

    client_->Connect();
}

void UpstreamSession::OnConnection(const network::TcpConnectionPtr& conn) {
    if (conn->connected()) {
        if (closed_) {
            conn->ForceClose();
            return;
        }
        conn_ = conn;
        conn->SetTcpNoDelay(true);
        std::weak_ptr<UpstreamSession> weakSelf(shared_from_this());
        conn->SetHighWaterMarkCallback([weakSelf](const network::TcpConnectionPtr&, size_t) {
            auto self = weakSelf.lock();
            if (self && !self->closed_ && self->highWaterMarkCallback_) self->highWaterMarkCallback_();
        }, highWaterMark_);
        LOG_DEBUG << "UpstreamSession[" << name_ << "] connected to " << target_.toIpPort();
        if (connectedCallback_) connectedCallback_();
    } else {
        LOG_DEBUG << "UpstreamSession[" << name_ << "] connection to " << target_.toIpPort() << " closed";
        if (!closed_ && closeCallback_) closeCallback_();
        Close();
        // Drops the reference taken by Release(), if any.
        conn->SetContext(std::any());
    }
}

void UpstreamSession::OnMessage(const network::TcpConnectionPtr&, network::Buffer* buf) {
    if (closed_ || !messageCallback_) {
        buf->RetrieveAll();
        return;
    }
    messageCallback_(buf);
}

void UpstreamSession::OnHalfClose(const network::TcpConnectionPtr&) {
    if (closed_) return;
    if (halfCloseCallback_) halfCloseCallback_();
}

void UpstreamSession::OnConnectError(int err) {
    if (closed_) return;
    const DialError de = DialErrorFromErrno(err);
    LOG_DEBUG << "UpstreamSession[" << name_ << "] dial " << target_.toIpPort() << " failed: "
              << DialErrorToString(de);
    if (dialErrorCallback_) dialErrorCallback_(de, err);
    Close();
}

void UpstreamSession::Send(const void* data, size_t len) {
    if (conn_ && !closed_) conn_->Send(data, len);
}

void UpstreamSession::Send(network::Buffer* buf) {
    if (conn_ && !closed_) {
        conn_->Send(buf);
    } else {
        buf->RetrieveAll();
    }
}

void UpstreamSession::ShutdownWrite() {
    if (conn_ && !closed_) conn_->Shutdown();
}

void UpstreamSession::StartRead() {
    if (conn_ && !closed_) conn_->StartRead();
}

void UpstreamSession::StopRead() {
    if (conn_ && !closed_) conn_->StopRead();
}

void UpstreamSession::Close() {
    if (closed_) return;
    closed_ = true;
    std::shared_ptr<network::TcpClient> client = std::move(client_);
    if (conn_) {
        conn_->ForceClose();
    }
    auto self = shared_from_this();
    loop_->QueueInLoop([self, client]() {
        self->ClearCallbacks();
    });
}

void UpstreamSession::Release() {
    if (closed_) return;
    if (!conn_ || conn_->disconnected()) {
        Close();
        return;
    }
    closed_ = true;
    conn_->SetContext(shared_from_this());
    conn_->Shutdown();
}

void UpstreamSession::ClearCallbacks() {
    connectedCallback_ = EventCallback();
    dialErrorCallback_ = DialErrorCallback();
    messageCallback_ = DataCallback();
    halfCloseCallback_ = EventCallback();
    closeCallback_ = EventCallback();
    highWaterMarkCallback_ = EventCallback();
    writeCompleteCallback_ = EventCallback();
}

} // namespace tunnel
} // namespace cmux
