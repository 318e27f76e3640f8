#include "cmux/network/TcpConnection.h"
#include "cmux/network/Socket.h"
#include "cmux/network/Channel.h"
#include "cmux/network/EventLoop.h"
#include "cmux/common/Logger.h"

#include <unistd.h>
#include <errno.h>
#include <cstring>
#include <sys/socket.h>

namespace cmux {
namespace network {

TcpConnection::TcpConnection(EventLoop* loop,
                             const std::string& nameArg,
                             int sockfd,
                             const InetAddress& localAddr,
                             const InetAddress& peerAddr)
    : loop_(loop),
      name_(nameArg),
      state_(kConnecting),
      reading_(true),
      readShut_(false),
      writeShut_(false),
      socket_(new Socket(sockfd)),
      channel_(new Channel(loop, sockfd)),
      localAddr_(localAddr),
      peerAddr_(peerAddr),
      highWaterMark_(64 * 1024 * 1024) {
    channel_->SetReadCallback(
        std::bind(&TcpConnection::HandleRead, this, std::placeholders::_1));
    channel_->SetWriteCallback(
        std::bind(&TcpConnection::HandleWrite, this));
    channel_->SetCloseCallback(
        std::bind(&TcpConnection::HandleClose, this));
    channel_->SetErrorCallback(
        std::bind(&TcpConnection::HandleError, this));

    LOG_DEBUG << "TcpConnection::ctor[" << name_ << "] at " << this << " fd=" << sockfd;
    socket_->SetKeepAlive(true);
}

TcpConnection::~TcpConnection() {
    LOG_DEBUG << "TcpConnection::dtor[" << name_ << "] at " << this << " fd=" << channel_->fd()
              << " state=" << StateToString(state_);
}

const char* TcpConnection::StateToString(StateE s) {
    switch (s) {
        case kDisconnected: return "kDisconnected";
        case kConnecting: return "kConnecting";
        case kConnected: return "kConnected";
        case kDisconnecting: return "kDisconnecting";
        default: return "unknown";
    }
}

void TcpConnection::ConnectEstablished() {
    SetState(kConnected);
    channel_->Tie(shared_from_this());
    if (reading_) {
        channel_->EnableReading();
    }

    if (connectionCallback_) {
        connectionCallback_(shared_from_this());
    }
}

void TcpConnection::ConnectDestroyed() {
    if (state_ == kConnected || state_ == kDisconnecting) {
        SetState(kDisconnected);
        channel_->DisableAll();
        if (connectionCallback_) {
            connectionCallback_(shared_from_this());
        }
    }
    channel_->Remove();
}

void TcpConnection::HandleRead(std::chrono::system_clock::time_point receiveTime) {
    int savedErrno = 0;
    const ssize_t n = inputBuffer_.ReadFd(channel_->fd(), &savedErrno);
    if (n > 0) {
        if (messageCallback_) {
            messageCallback_(shared_from_this(), &inputBuffer_, receiveTime);
        }
    } else if (n == 0) {
        if (halfCloseCallback_ && !readShut_ && !writeShut_) {
            LOG_DEBUG << "TcpConnection::HandleRead [" << name_ << "] peer closed write side";
            readShut_ = true;
            reading_ = false;
            channel_->DisableReading();
            halfCloseCallback_(shared_from_this());
        } else {
            HandleClose();
        }
    } else {
        if (savedErrno == EAGAIN || savedErrno == EINTR) return;
        LOG_DEBUG << "TcpConnection::HandleRead [" << name_ << "] " << std::strerror(savedErrno);
        HandleClose();
    }
}

void TcpConnection::HandleWrite() {
    if (!channel_->IsWriting()) {
        LOG_DEBUG << "Connection fd = " << channel_->fd() << " is down, no more writing";
        return;
    }

    const ssize_t n = ::write(channel_->fd(), outputBuffer_.Peek(), outputBuffer_.ReadableBytes());
    if (n > 0) {
        outputBuffer_.Retrieve(n);
        if (outputBuffer_.ReadableBytes() == 0) {
            channel_->DisableWriting();
            if (writeCompleteCallback_) {
                loop_->QueueInLoop(
                    std::bind(writeCompleteCallback_, shared_from_this()));
            }
            if (state_ == kDisconnecting) {
                ShutdownInLoop();
            }
        }
    } else if (n < 0 && errno != EAGAIN && errno != EINTR) {
        LOG_DEBUG << "TcpConnection::HandleWrite [" << name_ << "] " << std::strerror(errno);
        HandleClose();
    }
}

void TcpConnection::HandleClose() {
    if (state_ == kDisconnected) return;
    LOG_DEBUG << "TcpConnection::HandleClose [" << name_ << "] fd = " << channel_->fd()
              << " state = " << StateToString(state_);
    SetState(kDisconnected);
    channel_->DisableAll();

    TcpConnectionPtr guardThis(shared_from_this());
    if (connectionCallback_) {
        connectionCallback_(guardThis);
    }

    if (closeCallback_) {
        closeCallback_(guardThis);
    }
}

void TcpConnection::HandleError() {
    const int err = Socket::GetSocketError(channel_->fd());
    LOG_DEBUG << "TcpConnection::HandleError name:" << name_ << " - SO_ERROR:" << err
              << " " << std::strerror(err);
}

void TcpConnection::Send(const std::string& message) {
    Send(message.data(), message.size());
}

void TcpConnection::Send(Buffer* buf) {
    Send(buf->Peek(), buf->ReadableBytes());
    buf->RetrieveAll();
}

void TcpConnection::Send(const void* data, size_t len) {
    if (state_ == kConnected) {
        if (loop_->IsInLoopThread()) {
            SendInLoop(data, len);
        } else {
            std::string msg(static_cast<const char*>(data), len);
            loop_->RunInLoop([ptr = shared_from_this(), msg = std::move(msg)]() {
                ptr->SendInLoop(msg.data(), msg.size());
            });
        }
    }
}

void TcpConnection::SendInLoop(const void* data, size_t len) {
    ssize_t nwrote = 0;
    size_t remaining = len;
    bool faultError = false;

    if (state_ == kDisconnected) {
        LOG_DEBUG << "disconnected, give up writing";
        return;
    }

    // if nothing in output queue, try write directly
    if (!channel_->IsWriting() && outputBuffer_.ReadableBytes() == 0) {
        nwrote = ::write(channel_->fd(), data, len);
        if (nwrote >= 0) {
            remaining = len - nwrote;
            if (remaining == 0 && writeCompleteCallback_) {
                loop_->QueueInLoop(
                    std::bind(writeCompleteCallback_, shared_from_this()));
            }
        } else {
            nwrote = 0;
            if (errno != EWOULDBLOCK) {
                LOG_DEBUG << "TcpConnection::SendInLoop [" << name_ << "] " << std::strerror(errno);
                if (errno == EPIPE || errno == ECONNRESET) {
                    faultError = true;
                }
            }
        }
    }

    if (faultError) {
        loop_->QueueInLoop([self = shared_from_this()]() { self->ForceCloseInLoop(); });
        return;
    }

    if (remaining > 0) {
        size_t oldLen = outputBuffer_.ReadableBytes();
        if (oldLen + remaining >= highWaterMark_
            && oldLen < highWaterMark_
            && highWaterMarkCallback_) {
            loop_->QueueInLoop(std::bind(highWaterMarkCallback_, shared_from_this(), oldLen + remaining));
        }
        outputBuffer_.Append(static_cast<const char*>(data) + nwrote, remaining);
        if (!channel_->IsWriting()) {
            channel_->EnableWriting();
        }
    }
}

void TcpConnection::Shutdown() {
    if (state_ == kConnected) {
        SetState(kDisconnecting);
        loop_->RunInLoop([self = shared_from_this()]() { self->ShutdownInLoop(); });
    }
}

void TcpConnection::ShutdownInLoop() {
    if (channel_->IsWriting() || writeShut_) return;
    socket_->ShutdownWrite();
    writeShut_ = true;
    // Both directions are finished once the peer has also stopped sending.
    if (readShut_) {
        HandleClose();
    }
}

void TcpConnection::ForceClose() {
    if (state_ == kConnected || state_ == kDisconnecting || state_ == kConnecting) {
        loop_->QueueInLoop([conn = shared_from_this()]() {
            conn->ForceCloseInLoop();
        });
    }
}

void TcpConnection::ForceCloseInLoop() {
    if (state_ == kConnected || state_ == kDisconnecting || state_ == kConnecting) {
        HandleClose();
    }
}

void TcpConnection::StartRead() {
    auto self = shared_from_this();
    loop_->RunInLoop([self]() { self->StartReadInLoop(); });
}

void TcpConnection::StopRead() {
    auto self = shared_from_this();
    loop_->RunInLoop([self]() { self->StopReadInLoop(); });
}

void TcpConnection::StartReadInLoop() {
    if (!reading_ && !readShut_) {
        reading_ = true;
        if (state_ != kConnecting && state_ != kDisconnected) {
            channel_->EnableReading();
        }
    }
}

void TcpConnection::StopReadInLoop() {
    if (reading_) {
        reading_ = false;
        if (state_ != kConnecting && state_ != kDisconnected) {
            channel_->DisableReading();
        }
    }
}

void TcpConnection::SetTcpNoDelay(bool on) {
    socket_->SetTcpNoDelay(on);
}

} // namespace network
} // namespace cmux
