#include "cmux/network/Connector.h"
#include "cmux/network/Channel.h"
#include "cmux/network/EventLoop.h"
#include "cmux/network/Socket.h"
#include "cmux/common/Logger.h"

#include <cerrno>
#include <cstring>
#include <unistd.h>
#include <sys/socket.h>
#include <sys/timerfd.h>

namespace cmux {
namespace network {

const int Connector::kDefaultTimeoutMs;

Connector::Connector(EventLoop* loop, const InetAddress& serverAddr)
    : loop_(loop),
      serverAddr_(serverAddr),
      connect_(false),
      state_(kDisconnected),
      timeoutMs_(kDefaultTimeoutMs) {
}

Connector::~Connector() {
    CancelTimer();
    if (channel_) {
        // Destroyed mid-attempt: the loop must not keep a dangling Channel.
        channel_->DisableAll();
        channel_->Remove();
        ::close(channel_->fd());
    }
}

void Connector::Start() {
    connect_ = true;
    auto self = shared_from_this();
    loop_->RunInLoop([self]() { self->StartInLoop(); });
}

void Connector::StartInLoop() {
    if (connect_) {
        Connect();
    } else {
        LOG_DEBUG << "Connector::StartInLoop - stop";
    }
}

void Connector::Stop() {
    connect_ = false;
    if (loop_->IsInLoopThread()) {
        StopInLoop();
    } else {
        auto self = shared_from_this();
        loop_->QueueInLoop([self]() { self->StopInLoop(); });
    }
}

void Connector::StopInLoop() {
    CancelTimer();
    if (state_ == kConnecting) {
        SetState(kDisconnected);
        int sockfd = RemoveAndResetChannel();
        ::close(sockfd);
    }
}

void Connector::Connect() {
    int sockfd = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, IPPROTO_TCP);
    if (sockfd < 0) {
        const int err = errno;
        LOG_ERROR << "Connector::Connect socket: " << std::strerror(err);
        SetState(kDisconnected);
        if (errorCallback_) errorCallback_(err);
        return;
    }

    int ret = ::connect(sockfd, serverAddr_.getSockAddr(), sizeof(struct sockaddr_in));
    int savedErrno = (ret == 0) ? 0 : errno;

    switch (savedErrno) {
        case 0:
        case EINPROGRESS:
        case EINTR:
        case EISCONN:
            Connecting(sockfd);
            break;

        default:
            Fail(sockfd, savedErrno);
            break;
    }
}

void Connector::Connecting(int sockfd) {
    SetState(kConnecting);
    std::weak_ptr<Connector> weakSelf(shared_from_this());
    channel_.reset(new Channel(loop_, sockfd));
    channel_->SetWriteCallback([weakSelf]() {
        if (auto self = weakSelf.lock()) self->HandleWrite();
    });
    channel_->SetErrorCallback([weakSelf]() {
        if (auto self = weakSelf.lock()) self->HandleError();
    });
    channel_->EnableWriting();
    ArmTimer();
}

int Connector::RemoveAndResetChannel() {
    channel_->DisableAll();
    channel_->Remove();
    int sockfd = channel_->fd();
    // Can't delete the Channel here: we may be inside Channel::HandleEvent.
    Channel* ch = channel_.release();
    loop_->QueueInLoop([ch]() { delete ch; });
    return sockfd;
}

void Connector::HandleWrite() {
    if (state_ != kConnecting) return;

    int sockfd = RemoveAndResetChannel();
    const int err = Socket::GetSocketError(sockfd);
    if (err) {
        Fail(sockfd, err);
        return;
    }

    CancelTimer();
    SetState(kConnected);
    if (connect_ && newConnectionCallback_) {
        newConnectionCallback_(sockfd);
    } else {
        ::close(sockfd);
    }
}

void Connector::HandleError() {
    if (state_ != kConnecting) return;

    int sockfd = RemoveAndResetChannel();
    const int err = Socket::GetSocketError(sockfd);
    Fail(sockfd, err ? err : ECONNREFUSED);
}

void Connector::HandleTimeout() {
    if (state_ != kConnecting) return;

    int sockfd = RemoveAndResetChannel();
    Fail(sockfd, ETIMEDOUT);
}

void Connector::Fail(int sockfd, int err) {
    ::close(sockfd);
    CancelTimer();
    SetState(kDisconnected);
    LOG_DEBUG << "Connector::Fail " << serverAddr_.toIpPort() << ": " << std::strerror(err);
    if (connect_ && errorCallback_) {
        errorCallback_(err);
    }
}

void Connector::CancelTimer() {
    if (timerChannel_) {
        timerChannel_->DisableAll();
        timerChannel_->Remove();
        Channel* ch = timerChannel_.release();
        if (loop_->IsInLoopThread()) {
            loop_->QueueInLoop([ch]() { delete ch; });
        } else {
            delete ch;
        }
    }
    if (timerFd_ >= 0) {
        ::close(timerFd_);
        timerFd_ = -1;
    }
}

void Connector::ArmTimer() {
    CancelTimer();
    if (timeoutMs_ <= 0) return;

    timerFd_ = ::timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (timerFd_ < 0) {
        LOG_ERROR << "Connector::ArmTimer timerfd_create failed: " << std::strerror(errno);
        return;
    }

    struct itimerspec howlong;
    std::memset(&howlong, 0, sizeof howlong);
    howlong.it_value.tv_sec = timeoutMs_ / 1000;
    howlong.it_value.tv_nsec = static_cast<long>(timeoutMs_ % 1000) * 1000 * 1000;
    if (::timerfd_settime(timerFd_, 0, &howlong, nullptr) != 0) {
        LOG_ERROR << "Connector::ArmTimer timerfd_settime failed: " << std::strerror(errno);
        ::close(timerFd_);
        timerFd_ = -1;
        return;
    }

    std::weak_ptr<Connector> weakSelf(shared_from_this());
    timerChannel_.reset(new Channel(loop_, timerFd_));
    timerChannel_->SetReadCallback([weakSelf](std::chrono::system_clock::time_point) {
        auto self = weakSelf.lock();
        if (!self) return;
        uint64_t expirations = 0;
        if (::read(self->timerFd_, &expirations, sizeof expirations) < 0 && errno == EAGAIN) {
            return;
        }
        self->HandleTimeout();
    });
    timerChannel_->EnableReading();
}

} // namespace network
} // namespace cmux
