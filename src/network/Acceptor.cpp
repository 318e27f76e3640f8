#include "cmux/network/Acceptor.h"
#include "cmux/network/InetAddress.h"
#include "cmux/network/EventLoop.h"
#include "cmux/common/Logger.h"

#include <sys/socket.h>
#include <unistd.h>
#include <fcntl.h>
#include <cerrno>
#include <cstring>

namespace cmux {
namespace network {

Acceptor::Acceptor(EventLoop* loop, const InetAddress& listenAddr, bool reuseport)
    : loop_(loop),
      accept_socket_(Socket::CreateNonblocking()),
      accept_channel_(loop, accept_socket_.fd()),
      listening_(false),
      idle_fd_(-1) {
    accept_socket_.SetReuseAddr(true);
    accept_socket_.SetReusePort(reuseport);
    accept_socket_.BindAddress(listenAddr);
    idle_fd_ = ::open("/dev/null", O_RDONLY | O_CLOEXEC);

    accept_channel_.SetReadCallback(std::bind(&Acceptor::HandleRead, this));
}

Acceptor::~Acceptor() {
    accept_channel_.DisableAll();
    accept_channel_.Remove();
    if (idle_fd_ >= 0) ::close(idle_fd_);
}

InetAddress Acceptor::localAddress() const {
    return Socket::GetLocalAddr(accept_socket_.fd());
}

void Acceptor::Listen() {
    listening_ = true;
    accept_socket_.Listen();
    accept_channel_.EnableReading();
}

void Acceptor::HandleRead() {
    InetAddress peerAddr;
    int connfd = accept_socket_.Accept(&peerAddr);
    if (connfd >= 0) {
        if (new_connection_callback_) {
            new_connection_callback_(connfd, peerAddr);
        } else {
            ::close(connfd);
        }
    } else {
        const int err = errno;
        if (err == EAGAIN || err == EINTR || err == ECONNABORTED) return;
        LOG_ERROR << "Acceptor::HandleRead accept: " << std::strerror(err);
        // Out of fds: drain the pending connection so the level-triggered
        // listener does not spin.
        if (err == EMFILE && idle_fd_ >= 0) {
            ::close(idle_fd_);
            idle_fd_ = ::accept(accept_socket_.fd(), nullptr, nullptr);
            if (idle_fd_ >= 0) ::close(idle_fd_);
            idle_fd_ = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
        }
    }
}

} // namespace network
} // namespace cmux
