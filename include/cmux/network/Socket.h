#pragma once

#include "cmux/common/noncopyable.h"

namespace cmux {
namespace network {

class InetAddress;

// Owns a socket fd; closes it on destruction.
class Socket : cmux::common::noncopyable {
public:
    explicit Socket(int sockfd)
        : sockfd_(sockfd) {}
    ~Socket();

    int fd() const { return sockfd_; }

    // Both throw std::system_error on failure.
    void BindAddress(const InetAddress& localaddr);
    void Listen();

    int Accept(InetAddress* peeraddr);

    void ShutdownWrite();

    void SetTcpNoDelay(bool on);
    void SetReuseAddr(bool on);
    void SetReusePort(bool on);
    void SetKeepAlive(bool on);

    static int CreateNonblocking();
    static int GetSocketError(int sockfd);
    static InetAddress GetLocalAddr(int sockfd);
    static InetAddress GetPeerAddr(int sockfd);

private:
    const int sockfd_;
};

} // namespace network
} // namespace cmux
