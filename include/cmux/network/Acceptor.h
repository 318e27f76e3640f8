#pragma once

#include "cmux/common/noncopyable.h"
#include "cmux/network/Socket.h"
#include "cmux/network/Channel.h"
#include "cmux/network/InetAddress.h"

#include <functional>

namespace cmux {
namespace network {

class EventLoop;
class Acceptor : cmux::common::noncopyable {
public:
    using NewConnectionCallback = std::function<void(int sockfd, const InetAddress&)>;

    // Binds immediately; throws std::system_error when the address is unusable.
    Acceptor(EventLoop* loop, const InetAddress& listenAddr, bool reuseport);
    ~Acceptor();

    void SetNewConnectionCallback(const NewConnectionCallback& cb) {
        new_connection_callback_ = cb;
    }

    bool Listening() const { return listening_; }
    // Bound address, with the kernel-chosen port when bound to port 0.
    InetAddress localAddress() const;
    void Listen();

private:
    void HandleRead();

    EventLoop* loop_;
    Socket accept_socket_;
    Channel accept_channel_;
    NewConnectionCallback new_connection_callback_;
    bool listening_;
    int idle_fd_;
};

} // namespace network
} // namespace cmux
