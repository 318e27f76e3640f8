#pragma once

#include "cmux/common/noncopyable.h"
#include "cmux/network/Callbacks.h"
#include "cmux/network/InetAddress.h"
#include "cmux/network/TcpServer.h"

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace cmux {

namespace network {
class Buffer;
class EventLoop;
}

struct ProxyOptions {
    // Dial target host for requests that name no workspace.
    network::InetAddress upstreamHost{"127.0.0.1", 0};
    int connectTimeoutMs{5000};
    size_t highWaterMarkBytes{8 * 1024 * 1024};
};

// Reverse proxy that routes every request or tunnel to a (workspace, port)
// pair and dials the workspace's shadow loopback address.
class ProxyServer : cmux::common::noncopyable {
public:
    // Binds every listen address up front; throws std::system_error when one
    // cannot be bound and std::invalid_argument when the list is empty.
    ProxyServer(network::EventLoop* loop,
                const std::vector<network::InetAddress>& listenAddrs,
                const ProxyOptions& options,
                const std::string& name = "cmux-proxy");

    void SetThreadNum(int numThreads);
    void Start();

    // Addresses actually bound, with kernel-chosen ports filled in.
    const std::vector<network::InetAddress>& listenAddresses() const { return server_->listenAddresses(); }
    const ProxyOptions& options() const { return *options_; }

private:
    void OnConnection(const network::TcpConnectionPtr& conn);
    void OnMessage(const network::TcpConnectionPtr& conn,
                   network::Buffer* buf,
                   std::chrono::system_clock::time_point);

    network::EventLoop* loop_;
    std::shared_ptr<const ProxyOptions> options_;
    std::unique_ptr<network::TcpServer> server_;
};

} // namespace cmux
