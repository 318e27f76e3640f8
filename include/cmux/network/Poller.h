#pragma once

#include "cmux/common/noncopyable.h"
#include <vector>
#include <unordered_map>
#include <chrono>

namespace cmux {
namespace network {

class Channel;
class EventLoop;

// I/O multiplexing backend. Only ever touched from its loop's thread.
class Poller : cmux::common::noncopyable {
public:
    using ChannelList = std::vector<Channel*>;

    explicit Poller(EventLoop* loop);
    virtual ~Poller();

    virtual std::chrono::system_clock::time_point Poll(int timeout_ms, ChannelList* active_channels) = 0;
    virtual void UpdateChannel(Channel* channel) = 0;
    virtual void RemoveChannel(Channel* channel) = 0;
    virtual bool HasChannel(Channel* channel) const;

    // epoll unless CMUX_USE_POLL is set in the environment.
    static Poller* NewDefaultPoller(EventLoop* loop);

protected:
    using ChannelMap = std::unordered_map<int, Channel*>;
    ChannelMap channels_;

private:
    EventLoop* loop_;
};

} // namespace network
} // namespace cmux
