#include "cmux/network/Poller.h"
#include "cmux/network/Channel.h"
#include "cmux/network/EpollPoller.h"
#include "cmux/network/PollPoller.h"
#include "cmux/common/Logger.h"

#include <cstdlib>

namespace cmux {
namespace network {

Poller::Poller(EventLoop* loop) : loop_(loop) {}

Poller::~Poller() = default;

bool Poller::HasChannel(Channel* channel) const {
    auto it = channels_.find(channel->fd());
    return it != channels_.end() && it->second == channel;
}

Poller* Poller::NewDefaultPoller(EventLoop* loop) {
    if (::getenv("CMUX_USE_POLL")) {
        LOG_DEBUG << "Using PollPoller";
        return new PollPoller(loop);
    }
    LOG_DEBUG << "Using EpollPoller";
    return new EpollPoller(loop);
}

} // namespace network
} // namespace cmux
