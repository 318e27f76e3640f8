#include "cmux/network/PollPoller.h"
#include "cmux/network/Channel.h"
#include "cmux/common/Logger.h"

#include <poll.h>
#include <algorithm>
#include <cerrno>
#include <cstring>

namespace cmux {
namespace network {

PollPoller::PollPoller(EventLoop* loop)
    : Poller(loop) {
}

PollPoller::~PollPoller() = default;

std::chrono::system_clock::time_point PollPoller::Poll(int timeout_ms, ChannelList* active_channels) {
    int num_events = ::poll(pollfds_.data(), pollfds_.size(), timeout_ms);
    int saved_errno = errno;
    std::chrono::system_clock::time_point now = std::chrono::system_clock::now();

    if (num_events > 0) {
        FillActiveChannels(num_events, active_channels);
    } else if (num_events < 0 && saved_errno != EINTR) {
        LOG_ERROR << "PollPoller::Poll() " << std::strerror(saved_errno);
    }
    return now;
}

void PollPoller::FillActiveChannels(int num_events, ChannelList* active_channels) const {
    for (auto it = pollfds_.begin(); it != pollfds_.end() && num_events > 0; ++it) {
        if (it->revents > 0) {
            --num_events;
            auto ch_it = channels_.find(it->fd);
            if (ch_it == channels_.end()) continue;
            Channel* channel = ch_it->second;
            channel->set_revents(it->revents);
            active_channels->push_back(channel);
        }
    }
}

void PollPoller::UpdateChannel(Channel* channel) {
    if (channel->index() < 0) {
        struct pollfd pfd;
        pfd.fd = channel->IsNoneEvent() ? -channel->fd() - 1 : channel->fd();
        pfd.events = static_cast<short>(channel->events());
        pfd.revents = 0;
        pollfds_.push_back(pfd);
        int idx = static_cast<int>(pollfds_.size()) - 1;
        channel->set_index(idx);
        channels_[channel->fd()] = channel;
    } else {
        struct pollfd& pfd = pollfds_[channel->index()];
        pfd.fd = channel->fd();
        pfd.events = static_cast<short>(channel->events());
        pfd.revents = 0;
        if (channel->IsNoneEvent()) {
            // ignore this pollfd
            pfd.fd = -channel->fd() - 1;
        }
    }
}

void PollPoller::RemoveChannel(Channel* channel) {
    int idx = channel->index();
    if (idx < 0) return;
    channels_.erase(channel->fd());
    if (static_cast<size_t>(idx) == pollfds_.size() - 1) {
        pollfds_.pop_back();
    } else {
        int channelAtEnd = pollfds_.back().fd;
        std::iter_swap(pollfds_.begin() + idx, pollfds_.end() - 1);
        if (channelAtEnd < 0) {
            channelAtEnd = -channelAtEnd - 1;
        }
        channels_[channelAtEnd]->set_index(idx);
        pollfds_.pop_back();
    }
    channel->set_index(-1);
}

} // namespace network
} // namespace cmux
