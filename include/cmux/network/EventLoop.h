#pragma once

#include <vector>
#include <atomic>
#include <functional>
#include <memory>
#include <thread>
#include <mutex>

#include "cmux/common/noncopyable.h"
#include "cmux/network/Channel.h"
#include "cmux/network/Poller.h"

namespace cmux {
namespace network {

// One reactor per thread. All Channel/Poller access happens on the owning
// thread; other threads hand work over with RunInLoop/QueueInLoop.
class EventLoop : cmux::common::noncopyable {
public:
    using Functor = std::function<void()>;

    EventLoop();
    ~EventLoop();

    void Loop();
    void Quit();

    void RunInLoop(Functor cb);
    void QueueInLoop(Functor cb);

    void WakeUp();
    void UpdateChannel(Channel* channel);
    void RemoveChannel(Channel* channel);
    bool HasChannel(Channel* channel);

    bool IsInLoopThread() const { return thread_id_ == std::this_thread::get_id(); }

    static EventLoop* GetEventLoopOfCurrentThread();

private:
    void HandleRead(); // For wakeup
    void DoPendingFunctors();

    using ChannelList = std::vector<Channel*>;

    std::atomic_bool looping_;
    std::atomic_bool quit_;
    std::atomic_bool calling_pending_functors_;

    const std::thread::id thread_id_;
    std::unique_ptr<Poller> poller_;

    int wakeup_fd_;
    std::unique_ptr<Channel> wakeup_channel_;

    ChannelList active_channels_;

    std::mutex mutex_;
    std::vector<Functor> pending_functors_;
};

} // namespace network
} // namespace cmux
