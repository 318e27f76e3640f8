#pragma once

#include "cmux/common/noncopyable.h"
#include <mutex>
#include <condition_variable>
#include <thread>
#include <string>

namespace cmux {
namespace network {

class EventLoop;

class EventLoopThread : cmux::common::noncopyable {
public:
    explicit EventLoopThread(const std::string& name = std::string());
    ~EventLoopThread();

    // Spawns the thread and blocks until its loop is running.
    EventLoop* StartLoop();

private:
    void ThreadFunc();

    EventLoop* loop_;
    bool exiting_;
    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable cond_;
    std::string name_;
};

} // namespace network
} // namespace cmux
