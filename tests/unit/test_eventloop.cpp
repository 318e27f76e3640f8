#include "cmux/network/EventLoop.h"
#include "cmux/network/EventLoopThread.h"
#include "cmux/common/Logger.h"
#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdlib>
#include <thread>
#include <vector>

using namespace cmux::network;
using namespace cmux::common;

void testQuitFromOtherThread() {
    EventLoop loop;
    std::thread t([&loop]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        loop.Quit();
    });
    loop.Loop();
    t.join();
    LOG_INFO << "Quit from other thread PASS";
}

void testQueuedFunctorsRunInOrder() {
    EventLoop loop;
    std::vector<int> seen;
    std::thread t([&]() {
        for (int i = 0; i < 100; ++i) {
            loop.QueueInLoop([&seen, i]() { seen.push_back(i); });
        }
        loop.QueueInLoop([&loop]() { loop.Quit(); });
    });
    loop.Loop();
    t.join();
    assert(seen.size() == 100);
    for (int i = 0; i < 100; ++i) assert(seen[static_cast<size_t>(i)] == i);
    LOG_INFO << "Queued functors in order PASS";
}

void testRunInLoopFromIoThread() {
    EventLoopThread thread("io");
    EventLoop* io = thread.StartLoop();
    assert(io != nullptr);
    assert(!io->IsInLoopThread());

    std::atomic<bool> ranInLoop{false};
    std::atomic<bool> nestedImmediate{false};
    io->RunInLoop([&, io]() {
        // On the loop thread RunInLoop runs inline.
        bool inline_ran = false;
        io->RunInLoop([&inline_ran]() { inline_ran = true; });
        nestedImmediate = inline_ran;
        ranInLoop = io->IsInLoopThread();
    });
    for (int i = 0; i < 100 && !ranInLoop.load(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    assert(ranInLoop.load());
    assert(nestedImmediate.load());
    LOG_INFO << "RunInLoop on I/O thread PASS";
}

void testPollBackend() {
    ::setenv("CMUX_USE_POLL", "1", 1);
    EventLoop loop;
    bool ran = false;
    loop.QueueInLoop([&]() {
        ran = true;
        loop.Quit();
    });
    loop.Loop();
    ::unsetenv("CMUX_USE_POLL");
    assert(ran);
    LOG_INFO << "poll(2) backend PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);
    testQuitFromOtherThread();
    testQueuedFunctorsRunInOrder();
    testRunInLoopFromIoThread();
    testPollBackend();
    return 0;
}
