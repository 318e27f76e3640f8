#pragma once

#include "cmux/common/noncopyable.h"
#include "cmux/network/InetAddress.h"

#include <functional>
#include <memory>

namespace cmux {
namespace network {

class Channel;
class EventLoop;

// Makes a single non-blocking connect attempt, bounded by a timer.
// Must be owned by a shared_ptr. Callbacks run on the loop thread.
class Connector : public std::enable_shared_from_this<Connector>,
                  cmux::common::noncopyable {
public:
    using NewConnectionCallback = std::function<void(int sockfd)>;
    using ErrorCallback = std::function<void(int err)>;

    static const int kDefaultTimeoutMs = 5000;

    Connector(EventLoop* loop, const InetAddress& serverAddr);
    ~Connector();

    void SetNewConnectionCallback(const NewConnectionCallback& cb) {
        newConnectionCallback_ = cb;
    }
    // Called with the errno of a failed attempt; ETIMEDOUT when the timer fires.
    void SetErrorCallback(const ErrorCallback& cb) { errorCallback_ = cb; }
    // <= 0 disables the timer.
    void SetTimeoutMs(int ms) { timeoutMs_ = ms; }

    void Start();
    // Abandons an attempt in progress without invoking any callback.
    void Stop();

    const InetAddress& serverAddress() const { return serverAddr_; }

private:
    enum States { kDisconnected, kConnecting, kConnected };

    void SetState(States s) { state_ = s; }
    void StartInLoop();
    void StopInLoop();
    void Connect();
    void Connecting(int sockfd);
    void HandleWrite();
    void HandleError();
    void HandleTimeout();
    void Fail(int sockfd, int err);
    int RemoveAndResetChannel();
    void ArmTimer();
    void CancelTimer();

    EventLoop* loop_;
    InetAddress serverAddr_;
    bool connect_;
    States state_;
    int timeoutMs_;
    std::unique_ptr<Channel> channel_;
    NewConnectionCallback newConnectionCallback_;
    ErrorCallback errorCallback_;

    int timerFd_{-1};
    std::unique_ptr<Channel> timerChannel_;
};

} // namespace network
} // namespace cmux
