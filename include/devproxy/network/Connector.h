#pragma once

#include "devproxy/common/noncopyable.h"
#include "devproxy/network/Callbacks.h"
#include "devproxy/network/InetAddress.h"

#include <functional>
#include <memory>

namespace devproxy {
namespace network {

class Channel;
class EventLoop;

// Non-blocking connect with timerfd based retry back-off and an optional
// per-attempt deadline. Must be owned by a shared_ptr.
class Connector : public std::enable_shared_from_this<Connector>,
                  devproxy::common::noncopyable {
public:
    using NewConnectionCallback = std::function<void(int sockfd)>;

    Connector(EventLoop* loop, const InetAddress& serverAddr);
    ~Connector();

    void SetNewConnectionCallback(const NewConnectionCallback& cb) { newConnectionCallback_ = cb; }
    // Invoked once the retry budget is spent; the Connector is stopped by then.
    void SetConnectFailedCallback(const ConnectFailedCallback& cb) { connectFailedCallback_ = cb; }

    // Retries after the first failed attempt; negative retries forever.
    void SetMaxRetries(int maxRetries) { maxRetries_ = maxRetries; }
    // Deadline per attempt, 0 leaves it to the kernel.
    void SetConnectTimeoutMs(int ms) { connectTimeoutMs_ = ms; }

    void Start();
    void Stop();

    const InetAddress& serverAddress() const { return serverAddr_; }

private:
    enum States { kDisconnected, kConnecting, kConnected };
    static const int kMaxRetryDelayMs = 30 * 1000;
    static const int kInitRetryDelayMs = 500;

    struct Timer {
        int fd{-1};
        std::unique_ptr<Channel> channel;
    };

    void SetState(States s) { state_ = s; }
    void StartInLoop();
    void StopInLoop();
    void Connect();
    void Connecting(int sockfd);
    void HandleWrite();
    void HandleError();
    void HandleTimeout();
    void Retry(int sockfd, int err);
    int RemoveAndResetChannel();
    void ResetChannel();

    void ArmTimer(Timer* timer, int delayMs, void (Connector::*onFire)());
    void CancelTimer(Timer* timer);
    void OnRetryTimer();

    EventLoop* loop_;
    InetAddress serverAddr_;
    bool connect_;
    States state_;
    std::unique_ptr<Channel> channel_;
    NewConnectionCallback newConnectionCallback_;
    ConnectFailedCallback connectFailedCallback_;
    int retryDelayMs_;
    int maxRetries_;
    int retries_;
    int connectTimeoutMs_;

    Timer retryTimer_;
    Timer timeoutTimer_;
};

} // namespace network
} // namespace devproxy
