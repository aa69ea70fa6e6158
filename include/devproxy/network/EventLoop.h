#pragma once

#include "devproxy/common/noncopyable.h"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace devproxy {
namespace network {

class Channel;
class EpollPoller;

// One loop per thread. A client connection, its exchanges and their upstream
// connections all live on the same loop; other threads hand work over with
// RunInLoop/QueueInLoop.
class EventLoop : devproxy::common::noncopyable {
public:
    using Functor = std::function<void()>;

    // Throws std::logic_error if the calling thread already has a loop and
    // std::system_error if the epoll or eventfd descriptors cannot be created.
    EventLoop();
    ~EventLoop();

    void Loop();
    void Quit();

    void RunInLoop(Functor cb);
    void QueueInLoop(Functor cb);

    void UpdateChannel(Channel* channel);
    void RemoveChannel(Channel* channel);

    bool IsInLoopThread() const { return threadId_ == std::this_thread::get_id(); }

private:
    void WakeUp();
    void DrainWakeup();
    void RunPendingFunctors();

    std::atomic_bool quit_;
    std::atomic_bool runningFunctors_;
    const std::thread::id threadId_;
    std::unique_ptr<EpollPoller> poller_;

    int wakeupFd_;
    std::unique_ptr<Channel> wakeupChannel_;
    std::vector<Channel*> activeChannels_;

    std::mutex mutex_;
    std::vector<Functor> pendingFunctors_;
};

} // namespace network
} // namespace devproxy
