#pragma once

#include "devproxy/common/noncopyable.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>

namespace devproxy {
namespace network {

class EventLoop;

// Binds one fd to its loop's epoll set. Does not own the fd.
class Channel : devproxy::common::noncopyable {
public:
    using EventCallback = std::function<void()>;
    using ReadEventCallback = std::function<void(std::chrono::system_clock::time_point)>;

    // Registration state kept for EpollPoller.
    enum class PollState { kNew, kAdded, kDetached };

    Channel(EventLoop* loop, int fd);

    void HandleEvent(std::chrono::system_clock::time_point receiveTime);

    void SetReadCallback(ReadEventCallback cb) { readCallback_ = std::move(cb); }
    void SetWriteCallback(EventCallback cb) { writeCallback_ = std::move(cb); }
    void SetCloseCallback(EventCallback cb) { closeCallback_ = std::move(cb); }
    void SetErrorCallback(EventCallback cb) { errorCallback_ = std::move(cb); }

    // Events are dropped once the tied owner is gone.
    void Tie(const std::shared_ptr<void>& owner);

    int fd() const { return fd_; }
    uint32_t events() const { return events_; }
    void set_revents(uint32_t revents) { revents_ = revents; }
    bool IsNoneEvent() const { return events_ == 0; }

    void EnableReading() { SetEvents(events_ | kReadEvents); }
    void DisableReading() { SetEvents(events_ & ~kReadEvents); }
    void EnableWriting() { SetEvents(events_ | kWriteEvents); }
    void DisableWriting() { SetEvents(events_ & ~kWriteEvents); }
    void DisableAll() { SetEvents(0); }

    bool IsWriting() const { return (events_ & kWriteEvents) != 0; }

    PollState poll_state() const { return pollState_; }
    void set_poll_state(PollState state) { pollState_ = state; }

    void Remove();

private:
    static const uint32_t kReadEvents;
    static const uint32_t kWriteEvents;

    void SetEvents(uint32_t events);
    void Dispatch(std::chrono::system_clock::time_point receiveTime);

    EventLoop* loop_;
    const int fd_;
    uint32_t events_;
    uint32_t revents_;
    PollState pollState_;
    bool tied_;
    std::weak_ptr<void> tie_;

    ReadEventCallback readCallback_;
    EventCallback writeCallback_;
    EventCallback closeCallback_;
    EventCallback errorCallback_;
};

} // namespace network
} // namespace devproxy
