#include "devproxy/network/Channel.h"
#include "devproxy/network/EventLoop.h"

#include <sys/epoll.h>

namespace devproxy {
namespace network {

// EPOLLRDHUP so a client that half-closes mid exchange is noticed without a read.
const uint32_t Channel::kReadEvents = EPOLLIN | EPOLLPRI | EPOLLRDHUP;
const uint32_t Channel::kWriteEvents = EPOLLOUT;

Channel::Channel(EventLoop* loop, int fd)
    : loop_(loop), fd_(fd), events_(0), revents_(0), pollState_(PollState::kNew), tied_(false) {}

void Channel::Tie(const std::shared_ptr<void>& owner) {
    tie_ = owner;
    tied_ = true;
}

void Channel::SetEvents(uint32_t events) {
    events_ = events;
    loop_->UpdateChannel(this);
}

void Channel::Remove() {
    loop_->RemoveChannel(this);
}

void Channel::HandleEvent(std::chrono::system_clock::time_point receiveTime) {
    if (!tied_) {
        Dispatch(receiveTime);
        return;
    }
    std::shared_ptr<void> guard = tie_.lock();
    if (guard) Dispatch(receiveTime);
}

void Channel::Dispatch(std::chrono::system_clock::time_point receiveTime) {
    if ((revents_ & EPOLLHUP) && !(revents_ & EPOLLIN) && closeCallback_) {
        closeCallback_();
        return;
    }
    if ((revents_ & EPOLLERR) && errorCallback_) errorCallback_();
    if ((revents_ & (EPOLLIN | EPOLLPRI | EPOLLRDHUP)) && readCallback_) readCallback_(receiveTime);
    if ((revents_ & EPOLLOUT) && writeCallback_) writeCallback_();
}

} // namespace network
} // namespace devproxy
