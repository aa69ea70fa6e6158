#include "devproxy/network/EpollPoller.h"
#include "devproxy/network/Channel.h"
#include "devproxy/common/Logger.h"

#include <cerrno>
#include <system_error>
#include <unistd.h>

namespace devproxy {
namespace network {

namespace {
const size_t kInitialEvents = 32;
} // namespace

EpollPoller::EpollPoller() : epollfd_(::epoll_create1(EPOLL_CLOEXEC)), events_(kInitialEvents) {
    if (epollfd_ < 0) {
        throw std::system_error(errno, std::generic_category(), "epoll_create1");
    }
}

EpollPoller::~EpollPoller() {
    ::close(epollfd_);
}

std::chrono::system_clock::time_point EpollPoller::Poll(int timeoutMs, ChannelList* activeChannels) {
    const int n = ::epoll_wait(epollfd_, events_.data(), static_cast<int>(events_.size()), timeoutMs);
    const int savedErrno = errno;
    const auto now = std::chrono::system_clock::now();

    if (n < 0) {
        if (savedErrno != EINTR) LOG_ERROR << "epoll_wait errno=" << savedErrno;
        return now;
    }
    for (int i = 0; i < n; ++i) {
        Channel* channel = static_cast<Channel*>(events_[i].data.ptr);
        channel->set_revents(events_[i].events);
        activeChannels->push_back(channel);
    }
    // A full batch means more were probably ready; grow for the next round.
    if (static_cast<size_t>(n) == events_.size()) events_.resize(events_.size() * 2);
    return now;
}

void EpollPoller::UpdateChannel(Channel* channel) {
    switch (channel->poll_state()) {
    case Channel::PollState::kNew:
    case Channel::PollState::kDetached:
        if (channel->IsNoneEvent()) return;
        channel->set_poll_state(Channel::PollState::kAdded);
        Control(EPOLL_CTL_ADD, channel);
        break;
    case Channel::PollState::kAdded:
        if (channel->IsNoneEvent()) {
            Control(EPOLL_CTL_DEL, channel);
            channel->set_poll_state(Channel::PollState::kDetached);
        } else {
            Control(EPOLL_CTL_MOD, channel);
        }
        break;
    }
}

void EpollPoller::RemoveChannel(Channel* channel) {
    if (channel->poll_state() == Channel::PollState::kAdded) {
        Control(EPOLL_CTL_DEL, channel);
    }
    channel->set_poll_state(Channel::PollState::kNew);
}

void EpollPoller::Control(int operation, Channel* channel) {
    struct epoll_event event {};
    event.events = channel->events();
    event.data.ptr = channel;
    if (::epoll_ctl(epollfd_, operation, channel->fd(), &event) < 0) {
        LOG_ERROR << "epoll_ctl op=" << operation << " fd=" << channel->fd() << " errno=" << errno;
    }
}

} // namespace network
} // namespace devproxy
