#pragma once

#include "devproxy/common/noncopyable.h"

#include <chrono>
#include <sys/epoll.h>
#include <vector>

namespace devproxy {
namespace network {

class Channel;

// Level-triggered epoll set owned by one EventLoop.
class EpollPoller : devproxy::common::noncopyable {
public:
    using ChannelList = std::vector<Channel*>;

    // Throws std::system_error when epoll_create1 fails.
    EpollPoller();
    ~EpollPoller();

    std::chrono::system_clock::time_point Poll(int timeoutMs, ChannelList* activeChannels);
    void UpdateChannel(Channel* channel);
    void RemoveChannel(Channel* channel);

private:
    void Control(int operation, Channel* channel);

    int epollfd_;
    std::vector<struct epoll_event> events_;
};

} // namespace network
} // namespace devproxy
