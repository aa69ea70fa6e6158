#pragma once

#include "devproxy/common/noncopyable.h"
#include "devproxy/network/Channel.h"
#include "devproxy/network/Socket.h"

#include <functional>

namespace devproxy {
namespace network {

class EventLoop;
class InetAddress;

// Listening socket on the base loop. Socket creation or bind failures are
// reported by Listen() returning false.
class Acceptor : devproxy::common::noncopyable {
public:
    using NewConnectionCallback = std::function<void(int sockfd, const InetAddress&)>;

    Acceptor(EventLoop* loop, const InetAddress& listenAddr);
    ~Acceptor();

    void SetNewConnectionCallback(NewConnectionCallback cb) { newConnectionCallback_ = std::move(cb); }

    bool Listen();
    bool bound() const { return bound_; }
    bool listening() const { return listening_; }

private:
    void HandleRead();
    void ShedOneConnection();

    Socket acceptSocket_;
    Channel acceptChannel_;
    NewConnectionCallback newConnectionCallback_;
    bool bound_;
    bool listening_;
    // Spare descriptor released to accept-and-close a peer when out of fds.
    int reserveFd_;
};

} // namespace network
} // namespace devproxy
