#pragma once

#include "devproxy/common/noncopyable.h"

namespace devproxy {
namespace network {

class InetAddress;

// Owns a TCP socket fd (-1 when creation failed) and closes it on destruction.
class Socket : devproxy::common::noncopyable {
public:
    explicit Socket(int sockfd) : sockfd_(sockfd) {}
    ~Socket();

    // Non-blocking, close-on-exec IPv4 stream socket; -1 with errno set on failure.
    static int CreateNonblockingTcp();

    int fd() const { return sockfd_; }
    bool valid() const { return sockfd_ >= 0; }

    // Failures are logged and reported as false with errno preserved.
    bool BindAddress(const InetAddress& localaddr);
    bool Listen();
    // Accepted fds are non-blocking already.
    int Accept(InetAddress* peeraddr);

    void ShutdownWrite();

    void SetTcpNoDelay(bool on) { SetOption(kNoDelay, on); }
    void SetReuseAddr(bool on) { SetOption(kReuseAddr, on); }
    void SetKeepAlive(bool on) { SetOption(kKeepAlive, on); }

private:
    enum Option { kNoDelay, kReuseAddr, kKeepAlive };

    void SetOption(Option option, bool on);

    const int sockfd_;
};

} // namespace network
} // namespace devproxy
