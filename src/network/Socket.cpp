#include "devproxy/network/Socket.h"
#include "devproxy/network/InetAddress.h"
#include "devproxy/common/Logger.h"

#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <unistd.h>

namespace devproxy {
namespace network {

Socket::~Socket() {
    if (sockfd_ >= 0) ::close(sockfd_);
}

int Socket::CreateNonblockingTcp() {
    return ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, IPPROTO_TCP);
}

bool Socket::BindAddress(const InetAddress& localaddr) {
    if (::bind(sockfd_, localaddr.getSockAddr(), sizeof(struct sockaddr_in)) == 0) return true;
    const int savedErrno = errno;
    LOG_ERROR << "bind " << localaddr.toIpPort() << " failed: " << std::strerror(savedErrno);
    errno = savedErrno;
    return false;
}

bool Socket::Listen() {
    if (::listen(sockfd_, SOMAXCONN) == 0) return true;
    const int savedErrno = errno;
    LOG_ERROR << "listen fd=" << sockfd_ << " failed: " << std::strerror(savedErrno);
    errno = savedErrno;
    return false;
}

int Socket::Accept(InetAddress* peeraddr) {
    struct sockaddr_in addr {};
    socklen_t len = sizeof addr;
    const int connfd = ::accept4(sockfd_, reinterpret_cast<struct sockaddr*>(&addr), &len,
                                 SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (connfd >= 0) peeraddr->setSockAddr(addr);
    return connfd;
}

void Socket::ShutdownWrite() {
    if (::shutdown(sockfd_, SHUT_WR) < 0) {
        LOG_DEBUG << "shutdown(SHUT_WR) fd=" << sockfd_ << " errno=" << errno;
    }
}

void Socket::SetOption(Option option, bool on) {
    int level = SOL_SOCKET;
    int name = SO_KEEPALIVE;
    switch (option) {
    case kNoDelay:
        level = IPPROTO_TCP;
        name = TCP_NODELAY;
        break;
    case kReuseAddr: name = SO_REUSEADDR; break;
    case kKeepAlive: name = SO_KEEPALIVE; break;
    }
    const int value = on ? 1 : 0;
    if (::setsockopt(sockfd_, level, name, &value, sizeof value) < 0) {
        LOG_WARN << "setsockopt " << name << " fd=" << sockfd_ << " errno=" << errno;
    }
}

} // namespace network
} // namespace devproxy
