#include "devproxy/network/Acceptor.h"
#include "devproxy/network/EventLoop.h"
#include "devproxy/network/InetAddress.h"
#include "devproxy/common/Logger.h"

#include <cerrno>
#include <fcntl.h>
#include <sys/socket.h>
#include <unistd.h>

namespace devproxy {
namespace network {

Acceptor::Acceptor(EventLoop* loop, const InetAddress& listenAddr)
    : acceptSocket_(Socket::CreateNonblockingTcp()),
      acceptChannel_(loop, acceptSocket_.fd()),
      bound_(false),
      listening_(false),
      reserveFd_(::open("/dev/null", O_RDONLY | O_CLOEXEC)) {
    if (!acceptSocket_.valid()) {
        LOG_ERROR << "Acceptor socket() failed errno=" << errno;
        return;
    }
    acceptSocket_.SetReuseAddr(true);
    bound_ = acceptSocket_.BindAddress(listenAddr);
    acceptChannel_.SetReadCallback([this](std::chrono::system_clock::time_point) { HandleRead(); });
}

Acceptor::~Acceptor() {
    if (listening_) {
        acceptChannel_.DisableAll();
        acceptChannel_.Remove();
    }
    if (reserveFd_ >= 0) ::close(reserveFd_);
}

bool Acceptor::Listen() {
    if (!bound_ || !acceptSocket_.Listen()) return false;
    listening_ = true;
    acceptChannel_.EnableReading();
    return true;
}

void Acceptor::HandleRead() {
    InetAddress peerAddr;
    const int connfd = acceptSocket_.Accept(&peerAddr);
    if (connfd >= 0) {
        if (newConnectionCallback_) {
            newConnectionCallback_(connfd, peerAddr);
        } else {
            ::close(connfd);
        }
        return;
    }
    const int savedErrno = errno;
    if (savedErrno == EAGAIN || savedErrno == EINTR || savedErrno == ECONNABORTED) return;
    LOG_ERROR << "accept failed errno=" << savedErrno;
    if (savedErrno == EMFILE || savedErrno == ENFILE) ShedOneConnection();
}

// Level-triggered epoll would spin on a pending connection we cannot accept.
void Acceptor::ShedOneConnection() {
    if (reserveFd_ < 0) return;
    ::close(reserveFd_);
    const int fd = ::accept(acceptSocket_.fd(), nullptr, nullptr);
    if (fd >= 0) ::close(fd);
    reserveFd_ = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
}

} // namespace network
} // namespace devproxy
