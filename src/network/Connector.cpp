#include "devproxy/network/Connector.h"
#include "devproxy/network/Channel.h"
#include "devproxy/network/EventLoop.h"
#include "devproxy/network/Socket.h"
#include "devproxy/common/Logger.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <sys/socket.h>
#include <sys/timerfd.h>
#include <unistd.h>

namespace devproxy {
namespace network {

const int Connector::kMaxRetryDelayMs;
const int Connector::kInitRetryDelayMs;

Connector::Connector(EventLoop* loop, const InetAddress& serverAddr)
    : loop_(loop),
      serverAddr_(serverAddr),
      connect_(false),
      state_(kDisconnected),
      retryDelayMs_(kInitRetryDelayMs),
      maxRetries_(-1),
      retries_(0),
      connectTimeoutMs_(0) {
}

Connector::~Connector() {
    CancelTimer(&retryTimer_);
    CancelTimer(&timeoutTimer_);
    if (channel_) {
        LOG_WARN << "Connector destroyed while connecting to " << serverAddr_.toIpPort();
    }
}

void Connector::Start() {
    connect_ = true;
    loop_->RunInLoop([self = shared_from_this()]() { self->StartInLoop(); });
}

void Connector::Stop() {
    connect_ = false;
    loop_->QueueInLoop([self = shared_from_this()]() { self->StopInLoop(); });
}

void Connector::StartInLoop() {
    if (connect_) {
        Connect();
    } else {
        LOG_DEBUG << "Connector::StartInLoop - stopped";
    }
}

void Connector::StopInLoop() {
    CancelTimer(&retryTimer_);
    CancelTimer(&timeoutTimer_);
    if (state_ == kConnecting) {
        SetState(kDisconnected);
        int sockfd = RemoveAndResetChannel();
        ::close(sockfd);
    }
}

void Connector::Connect() {
    int sockfd = Socket::CreateNonblockingTcp();
    if (sockfd < 0) {
        const int err = errno;
        LOG_ERROR << "Connector::Connect socket() errno=" << err;
        connect_ = false;
        if (connectFailedCallback_) connectFailedCallback_(err);
        return;
    }

    int ret = ::connect(sockfd, serverAddr_.getSockAddr(), sizeof(struct sockaddr_in));
    int savedErrno = (ret == 0) ? 0 : errno;

    switch (savedErrno) {
        case 0:
        case EINPROGRESS:
        case EINTR:
        case EISCONN:
            Connecting(sockfd);
            break;

        case EAGAIN:
        case EADDRINUSE:
        case EADDRNOTAVAIL:
        case ECONNREFUSED:
        case ENETUNREACH:
        case EHOSTUNREACH:
            Retry(sockfd, savedErrno);
            break;

        default:
            LOG_ERROR << "Connector::Connect to " << serverAddr_.toIpPort() << " errno=" << savedErrno
                      << " " << std::strerror(savedErrno);
            ::close(sockfd);
            connect_ = false;
            if (connectFailedCallback_) connectFailedCallback_(savedErrno);
            break;
    }
}

void Connector::Connecting(int sockfd) {
    SetState(kConnecting);
    channel_.reset(new Channel(loop_, sockfd));
    channel_->Tie(shared_from_this());
    channel_->SetWriteCallback([this]() { HandleWrite(); });
    channel_->SetErrorCallback([this]() { HandleError(); });
    channel_->EnableWriting();
    if (connectTimeoutMs_ > 0) {
        ArmTimer(&timeoutTimer_, connectTimeoutMs_, &Connector::HandleTimeout);
    }
}

int Connector::RemoveAndResetChannel() {
    channel_->DisableAll();
    channel_->Remove();
    int sockfd = channel_->fd();
    // Can't reset channel_ here because we may be inside Channel::HandleEvent.
    loop_->QueueInLoop([self = shared_from_this()]() { self->ResetChannel(); });
    return sockfd;
}

void Connector::ResetChannel() {
    channel_.reset();
}

void Connector::HandleWrite() {
    if (state_ != kConnecting) return;

    CancelTimer(&timeoutTimer_);
    int sockfd = RemoveAndResetChannel();
    int err = 0;
    socklen_t len = sizeof err;
    if (::getsockopt(sockfd, SOL_SOCKET, SO_ERROR, &err, &len) < 0) {
        err = errno;
    }

    if (err) {
        LOG_DEBUG << "Connector::HandleWrite - SO_ERROR = " << err << " " << std::strerror(err);
        Retry(sockfd, err);
        return;
    }

    SetState(kConnected);
    if (connect_ && newConnectionCallback_) {
        newConnectionCallback_(sockfd);
    } else {
        ::close(sockfd);
    }
}

void Connector::HandleError() {
    if (state_ != kConnecting) return;

    CancelTimer(&timeoutTimer_);
    int sockfd = RemoveAndResetChannel();
    int err = 0;
    socklen_t len = sizeof err;
    if (::getsockopt(sockfd, SOL_SOCKET, SO_ERROR, &err, &len) < 0) {
        err = errno;
    }
    LOG_DEBUG << "Connector::HandleError - SO_ERROR = " << err << " " << std::strerror(err);
    Retry(sockfd, err != 0 ? err : ECONNREFUSED);
}

void Connector::HandleTimeout() {
    if (state_ != kConnecting) return;
    LOG_WARN << "Connector: connect to " << serverAddr_.toIpPort() << " timed out after "
             << connectTimeoutMs_ << " ms";
    int sockfd = RemoveAndResetChannel();
    Retry(sockfd, ETIMEDOUT);
}

void Connector::Retry(int sockfd, int err) {
    ::close(sockfd);
    SetState(kDisconnected);
    if (!connect_) {
        LOG_DEBUG << "Connector::Retry - stopped, not retrying";
        return;
    }

    if (maxRetries_ >= 0 && retries_ >= maxRetries_) {
        connect_ = false;
        LOG_DEBUG << "Connector: giving up on " << serverAddr_.toIpPort() << " errno=" << err;
        if (connectFailedCallback_) connectFailedCallback_(err);
        return;
    }

    ++retries_;
    LOG_INFO << "Connector::Retry - retry connecting to " << serverAddr_.toIpPort()
             << " in " << retryDelayMs_ << " milliseconds";
    ArmTimer(&retryTimer_, retryDelayMs_, &Connector::OnRetryTimer);
    retryDelayMs_ = std::min(retryDelayMs_ * 2, kMaxRetryDelayMs);
}

void Connector::OnRetryTimer() {
    StartInLoop();
}

void Connector::CancelTimer(Timer* timer) {
    Channel* ch = timer->channel.release();
    const int fd = timer->fd;
    timer->fd = -1;
    if (!ch && fd < 0) return;

    // The channel may be the one currently dispatching; free it on the next turn.
    auto cleanup = [ch, fd]() {
        if (ch) {
            ch->DisableAll();
            ch->Remove();
            delete ch;
        }
        if (fd >= 0) {
            ::close(fd);
        }
    };
    if (ch) {
        ch->DisableAll();
    }
    loop_->QueueInLoop(cleanup);
}

void Connector::ArmTimer(Timer* timer, int delayMs, void (Connector::*onFire)()) {
    CancelTimer(timer);

    timer->fd = ::timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (timer->fd < 0) {
        LOG_ERROR << "Connector::ArmTimer timerfd_create failed errno=" << errno;
        return;
    }

    struct itimerspec howlong;
    std::memset(&howlong, 0, sizeof howlong);
    howlong.it_value.tv_sec = delayMs / 1000;
    howlong.it_value.tv_nsec = static_cast<long>(delayMs % 1000) * 1000 * 1000;
    if (howlong.it_value.tv_sec == 0 && howlong.it_value.tv_nsec == 0) {
        howlong.it_value.tv_nsec = 1000 * 1000;
    }
    if (::timerfd_settime(timer->fd, 0, &howlong, nullptr) != 0) {
        LOG_ERROR << "Connector::ArmTimer timerfd_settime failed errno=" << errno;
        ::close(timer->fd);
        timer->fd = -1;
        return;
    }

    timer->channel.reset(new Channel(loop_, timer->fd));
    std::weak_ptr<Connector> weakSelf = shared_from_this();
    timer->channel->SetReadCallback([weakSelf, timer, onFire](std::chrono::system_clock::time_point) {
        auto self = weakSelf.lock();
        if (!self) return;
        uint64_t expirations = 0;
        if (::read(timer->fd, &expirations, sizeof expirations) < 0) {
            LOG_DEBUG << "Connector timer read errno=" << errno;
        }
        self->CancelTimer(timer);
        ((*self).*onFire)();
    });
    timer->channel->EnableReading();
}

} // namespace network
} // namespace devproxy
