#include "devproxy/network/TcpConnection.h"
#include "devproxy/network/Channel.h"
#include "devproxy/network/EventLoop.h"
#include "devproxy/network/Socket.h"
#include "devproxy/network/TlsContext.h"
#include "devproxy/common/Logger.h"
#include "devproxy/monitor/Stats.h"

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509v3.h>

#include <cerrno>
#include <sys/socket.h>
#include <unistd.h>

namespace devproxy {
namespace network {

namespace {
const size_t kDefaultHighWaterMark = 64 * 1024 * 1024;
const size_t kTlsReadChunk = 16 * 1024;
} // namespace

TcpConnection::TcpConnection(EventLoop* loop,
                             const std::string& nameArg,
                             int sockfd,
                             const InetAddress& localAddr,
                             const InetAddress& peerAddr)
    : loop_(loop),
      name_(nameArg),
      state_(kConnecting),
      reading_(true),
      socket_(new Socket(sockfd)),
      channel_(new Channel(loop, sockfd)),
      localAddr_(localAddr),
      peerAddr_(peerAddr),
      highWaterMark_(kDefaultHighWaterMark) {
    channel_->SetReadCallback(
        [this](std::chrono::system_clock::time_point t) { HandleRead(t); });
    channel_->SetWriteCallback([this]() { HandleWrite(); });
    channel_->SetCloseCallback([this]() { HandleClose(); });
    channel_->SetErrorCallback([this]() { HandleError(); });

    LOG_DEBUG << "TcpConnection::ctor[" << name_ << "] at " << this << " fd=" << sockfd;
    socket_->SetKeepAlive(true);
}

TcpConnection::~TcpConnection() {
    LOG_DEBUG << "TcpConnection::dtor[" << name_ << "] at " << this << " fd=" << channel_->fd()
              << " state=" << state_;
    if (ssl_) {
        SSL_free(reinterpret_cast<SSL*>(ssl_));
        ssl_ = nullptr;
    }
}

void TcpConnection::EnableClientTls(ssl_ctx_st* ctx, const std::string& serverName, bool verifyHost) {
    tlsCtx_ = ctx;
    tlsServerName_ = serverName;
    tlsVerifyHost_ = verifyHost;
}

void TcpConnection::ConnectEstablished() {
    SetState(kConnected);
    channel_->Tie(shared_from_this());
    channel_->EnableReading();

    if (connectionCallback_) {
        connectionCallback_(shared_from_this());
    }
    if (tlsCtx_ && state_ == kConnected) {
        TlsStartHandshake();
    }
}

void TcpConnection::ConnectDestroyed() {
    if (state_ == kConnected) {
        SetState(kDisconnected);
        channel_->DisableAll();
        if (connectionCallback_) {
            connectionCallback_(shared_from_this());
        }
    }
    channel_->Remove();
}

void TcpConnection::TlsStartHandshake() {
    SSL* s = SSL_new(reinterpret_cast<SSL_CTX*>(tlsCtx_));
    if (!s) {
        TlsFail("SSL_new");
        return;
    }
    SSL_set_fd(s, channel_->fd());
    SSL_set_connect_state(s);
#ifdef SSL_OP_IGNORE_UNEXPECTED_EOF
    // Close-delimited bodies end with a bare TCP FIN from many origins.
    SSL_set_options(s, SSL_OP_IGNORE_UNEXPECTED_EOF);
#endif
    if (!tlsServerName_.empty()) {
        SSL_set_tlsext_host_name(s, tlsServerName_.c_str());
        if (tlsVerifyHost_) {
            SSL_set_hostflags(s, X509_CHECK_FLAG_NO_PARTIAL_WILDCARDS);
            SSL_set1_host(s, tlsServerName_.c_str());
        }
    }
    ssl_ = reinterpret_cast<ssl_st*>(s);
    tlsState_ = kTlsHandshaking;
    TlsHandshake();
}

void TcpConnection::TlsHandshake() {
    SSL* s = reinterpret_cast<SSL*>(ssl_);
    const int r = SSL_do_handshake(s);
    if (r == 1) {
        tlsState_ = kTlsEstablished;
        tlsWantWrite_ = false;
        LOG_DEBUG << "TLS established [" << name_ << "] " << SSL_get_version(s);
        if (outputBuffer_.ReadableBytes() > 0) {
            if (!channel_->IsWriting()) channel_->EnableWriting();
        } else if (channel_->IsWriting()) {
            channel_->DisableWriting();
        }
        return;
    }
    const int e = SSL_get_error(s, r);
    if (e == SSL_ERROR_WANT_READ) {
        // Queued plaintext must wait for the handshake, so EPOLLOUT would only spin.
        tlsWantWrite_ = false;
        if (channel_->IsWriting()) channel_->DisableWriting();
        return;
    }
    if (e == SSL_ERROR_WANT_WRITE) {
        tlsWantWrite_ = true;
        if (!channel_->IsWriting()) channel_->EnableWriting();
        return;
    }
    if (tlsVerifyHost_ && SSL_get_verify_result(s) != X509_V_OK) {
        LOG_WARN << "TLS peer verification failed [" << name_ << "]: "
                 << X509_verify_cert_error_string(SSL_get_verify_result(s));
    }
    TlsFail("handshake");
}

void TcpConnection::TlsFail(const char* where) {
    const std::string err = TlsContext::LastError();
    LOG_WARN << "TLS " << where << " failed [" << name_ << "]" << (err.empty() ? "" : ": ") << err;
    ERR_clear_error();
    // Defer so callers up the stack do not see the connection vanish mid-call.
    loop_->QueueInLoop([self = shared_from_this()]() { self->ForceCloseInLoop(); });
}

ssize_t TcpConnection::TlsReadAll(int* savedErrno, bool* peerClosed) {
    SSL* s = reinterpret_cast<SSL*>(ssl_);
    ssize_t total = 0;
    char tmp[kTlsReadChunk];
    for (;;) {
        const int r = SSL_read(s, tmp, static_cast<int>(sizeof tmp));
        if (r > 0) {
            inputBuffer_.Append(tmp, static_cast<size_t>(r));
            total += r;
            continue;
        }
        const int e = SSL_get_error(s, r);
        if (e == SSL_ERROR_WANT_READ) break;
        if (e == SSL_ERROR_WANT_WRITE) {
            tlsWantWrite_ = true;
            if (!channel_->IsWriting()) channel_->EnableWriting();
            break;
        }
        if (e == SSL_ERROR_ZERO_RETURN) {
            *peerClosed = true;
            break;
        }
        if (e == SSL_ERROR_SYSCALL && errno == 0) {
            *peerClosed = true;
            break;
        }
        *savedErrno = (e == SSL_ERROR_SYSCALL) ? errno : EIO;
        return total > 0 ? total : -1;
    }
    return total;
}

ssize_t TcpConnection::TlsWrite(const void* data, size_t len, int* savedErrno) {
    SSL* s = reinterpret_cast<SSL*>(ssl_);
    const int r = SSL_write(s, data, static_cast<int>(len));
    if (r > 0) return r;
    const int e = SSL_get_error(s, r);
    if (e == SSL_ERROR_WANT_WRITE || e == SSL_ERROR_WANT_READ) {
        *savedErrno = EWOULDBLOCK;
        return -1;
    }
    *savedErrno = (e == SSL_ERROR_SYSCALL && errno != 0) ? errno : EIO;
    return -1;
}

void TcpConnection::HandleRead(std::chrono::system_clock::time_point receiveTime) {
    if (tlsState_ == kTlsHandshaking) {
        TlsHandshake();
        if (tlsState_ != kTlsEstablished) return;
    }

    int savedErrno = 0;
    bool peerClosed = false;
    ssize_t n = 0;
    if (tlsState_ == kTlsEstablished) {
        n = TlsReadAll(&savedErrno, &peerClosed);
    } else {
        n = inputBuffer_.ReadFd(channel_->fd(), &savedErrno);
        if (n == 0) peerClosed = true;
    }

    if (n > 0) {
        devproxy::monitor::Stats::Instance().AddBytesIn(n);
        if (messageCallback_) {
            messageCallback_(shared_from_this(), &inputBuffer_, receiveTime);
        }
    }
    if (peerClosed) {
        HandleClose();
    } else if (n < 0) {
        if (savedErrno == EAGAIN || savedErrno == EWOULDBLOCK || savedErrno == EINTR) return;
        LOG_DEBUG << "TcpConnection::HandleRead [" << name_ << "] errno=" << savedErrno;
        HandleClose();
    }
}

void TcpConnection::HandleWrite() {
    if (tlsState_ == kTlsHandshaking) {
        if (tlsWantWrite_) TlsHandshake();
        return;
    }
    if (tlsWantWrite_) {
        // SSL_read stalled on a write; let it resume.
        tlsWantWrite_ = false;
        if (outputBuffer_.ReadableBytes() == 0) channel_->DisableWriting();
        HandleRead(std::chrono::system_clock::now());
        if (state_ == kDisconnected) return;
    }

    if (!channel_->IsWriting()) {
        LOG_DEBUG << "Connection fd = " << channel_->fd() << " is down, no more writing";
        return;
    }

    int savedErrno = 0;
    ssize_t n = 0;
    if (tlsState_ == kTlsEstablished) {
        n = TlsWrite(outputBuffer_.Peek(), outputBuffer_.ReadableBytes(), &savedErrno);
    } else {
        n = ::write(channel_->fd(), outputBuffer_.Peek(), outputBuffer_.ReadableBytes());
        if (n < 0) savedErrno = errno;
    }
    if (n > 0) {
        devproxy::monitor::Stats::Instance().AddBytesOut(n);
        outputBuffer_.Retrieve(n);
        if (outputBuffer_.ReadableBytes() == 0) {
            channel_->DisableWriting();
            if (writeCompleteCallback_) {
                loop_->QueueInLoop(std::bind(writeCompleteCallback_, shared_from_this()));
            }
            if (state_ == kDisconnecting) {
                ShutdownInLoop();
            }
        }
    } else if (savedErrno != EWOULDBLOCK && savedErrno != EAGAIN && savedErrno != EINTR) {
        LOG_DEBUG << "TcpConnection::HandleWrite [" << name_ << "] errno=" << savedErrno;
        if (savedErrno == EPIPE || savedErrno == ECONNRESET || savedErrno == EIO) {
            HandleClose();
        }
    }
}

void TcpConnection::HandleClose() {
    if (state_ == kDisconnected) return;
    LOG_DEBUG << "TcpConnection::HandleClose [" << name_ << "] fd=" << channel_->fd();
    SetState(kDisconnected);
    channel_->DisableAll();

    TcpConnectionPtr guardThis(shared_from_this());
    if (connectionCallback_) {
        connectionCallback_(guardThis);
    }
    if (closeCallback_) {
        closeCallback_(guardThis);
    }
}

void TcpConnection::HandleError() {
    int err = 0;
    int optval = 0;
    socklen_t optlen = static_cast<socklen_t>(sizeof optval);
    if (::getsockopt(channel_->fd(), SOL_SOCKET, SO_ERROR, &optval, &optlen) < 0) {
        err = errno;
    } else {
        err = optval;
    }
    LOG_DEBUG << "TcpConnection::HandleError [" << name_ << "] SO_ERROR=" << err;
}

void TcpConnection::Send(const std::string& message) {
    Send(message.data(), message.size());
}

void TcpConnection::Send(const void* data, size_t len) {
    if (state_ != kConnected) return;
    if (loop_->IsInLoopThread()) {
        SendInLoop(data, len);
    } else {
        std::string msg(static_cast<const char*>(data), len);
        loop_->RunInLoop([ptr = shared_from_this(), msg = std::move(msg)]() {
            ptr->SendInLoop(msg.data(), msg.size());
        });
    }
}

void TcpConnection::AppendOutput(const char* data, size_t len) {
    const size_t oldLen = outputBuffer_.ReadableBytes();
    if (oldLen + len >= highWaterMark_ && oldLen < highWaterMark_ && highWaterMarkCallback_) {
        loop_->QueueInLoop(std::bind(highWaterMarkCallback_, shared_from_this(), oldLen + len));
    }
    outputBuffer_.Append(data, len);
}

void TcpConnection::SendInLoop(const void* data, size_t len) {
    if (state_ == kDisconnected) {
        LOG_DEBUG << "[" << name_ << "] disconnected, give up writing";
        return;
    }
    if (len == 0) return;

    const char* p = static_cast<const char*>(data);
    if (tlsState_ == kTlsHandshaking || (tlsCtx_ && tlsState_ == kTlsNone)) {
        AppendOutput(p, len);
        return;
    }

    ssize_t nwrote = 0;
    size_t remaining = len;
    bool faultError = false;

    // Nothing queued: try the socket directly.
    if (!channel_->IsWriting() && outputBuffer_.ReadableBytes() == 0) {
        int savedErrno = 0;
        if (tlsState_ == kTlsEstablished) {
            nwrote = TlsWrite(p, len, &savedErrno);
        } else {
            nwrote = ::write(channel_->fd(), p, len);
            if (nwrote < 0) savedErrno = errno;
        }
        if (nwrote >= 0) {
            if (nwrote > 0) {
                devproxy::monitor::Stats::Instance().AddBytesOut(nwrote);
            }
            remaining = len - nwrote;
            if (remaining == 0 && writeCompleteCallback_) {
                loop_->QueueInLoop(std::bind(writeCompleteCallback_, shared_from_this()));
            }
        } else {
            nwrote = 0;
            if (savedErrno != EWOULDBLOCK && savedErrno != EAGAIN) {
                LOG_DEBUG << "TcpConnection::SendInLoop [" << name_ << "] errno=" << savedErrno;
                if (savedErrno == EPIPE || savedErrno == ECONNRESET || savedErrno == EIO) {
                    faultError = true;
                }
            }
        }
    }

    if (faultError) {
        HandleClose();
        return;
    }
    if (remaining > 0) {
        AppendOutput(p + nwrote, remaining);
        if (!channel_->IsWriting()) {
            channel_->EnableWriting();
        }
    }
}

void TcpConnection::Shutdown() {
    if (state_ == kConnected) {
        SetState(kDisconnecting);
        loop_->RunInLoop([self = shared_from_this()]() { self->ShutdownInLoop(); });
    }
}

void TcpConnection::ShutdownInLoop() {
    if (channel_->IsWriting() || outputBuffer_.ReadableBytes() > 0) return;
    if (ssl_ && tlsState_ == kTlsEstablished) {
        SSL_shutdown(reinterpret_cast<SSL*>(ssl_));
    }
    socket_->ShutdownWrite();
}

void TcpConnection::ForceClose() {
    if (state_ == kConnected || state_ == kDisconnecting || state_ == kConnecting) {
        loop_->RunInLoop([self = shared_from_this()]() { self->ForceCloseInLoop(); });
    }
}

void TcpConnection::ForceCloseInLoop() {
    if (state_ == kConnected || state_ == kDisconnecting || state_ == kConnecting) {
        HandleClose();
    }
}

void TcpConnection::StartRead() {
    loop_->RunInLoop([self = shared_from_this()]() { self->StartReadInLoop(); });
}

void TcpConnection::StopRead() {
    loop_->RunInLoop([self = shared_from_this()]() { self->StopReadInLoop(); });
}

void TcpConnection::StartReadInLoop() {
    if (!reading_ && state_ != kDisconnected) {
        reading_ = true;
        channel_->EnableReading();
        // Bytes that arrived before the pause are still buffered.
        if (inputBuffer_.ReadableBytes() > 0 && messageCallback_) {
            loop_->QueueInLoop([self = shared_from_this()]() {
                if (self->reading_ && self->state_ != kDisconnected && self->messageCallback_ &&
                    self->inputBuffer_.ReadableBytes() > 0) {
                    self->messageCallback_(self, &self->inputBuffer_, std::chrono::system_clock::now());
                }
            });
        }
    }
}

void TcpConnection::StopReadInLoop() {
    if (reading_) {
        reading_ = false;
        channel_->DisableReading();
    }
}

void TcpConnection::SetTcpNoDelay(bool on) {
    socket_->SetTcpNoDelay(on);
}

} // namespace network
} // namespace devproxy
