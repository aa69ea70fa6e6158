#pragma once

#include "devproxy/common/noncopyable.h"
#include "devproxy/network/Buffer.h"
#include "devproxy/network/Callbacks.h"
#include "devproxy/network/InetAddress.h"

#include <any>
#include <atomic>
#include <chrono>
#include <memory>
#include <string>

struct ssl_ctx_st;
struct ssl_st;

namespace devproxy {
namespace network {

class Channel;
class EventLoop;
class Socket;

// An established TCP connection, optionally wrapped in a client-side TLS session.
// Owned by a shared_ptr; every handler runs on loop_.
class TcpConnection : devproxy::common::noncopyable,
                      public std::enable_shared_from_this<TcpConnection> {
public:
    TcpConnection(EventLoop* loop,
                  const std::string& name,
                  int sockfd,
                  const InetAddress& localAddr,
                  const InetAddress& peerAddr);
    ~TcpConnection();

    EventLoop* getLoop() const { return loop_; }
    const std::string& name() const { return name_; }
    const InetAddress& peerAddress() const { return peerAddr_; }
    bool connected() const { return state_ == kConnected; }
    // Loop thread only.
    Buffer* inputBuffer() { return &inputBuffer_; }

    void SetContext(const std::any& context) { context_ = context; }
    const std::any& GetContext() const { return context_; }
    std::any* GetMutableContext() { return &context_; }

    // Must be called before ConnectEstablished. Bytes sent before the handshake
    // completes are queued and flushed afterwards.
    void EnableClientTls(ssl_ctx_st* ctx, const std::string& serverName, bool verifyHost);
    bool tlsEstablished() const { return tlsState_ == kTlsEstablished; }

    // Thread safe
    void Send(const std::string& message);
    void Send(const void* data, size_t len);
    void Shutdown();
    void ForceClose();
    void StartRead();
    void StopRead();
    void SetTcpNoDelay(bool on);

    void SetConnectionCallback(const ConnectionCallback& cb) { connectionCallback_ = cb; }
    void SetMessageCallback(const MessageCallback& cb) { messageCallback_ = cb; }
    void SetWriteCompleteCallback(const WriteCompleteCallback& cb) { writeCompleteCallback_ = cb; }
    void SetHighWaterMarkCallback(const HighWaterMarkCallback& cb, size_t highWaterMark) {
        highWaterMarkCallback_ = cb;
        highWaterMark_ = highWaterMark;
    }
    void SetCloseCallback(const CloseCallback& cb) { closeCallback_ = cb; }

    // Called by the owning TcpServer / TcpClient once the socket is usable.
    void ConnectEstablished();
    // Called after the owner has dropped the connection.
    void ConnectDestroyed();

private:
    enum StateE { kDisconnected, kConnecting, kConnected, kDisconnecting };
    enum TlsState { kTlsNone, kTlsHandshaking, kTlsEstablished };

    void HandleRead(std::chrono::system_clock::time_point receiveTime);
    void HandleWrite();
    void HandleClose();
    void HandleError();

    void SendInLoop(const void* message, size_t len);
    void ShutdownInLoop();
    void ForceCloseInLoop();
    void StartReadInLoop();
    void StopReadInLoop();
    void AppendOutput(const char* data, size_t len);

    void TlsStartHandshake();
    void TlsHandshake();
    void TlsFail(const char* where);
    ssize_t TlsReadAll(int* savedErrno, bool* peerClosed);
    ssize_t TlsWrite(const void* data, size_t len, int* savedErrno);

    void SetState(StateE s) { state_ = s; }

    EventLoop* loop_;
    const std::string name_;
    std::atomic<StateE> state_;
    bool reading_;

    std::unique_ptr<Socket> socket_;
    std::unique_ptr<Channel> channel_;

    const InetAddress localAddr_;
    const InetAddress peerAddr_;

    ConnectionCallback connectionCallback_;
    MessageCallback messageCallback_;
    WriteCompleteCallback writeCompleteCallback_;
    HighWaterMarkCallback highWaterMarkCallback_;
    CloseCallback closeCallback_;

    size_t highWaterMark_;

    Buffer inputBuffer_;
    Buffer outputBuffer_;

    std::any context_;

    ssl_ctx_st* tlsCtx_{nullptr};
    ssl_st* ssl_{nullptr};
    std::string tlsServerName_;
    bool tlsVerifyHost_{false};
    TlsState tlsState_{kTlsNone};
    bool tlsWantWrite_{false};
};

} // namespace network
} // namespace devproxy
