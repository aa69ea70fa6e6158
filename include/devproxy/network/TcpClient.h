#pragma once

#include "devproxy/common/noncopyable.h"
#include "devproxy/network/TcpConnection.h"

#include <mutex>
#include <string>

struct ssl_ctx_st;

namespace devproxy {
namespace network {

class Connector;
class EventLoop;

class TcpClient : devproxy::common::noncopyable {
public:
    TcpClient(EventLoop* loop, const InetAddress& serverAddr, const std::string& nameArg);
    ~TcpClient();

    void Connect();
    void Disconnect();
    void Stop();

    TcpConnectionPtr connection() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return connection_;
    }

    EventLoop* getLoop() const { return loop_; }

    // Connect attempt policy, forwarded to the Connector.
    void SetMaxConnectRetries(int maxRetries);
    void SetConnectTimeoutMs(int ms);

    // Wrap every connection in TLS; ctx must outlive this client.
    void EnableTls(ssl_ctx_st* ctx, const std::string& serverName, bool verifyHost);

    const std::string& name() const { return name_; }

    void SetConnectionCallback(const ConnectionCallback& cb) { connectionCallback_ = cb; }
    void SetMessageCallback(const MessageCallback& cb) { messageCallback_ = cb; }
    void SetWriteCompleteCallback(const WriteCompleteCallback& cb) { writeCompleteCallback_ = cb; }
    void SetConnectFailedCallback(const ConnectFailedCallback& cb);

private:
    void NewConnection(int sockfd);
    void RemoveConnection(const TcpConnectionPtr& conn);

    EventLoop* loop_;
    std::shared_ptr<Connector> connector_;
    const std::string name_;

    ConnectionCallback connectionCallback_;
    MessageCallback messageCallback_;
    WriteCompleteCallback writeCompleteCallback_;

    ssl_ctx_st* tlsCtx_{nullptr};
    std::string tlsServerName_;
    bool tlsVerifyHost_{false};

    int nextConnId_;
    mutable std::mutex mutex_;
    TcpConnectionPtr connection_;
};

} // namespace network
} // namespace devproxy
