#include "devproxy/network/TcpClient.h"
#include "devproxy/network/Connector.h"
#include "devproxy/network/EventLoop.h"
#include "devproxy/common/Logger.h"

#include <cstdio>

namespace devproxy {
namespace network {

namespace {

void DestroyDetached(EventLoop* loop, const TcpConnectionPtr& conn) {
    loop->QueueInLoop([conn]() { conn->ConnectDestroyed(); });
}

} // namespace

TcpClient::TcpClient(EventLoop* loop, const InetAddress& serverAddr, const std::string& nameArg)
    : loop_(loop),
      connector_(std::make_shared<Connector>(loop, serverAddr)),
      name_(nameArg),
      nextConnId_(1) {
    connector_->SetNewConnectionCallback([this](int sockfd) { NewConnection(sockfd); });
    LOG_DEBUG << "TcpClient::TcpClient[" << name_ << "] - connector " << connector_.get();
}

TcpClient::~TcpClient() {
    LOG_DEBUG << "TcpClient::~TcpClient[" << name_ << "] - connector " << connector_.get();
    TcpConnectionPtr conn;
    bool unique = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        unique = (connection_.use_count() == 1);
        conn = connection_;
    }
    if (conn) {
        // The connection may outlive us; its close must no longer reach this object.
        CloseCallback cb = [loop = loop_](const TcpConnectionPtr& c) { DestroyDetached(loop, c); };
        loop_->RunInLoop([conn, cb]() { conn->SetCloseCallback(cb); });
        if (unique) {
            conn->ForceClose();
        }
    } else {
        connector_->Stop();
    }
}

void TcpClient::SetMaxConnectRetries(int maxRetries) {
    connector_->SetMaxRetries(maxRetries);
}

void TcpClient::SetConnectTimeoutMs(int ms) {
    connector_->SetConnectTimeoutMs(ms);
}

void TcpClient::SetConnectFailedCallback(const ConnectFailedCallback& cb) {
    connector_->SetConnectFailedCallback(cb);
}

void TcpClient::EnableTls(ssl_ctx_st* ctx, const std::string& serverName, bool verifyHost) {
    tlsCtx_ = ctx;
    tlsServerName_ = serverName;
    tlsVerifyHost_ = verifyHost;
}

void TcpClient::Connect() {
    LOG_DEBUG << "TcpClient::Connect[" << name_ << "] - connecting to "
              << connector_->serverAddress().toIpPort();
    connector_->Start();
}

void TcpClient::Disconnect() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (connection_) {
        connection_->Shutdown();
    }
}

void TcpClient::Stop() {
    connector_->Stop();
}

void TcpClient::NewConnection(int sockfd) {
    InetAddress peerAddr = InetAddress::PeerOf(sockfd);
    InetAddress localAddr = InetAddress::LocalOf(sockfd);

    char buf[64];
    snprintf(buf, sizeof buf, ":%s#%d", peerAddr.toIpPort().c_str(), nextConnId_);
    ++nextConnId_;
    std::string connName = name_ + buf;

    TcpConnectionPtr conn = std::make_shared<TcpConnection>(loop_, connName, sockfd, localAddr, peerAddr);
    if (tlsCtx_) {
        conn->EnableClientTls(tlsCtx_, tlsServerName_, tlsVerifyHost_);
    }
    conn->SetTcpNoDelay(true);
    conn->SetConnectionCallback(connectionCallback_);
    conn->SetMessageCallback(messageCallback_);
    conn->SetWriteCompleteCallback(writeCompleteCallback_);
    conn->SetCloseCallback([this](const TcpConnectionPtr& c) { RemoveConnection(c); });

    {
        std::lock_guard<std::mutex> lock(mutex_);
        connection_ = conn;
    }
    conn->ConnectEstablished();
}

void TcpClient::RemoveConnection(const TcpConnectionPtr& conn) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        connection_.reset();
    }

    // Upstream connections are never re-dialed here; the pool opens a fresh client.
    loop_->QueueInLoop([conn]() { conn->ConnectDestroyed(); });
}

} // namespace network
} // namespace devproxy
