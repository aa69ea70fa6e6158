#include "devproxy/network/TcpServer.h"
#include "devproxy/network/Acceptor.h"
#include "devproxy/network/EventLoop.h"
#include "devproxy/common/Logger.h"
#include "devproxy/monitor/Stats.h"

namespace devproxy {
namespace network {

TcpServer::TcpServer(EventLoop* loop, const InetAddress& listenAddr, const std::string& name)
    : loop_(loop),
      hostport_(listenAddr.toIpPort()),
      name_(name),
      acceptor_(new Acceptor(loop, listenAddr)),
      threadPool_(new EventLoopThreadPool(loop, name)),
      started_(false),
      nextConnId_(1) {
    acceptor_->SetNewConnectionCallback(
        [this](int sockfd, const InetAddress& peerAddr) { NewConnection(sockfd, peerAddr); });
}

TcpServer::~TcpServer() {
    for (const TcpConnectionPtr& conn : connections_) {
        TcpConnectionPtr keep(conn);
        keep->getLoop()->RunInLoop([keep]() { keep->ConnectDestroyed(); });
    }
    connections_.clear();
}

bool TcpServer::Start() {
    if (started_) return acceptor_->listening();
    started_ = true;
    if (!acceptor_->bound()) {
        LOG_ERROR << "TcpServer [" << name_ << "] cannot bind " << hostport_;
        return false;
    }
    threadPool_->Start();
    if (loop_->IsInLoopThread()) return acceptor_->Listen();

    loop_->RunInLoop([this]() {
        if (!acceptor_->Listen()) {
            LOG_ERROR << "TcpServer [" << name_ << "] listen failed on " << hostport_;
        }
    });
    return true;
}

void TcpServer::NewConnection(int sockfd, const InetAddress& peerAddr) {
    const std::string connName = name_ + "#" + std::to_string(nextConnId_++) + " " + peerAddr.toIpPort();
    LOG_DEBUG << "TcpServer [" << name_ << "] accepted " << connName;

    EventLoop* ioLoop = threadPool_->GetNextLoop();
    auto conn = std::make_shared<TcpConnection>(ioLoop, connName, sockfd, InetAddress::LocalOf(sockfd), peerAddr);
    connections_.insert(conn);
    monitor::Stats::Instance().IncActiveConnections();

    conn->SetTcpNoDelay(true);
    conn->SetConnectionCallback(connectionCallback_);
    conn->SetMessageCallback(messageCallback_);
    // Removal is deferred to the base loop so TcpConnection callbacks never re-enter the set.
    conn->SetCloseCallback([this](const TcpConnectionPtr& c) {
        loop_->QueueInLoop([this, c]() { RemoveConnection(c); });
    });
    ioLoop->RunInLoop([conn]() { conn->ConnectEstablished(); });
}

void TcpServer::RemoveConnection(const TcpConnectionPtr& conn) {
    LOG_DEBUG << "TcpServer [" << name_ << "] removing " << conn->name();
    if (connections_.erase(conn) > 0) monitor::Stats::Instance().DecActiveConnections();
    conn->getLoop()->QueueInLoop([conn]() { conn->ConnectDestroyed(); });
}

} // namespace network
} // namespace devproxy
