#pragma once

#include "devproxy/common/noncopyable.h"
#include "devproxy/network/Callbacks.h"
#include "devproxy/network/EventLoopThreadPool.h"
#include "devproxy/network/InetAddress.h"
#include "devproxy/network/TcpConnection.h"

#include <memory>
#include <string>
#include <unordered_set>

namespace devproxy {
namespace network {

class Acceptor;
class EventLoop;

// Accepts on the base loop and hands each connection to a worker loop.
// Client connections get TCP_NODELAY: proxied responses are small and
// latency bound.
class TcpServer : devproxy::common::noncopyable {
public:
    TcpServer(EventLoop* loop, const InetAddress& listenAddr, const std::string& name);
    ~TcpServer();

    const std::string& hostport() const { return hostport_; }
    const std::string& name() const { return name_; }

    // Must be called before Start().
    void SetThreadNum(int numThreads) { threadPool_->SetThreadNum(numThreads); }

    // Returns false when the listening socket could not be bound or listened on.
    bool Start();

    void SetConnectionCallback(ConnectionCallback cb) { connectionCallback_ = std::move(cb); }
    void SetMessageCallback(MessageCallback cb) { messageCallback_ = std::move(cb); }

private:
    void NewConnection(int sockfd, const InetAddress& peerAddr);
    void RemoveConnection(const TcpConnectionPtr& conn);

    EventLoop* loop_;
    const std::string hostport_;
    const std::string name_;
    std::unique_ptr<Acceptor> acceptor_;
    std::unique_ptr<EventLoopThreadPool> threadPool_;

    ConnectionCallback connectionCallback_;
    MessageCallback messageCallback_;

    bool started_;
    unsigned long nextConnId_;
    // Touched only on the base loop.
    std::unordered_set<TcpConnectionPtr> connections_;
};

} // namespace network
} // namespace devproxy
