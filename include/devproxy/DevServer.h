#pragma once

#include "devproxy/ClientContext.h"
#include "devproxy/common/noncopyable.h"
#include "devproxy/network/EventLoop.h"
#include "devproxy/network/TcpServer.h"
#include "devproxy/router/ProxyRouter.h"

#include <memory>
#include <string>

namespace devproxy {

// HTTP/1.1 front end of the dev server: parses requests, hands them to the
// proxy router and answers whatever no rule claims with a plain 404.
class DevServer : devproxy::common::noncopyable {
public:
    struct Options {
        // Bytes of pipelined requests buffered behind the current exchange
        // before reading from the client pauses.
        size_t maxPipelinedBytes{64 * 1024};
        router::ProxyRouter::Options router;
    };

    DevServer(network::EventLoop* loop,
              const network::InetAddress& listenAddr,
              router::ProxyRuleSetPtr rules,
              const std::string& name = "DevServer");
    DevServer(network::EventLoop* loop,
              const network::InetAddress& listenAddr,
              router::ProxyRuleSetPtr rules,
              Options opts,
              const std::string& name = "DevServer");
    ~DevServer();

    // Must be called before Start().
    void SetThreadNum(int numThreads);
    // Returns false when the listening socket is unusable.
    bool Start();

    router::ProxyRouter& router() { return router_; }
    const std::string& hostport() const { return server_.hostport(); }

private:
    void OnConnection(const network::TcpConnectionPtr& conn);
    void OnMessage(const network::TcpConnectionPtr& conn,
                   network::Buffer* buf,
                   std::chrono::system_clock::time_point receiveTime);
    void ProcessRequests(const network::TcpConnectionPtr& conn, const ClientContextPtr& ctx, network::Buffer* buf);
    void OnExchangeDone(const std::weak_ptr<network::TcpConnection>& weakConn, bool keepClient);
    void SendFallback(const network::TcpConnectionPtr& conn, const protocol::HttpRequest& req, bool close);
    void RejectRequest(const network::TcpConnectionPtr& conn, const ClientContextPtr& ctx, network::Buffer* buf);

    static ClientContextPtr GetContext(const network::TcpConnectionPtr& conn);

    Options opts_;
    router::ProxyRouter router_;
    network::TcpServer server_;
};

} // namespace devproxy
