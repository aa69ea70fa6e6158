#include "devproxy/DevServer.h"
#include "devproxy/protocol/HttpResponse.h"
#include "devproxy/monitor/Stats.h"
#include "devproxy/common/Logger.h"

#include <functional>
#include <utility>

namespace devproxy {

DevServer::DevServer(network::EventLoop* loop,
                     const network::InetAddress& listenAddr,
                     router::ProxyRuleSetPtr rules,
                     const std::string& name)
    : DevServer(loop, listenAddr, std::move(rules), Options(), name) {
}

DevServer::DevServer(network::EventLoop* loop,
                     const network::InetAddress& listenAddr,
                     router::ProxyRuleSetPtr rules,
                     Options opts,
                     const std::string& name)
    : opts_(opts),
      router_(std::move(rules), opts.router),
      server_(loop, listenAddr, name) {
    server_.SetConnectionCallback(
        std::bind(&DevServer::OnConnection, this, std::placeholders::_1));
    server_.SetMessageCallback(
        std::bind(&DevServer::OnMessage, this, std::placeholders::_1, std::placeholders::_2, std::placeholders::_3));
}

DevServer::~DevServer() {
    router_.pool().Clear();
}

void DevServer::SetThreadNum(int numThreads) {
    server_.SetThreadNum(numThreads);
}

bool DevServer::Start() {
    if (!server_.Start()) {
        LOG_ERROR << "DevServer cannot listen on " << server_.hostport();
        return false;
    }
    LOG_INFO << "DevServer listening on " << server_.hostport() << " with "
             << router_.rules().size() << " proxy rule(s)";
    return true;
}

ClientContextPtr DevServer::GetContext(const network::TcpConnectionPtr& conn) {
    auto* ctx = std::any_cast<ClientContextPtr>(conn->GetMutableContext());
    return ctx ? *ctx : ClientContextPtr();
}

void DevServer::OnConnection(const network::TcpConnectionPtr& conn) {
    if (conn->connected()) {
        LOG_DEBUG << "New connection from " << conn->peerAddress().toIpPort();
        conn->SetContext(std::make_shared<ClientContext>());
        return;
    }

    LOG_DEBUG << "Connection closed: " << conn->name();
    auto ctx = GetContext(conn);
    if (ctx) {
        ctx->closing = true;
        router::ForwardSessionPtr session = std::move(ctx->session);
        ctx->session.reset();
        if (session) session->Cancel();
    }
}

void DevServer::OnMessage(const network::TcpConnectionPtr& conn,
                          network::Buffer* buf,
                          std::chrono::system_clock::time_point) {
    auto ctx = GetContext(conn);
    if (!ctx || ctx->closing || !conn->connected()) {
        buf->RetrieveAll();
        return;
    }

    if (ctx->session) {
        ctx->session->OnClientData(buf);
        if (ctx->session && ctx->session->requestBodyDone() &&
            buf->ReadableBytes() > opts_.maxPipelinedBytes) {
            conn->StopRead();
        }
        return;
    }
    ProcessRequests(conn, ctx, buf);
}

void DevServer::ProcessRequests(const network::TcpConnectionPtr& conn,
                                const ClientContextPtr& ctx,
                                network::Buffer* buf) {
    while (!ctx->session && !ctx->closing && conn->connected() && buf->ReadableBytes() > 0) {
        if (!ctx->http.parseRequest(buf)) {
            RejectRequest(conn, ctx, buf);
            return;
        }
        if (!ctx->http.gotHead()) return;

        monitor::Stats::Instance().IncTotalRequests();
        std::weak_ptr<network::TcpConnection> weakConn(conn);
        router::ForwardSessionPtr session;
        const auto result = router_.Handle(
            conn, ctx->http,
            [this, weakConn](router::ForwardSession::ProxyError, bool keepClient) {
                OnExchangeDone(weakConn, keepClient);
            },
            &session);

        if (result == router::ProxyRouter::kForwarded) {
            ctx->http.reset();
            if (session && !session->finished()) {
                ctx->session = session;
            }
            return;
        }

        const protocol::HttpRequest& req = ctx->http.request();
        // A body nobody reads would be parsed as the next request.
        const bool close = !req.keepAlive() || ctx->http.bodyMode() != protocol::BodyFramer::kNoBody;
        SendFallback(conn, req, close);
        ctx->http.reset();
        if (close) {
            ctx->closing = true;
            buf->RetrieveAll();
            conn->Shutdown();
            return;
        }
    }
}

void DevServer::OnExchangeDone(const std::weak_ptr<network::TcpConnection>& weakConn, bool keepClient) {
    auto conn = weakConn.lock();
    if (!conn) return;
    auto ctx = GetContext(conn);
    if (!ctx) return;
    ctx->session.reset();
    if (!keepClient || !conn->connected()) {
        ctx->closing = true;
        return;
    }
    // Pipelined requests may already be waiting in the input buffer.
    conn->getLoop()->QueueInLoop([this, weakConn]() {
        auto c = weakConn.lock();
        if (!c || !c->connected()) return;
        auto cctx = GetContext(c);
        if (!cctx || cctx->session || cctx->closing) return;
        if (c->inputBuffer()->ReadableBytes() > 0) {
            ProcessRequests(c, cctx, c->inputBuffer());
        }
    });
}

void DevServer::SendFallback(const network::TcpConnectionPtr& conn, const protocol::HttpRequest& req, bool close) {
    LOG_INFO << req.method() << " " << req.target() << " 404 (no proxy rule)";
    protocol::HttpResponse resp = protocol::HttpResponse::makeText(
        protocol::HttpResponse::k404NotFound, "Cannot " + req.method() + " " + req.path() + "\n", close);
    resp.setHeadOnly(req.isHead());
    conn->Send(resp.toString());
}

void DevServer::RejectRequest(const network::TcpConnectionPtr& conn,
                              const ClientContextPtr& ctx,
                              network::Buffer* buf) {
    const bool tooLarge = ctx->http.headTooLarge();
    LOG_WARN << "Malformed request from " << conn->peerAddress().toIpPort()
             << (tooLarge ? ": head too large" : "");
    protocol::HttpResponse resp = protocol::HttpResponse::makeText(
        tooLarge ? protocol::HttpResponse::k431RequestHeaderFieldsTooLarge : protocol::HttpResponse::k400BadRequest,
        tooLarge ? "Request header fields too large\n" : "Bad request\n",
        true);
    conn->Send(resp.toString());
    ctx->closing = true;
    buf->RetrieveAll();
    conn->Shutdown();
}

} // namespace devproxy
