#include "devproxy/router/ForwardSession.h"
#include "devproxy/network/EventLoop.h"
#include "devproxy/protocol/HttpResponse.h"
#include "devproxy/monitor/Stats.h"
#include "devproxy/common/Logger.h"

#include <cerrno>
#include <cstring>
#include <exception>
#include <utility>

namespace devproxy {
namespace router {

namespace {

// Port part of a Host header value, or 80.
std::string HostPort(const std::string& host) {
    const size_t colon = host.rfind(':');
    const size_t bracket = host.rfind(']');
    if (colon != std::string::npos && (bracket == std::string::npos || colon > bracket) &&
        colon + 1 < host.size()) {
        return host.substr(colon + 1);
    }
    return "80";
}

void AppendForwarded(protocol::HttpHeaders* headers, const std::string& name, const std::string& value) {
    const std::string existing = headers->get(name);
    headers->set(name, existing.empty() ? value : existing + "," + value);
}

} // namespace

ForwardSession::ForwardSession(const devproxy::network::TcpConnectionPtr& client,
                               ProxyRuleSetPtr rules,
                               const ProxyRule* rule,
                               const protocol::HttpRequest& request,
                               protocol::BodyFramer::Mode bodyMode,
                               size_t contentLength,
                               UpstreamConnectionPool* pool)
    : ForwardSession(client, std::move(rules), rule, request, bodyMode, contentLength, pool, Options()) {}

ForwardSession::ForwardSession(const devproxy::network::TcpConnectionPtr& client,
                               ProxyRuleSetPtr rules,
                               const ProxyRule* rule,
                               const protocol::HttpRequest& request,
                               protocol::BodyFramer::Mode bodyMode,
                               size_t contentLength,
                               UpstreamConnectionPool* pool,
                               Options opts)
    : loop_(client->getLoop()),
      client_(client),
      rules_(std::move(rules)),
      rule_(rule),
      request_(request),
      pool_(pool),
      opts_(opts),
      startTime_(std::chrono::steady_clock::now()) {
    requestFramer_.reset(bodyMode, contentLength);
}

ForwardSession::~ForwardSession() {
    if (lease_) {
        lease_->Release(false);
    }
    LOG_DEBUG << "ForwardSession destroyed " << request_.method() << " " << forwardedTarget_
              << " state=" << StateName(state_);
}

const char* ForwardSession::StateName(State s) {
    switch (s) {
        case kReceived: return "Received";
        case kMatched: return "Matched";
        case kForwarding: return "Forwarding";
        case kResponseHeaderReceived: return "ResponseHeaderReceived";
        case kHeaderMutated: return "HeaderMutated";
        case kStreaming: return "Streaming";
        case kCompleted: return "Completed";
        case kFailed: return "Failed";
    }
    return "Unknown";
}

const char* ForwardSession::ErrorName(ProxyError e) {
    switch (e) {
        case kNone: return "none";
        case kUpstreamUnavailable: return "upstream unavailable";
        case kUpstreamStreamError: return "upstream stream error";
        case kClientAborted: return "client aborted";
    }
    return "unknown";
}

std::string ForwardSession::BuildRequestHead(const ProxyRule& rule,
                                             const protocol::HttpRequest& request,
                                             const std::string& forwardedTarget,
                                             const devproxy::network::InetAddress& clientPeer) {
    std::string out;
    out.reserve(256);
    out += request.method();
    out += ' ';
    out += forwardedTarget;
    out += " HTTP/1.1\r\n";

    protocol::HttpHeaders headers = request.headers();
    const std::string originalHost = headers.get("Host");
    if (rule.changeOrigin || !headers.has("Host")) {
        headers.set("Host", rule.targetUrl.hostHeader());
    }
    for (const auto& kv : rule.requestHeaders) {
        headers.set(kv.first, kv.second);
    }
    if (rule.xfwd) {
        AppendForwarded(&headers, "X-Forwarded-For", clientPeer.toIp());
        AppendForwarded(&headers, "X-Forwarded-Port", HostPort(originalHost));
        AppendForwarded(&headers, "X-Forwarded-Proto", "http");
        if (!originalHost.empty()) {
            AppendForwarded(&headers, "X-Forwarded-Host", originalHost);
        }
    }
    headers.appendTo(&out);
    out += "\r\n";
    return out;
}

void ForwardSession::Start() {
    auto self = shared_from_this();
    state_ = kMatched;
    forwardedTarget_ = rule_->ForwardedPath(request_.path()) + request_.query();
    devproxy::monitor::Stats::Instance().IncForwardedRequests();
    LOG_DEBUG << request_.method() << " " << request_.target() << " matched " << rule_->matchPrefix
              << " -> " << rule_->targetUrl.origin() << forwardedTarget_;

    auto client = client_.lock();
    if (!client || !client->connected()) {
        Finish(kClientAborted);
        return;
    }
    // Body bytes wait in the client buffer until there is somewhere to put them.
    if (!requestFramer_.done()) {
        client->StopRead();
    }

    state_ = kForwarding;
    std::weak_ptr<ForwardSession> weakSelf(self);
    pendingAcquire_ = pool_->Acquire(loop_, *rule_, [weakSelf](UpstreamConnectionPool::LeasePtr lease, int err) {
        auto s = weakSelf.lock();
        if (!s) {
            if (lease) lease->Release(false);
            return;
        }
        s->OnUpstreamReady(std::move(lease), err);
    });
}

void ForwardSession::OnUpstreamReady(UpstreamConnectionPool::LeasePtr lease, int err) {
    auto self = shared_from_this();
    pendingAcquire_.reset();
    if (state_ != kForwarding) {
        if (lease) lease->Release(false);
        return;
    }
    if (!lease || !lease->connection()) {
        LOG_WARN << request_.method() << " " << request_.target() << ": cannot connect to "
                 << rule_->targetUrl.origin() << ": " << std::strerror(err != 0 ? err : ECONNRESET);
        if (lease) lease->Release(false);
        Finish(kUpstreamUnavailable);
        return;
    }
    auto client = client_.lock();
    if (!client || !client->connected()) {
        lease->Release(false);
        Finish(kClientAborted);
        return;
    }

    lease_ = std::move(lease);
    upstream_ = lease_->connection();

    std::weak_ptr<ForwardSession> weakSelf(self);
    upstream_->SetMessageCallback([weakSelf](const devproxy::network::TcpConnectionPtr&,
                                             devproxy::network::Buffer* buf,
                                             std::chrono::system_clock::time_point) {
        if (auto s = weakSelf.lock()) {
            s->OnUpstreamMessage(buf);
        } else {
            buf->RetrieveAll();
        }
    });
    upstream_->SetConnectionCallback([weakSelf](const devproxy::network::TcpConnectionPtr& c) {
        if (c->connected()) return;
        if (auto s = weakSelf.lock()) s->OnUpstreamClosed();
    });

    // Whichever side falls behind pauses the side feeding it.
    std::weak_ptr<devproxy::network::TcpConnection> wClient = client;
    std::weak_ptr<devproxy::network::TcpConnection> wUpstream = upstream_;
    upstream_->SetHighWaterMarkCallback(
        [wClient](const devproxy::network::TcpConnectionPtr&, size_t) {
            if (auto c = wClient.lock()) c->StopRead();
        },
        opts_.highWaterMark);
    upstream_->SetWriteCompleteCallback(
        [wClient](const devproxy::network::TcpConnectionPtr&) {
            if (auto c = wClient.lock()) c->StartRead();
        });
    client->SetHighWaterMarkCallback(
        [wUpstream](const devproxy::network::TcpConnectionPtr&, size_t) {
            if (auto u = wUpstream.lock()) u->StopRead();
        },
        opts_.highWaterMark);
    client->SetWriteCompleteCallback(
        [wUpstream](const devproxy::network::TcpConnectionPtr&) {
            if (auto u = wUpstream.lock()) u->StartRead();
        });

    upstream_->Send(BuildRequestHead(*rule_, request_, forwardedTarget_, client->peerAddress()));
    // Delivers any body bytes that arrived while connecting.
    client->StartRead();
}

void ForwardSession::OnClientData(devproxy::network::Buffer* buf) {
    auto self = shared_from_this();
    if (finished() || !upstream_ || requestFramer_.done()) return;

    const size_t n = requestFramer_.consume(buf->Peek(), buf->ReadableBytes());
    if (n > 0) {
        upstream_->Send(buf->Peek(), n);
        buf->Retrieve(n);
    }
    if (requestFramer_.hasError()) {
        LOG_WARN << request_.method() << " " << request_.target() << ": malformed chunked request body";
        auto client = client_.lock();
        if (client && !responseStarted_) {
            protocol::HttpResponse resp = protocol::HttpResponse::makeText(
                protocol::HttpResponse::k400BadRequest, "Malformed request body\n", true);
            client->Send(resp.toString());
            responseStarted_ = true;
        }
        Finish(kClientAborted);
    }
}

void ForwardSession::Cancel() {
    auto self = shared_from_this();
    if (finished()) return;
    LOG_DEBUG << request_.method() << " " << request_.target() << ": client went away in state "
              << StateName(state_);
    Finish(kClientAborted);
}

void ForwardSession::OnUpstreamMessage(devproxy::network::Buffer* buf) {
    auto self = shared_from_this();
    while (!finished() && buf->ReadableBytes() > 0) {
        if (state_ == kForwarding) {
            if (!response_.parseResponse(buf)) {
                LOG_WARN << "Malformed response from " << rule_->targetUrl.origin() << " for "
                         << request_.method() << " " << forwardedTarget_;
                Finish(kUpstreamStreamError);
                break;
            }
            if (!response_.gotHead()) break;
            if (response_.isInterim()) {
                // HTTP/1.0 clients do not understand 1xx responses.
                if (request_.getVersion() != protocol::HttpRequest::kHttp10) {
                    std::string head;
                    response_.appendHeadTo(&head);
                    SendToClient(head.data(), head.size());
                }
                response_.reset();
                continue;
            }
            if (!OnResponseHead(buf)) break;
        } else if (state_ == kStreaming) {
            RelayBody(buf);
        } else {
            break;
        }
    }
    if (finished()) {
        buf->RetrieveAll();
    }
}

bool ForwardSession::OnResponseHead(devproxy::network::Buffer* buf) {
    state_ = kResponseHeaderReceived;
    finalStatus_ = response_.statusCode();
    upstreamMode_ = response_.bodyMode(request_.isHead());
    upstreamKeepAlive_ = response_.keepAlive() && upstreamMode_ != protocol::BodyFramer::kUntilClose;

    protocol::HttpHeaders& headers = response_.headers();
    const bool hadLength = headers.has("Content-Length");
    if (rule_->onResponse) {
        try {
            rule_->onResponse->OnResponse(finalStatus_, &headers);
        } catch (const std::exception& e) {
            LOG_ERROR << "Response interceptor for " << rule_->matchPrefix << " threw: " << e.what();
            Finish(kUpstreamStreamError);
            return false;
        }
        state_ = kHeaderMutated;
    }

    const bool bodyless = request_.isHead() || finalStatus_ < 200 || finalStatus_ == 204 || finalStatus_ == 304;
    reframe_ = false;
    dechunk_ = false;
    if (!bodyless) {
        const bool wantChunked = headers.containsToken("Content-Encoding", "chunked") ||
                                 headers.containsToken("Transfer-Encoding", "chunked") ||
                                 upstreamMode_ == protocol::BodyFramer::kChunked ||
                                 (hadLength && !headers.has("Content-Length"));
        if (wantChunked) {
            headers.remove("Content-Length");
            if (request_.getVersion() == protocol::HttpRequest::kHttp10) {
                // No chunked coding towards HTTP/1.0; the body ends at close.
                headers.remove("Transfer-Encoding");
                dechunk_ = upstreamMode_ == protocol::BodyFramer::kChunked;
                closeClientAfter_ = true;
            } else {
                if (!headers.containsToken("Transfer-Encoding", "chunked")) {
                    headers.set("Transfer-Encoding", "chunked");
                }
                reframe_ = upstreamMode_ != protocol::BodyFramer::kChunked;
                if (reframe_) response_.setHttpVersion(1, 1);
            }
        }
    }
    // Covers 101 too: after an upgrade the client bytes are no longer HTTP.
    if (upstreamMode_ == protocol::BodyFramer::kUntilClose && !reframe_) {
        closeClientAfter_ = true;
    }
    if (headers.containsToken("Connection", "close")) {
        closeClientAfter_ = true;
    }

    std::string head;
    response_.appendHeadTo(&head);
    state_ = kStreaming;
    SendToClient(head.data(), head.size());

    if (upstreamMode_ == protocol::BodyFramer::kNoBody) {
        if (buf->ReadableBytes() > 0) upstreamKeepAlive_ = false;
        if (reframe_) {
            std::string last;
            encoder_.finish(&last);
            SendToClient(last.data(), last.size());
        }
        Finish(kNone);
        return false;
    }
    responseFramer_.reset(upstreamMode_, response_.contentLength());
    return true;
}

void ForwardSession::RelayBody(devproxy::network::Buffer* buf) {
    const char* data = buf->Peek();
    std::string payload;
    const size_t n = responseFramer_.consume(data, buf->ReadableBytes(), dechunk_ ? &payload : nullptr);
    if (responseFramer_.hasError()) {
        LOG_WARN << "Malformed chunked body from " << rule_->targetUrl.origin() << " for "
                 << request_.method() << " " << forwardedTarget_;
        Finish(kUpstreamStreamError);
        return;
    }
    if (n > 0) {
        if (reframe_) {
            std::string out;
            encoder_.encode(data, n, &out);
            SendToClient(out.data(), out.size());
        } else if (dechunk_) {
            if (!payload.empty()) SendToClient(payload.data(), payload.size());
        } else {
            SendToClient(data, n);
        }
        buf->Retrieve(n);
    }
    if (responseFramer_.done()) {
        if (reframe_) {
            std::string last;
            encoder_.finish(&last);
            SendToClient(last.data(), last.size());
        }
        // Trailing bytes after a complete response: the connection is out of sync.
        if (buf->ReadableBytes() > 0) upstreamKeepAlive_ = false;
        Finish(kNone);
    }
}

void ForwardSession::OnUpstreamClosed() {
    auto self = shared_from_this();
    if (finished()) return;
    // The connection is gone; the pool must not touch it again.
    upstreamKeepAlive_ = false;

    if (state_ == kStreaming) {
        responseFramer_.onEof();
        if (responseFramer_.done()) {
            if (reframe_) {
                std::string last;
                encoder_.finish(&last);
                SendToClient(last.data(), last.size());
            }
            Finish(kNone);
            return;
        }
        LOG_WARN << "Upstream " << rule_->targetUrl.origin() << " closed mid-body for " << request_.method()
                 << " " << forwardedTarget_ << " after " << responseFramer_.payloadBytes() << " bytes";
        Finish(kUpstreamStreamError);
        return;
    }

    // No final response head yet.
    const bool handshakeFailed = rule_->tls && lease_ && !lease_->reused() && upstream_ &&
                                 !upstream_->tlsEstablished();
    LOG_WARN << "Upstream " << rule_->targetUrl.origin() << " closed before responding to "
             << request_.method() << " " << forwardedTarget_;
    Finish(handshakeFailed ? kUpstreamUnavailable : kUpstreamStreamError);
}

void ForwardSession::SendToClient(const char* data, size_t len) {
    auto client = client_.lock();
    if (!client) return;
    client->Send(data, len);
    responseStarted_ = true;
}

void ForwardSession::Finish(ProxyError err) {
    auto self = shared_from_this();
    if (finished()) return;
    state_ = (err == kNone) ? kCompleted : kFailed;
    error_ = err;

    auto& stats = devproxy::monitor::Stats::Instance();
    switch (err) {
        case kUpstreamUnavailable: stats.IncUpstreamUnavailable(); break;
        case kUpstreamStreamError: stats.IncUpstreamStreamErrors(); break;
        case kClientAborted: stats.IncClientAborts(); break;
        case kNone: break;
    }

    if (pendingAcquire_) {
        pendingAcquire_->Cancel();
        pendingAcquire_.reset();
    }
    if (lease_) {
        lease_->Release(err == kNone && upstreamKeepAlive_ && requestFramer_.done());
        lease_.reset();
    }
    upstream_.reset();

    bool keepClient = false;
    auto client = client_.lock();
    if (client) {
        client->SetHighWaterMarkCallback(nullptr, opts_.highWaterMark);
        client->SetWriteCompleteCallback(nullptr);
        // Reading may have been paused for the body or by back-pressure.
        client->StartRead();
        if (err == kNone) {
            keepClient = request_.keepAlive() && requestFramer_.done() && !closeClientAfter_;
            if (!keepClient) client->Shutdown();
        } else if (err == kClientAborted) {
            client->Shutdown();
        } else if (!responseStarted_) {
            protocol::HttpResponse resp = protocol::HttpResponse::makeText(
                protocol::HttpResponse::k502BadGateway,
                err == kUpstreamUnavailable ? "Upstream unavailable\n" : "Upstream error\n",
                true);
            resp.setHeadOnly(request_.isHead());
            client->Send(resp.toString());
            finalStatus_ = 502;
            client->Shutdown();
        } else {
            // Part of the response is out; truncation is the only signal left.
            client->ForceClose();
        }
    }

    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startTime_).count();
    if (err == kNone) {
        LOG_INFO << request_.method() << " " << request_.target() << " -> " << rule_->targetUrl.origin()
                 << forwardedTarget_ << " " << finalStatus_ << " " << ms << "ms";
    } else {
        LOG_WARN << request_.method() << " " << request_.target() << " -> " << rule_->targetUrl.origin()
                 << forwardedTarget_ << " failed: " << ErrorName(err) << " " << ms << "ms";
    }

    CompletionCallback cb;
    cb.swap(completionCallback_);
    if (cb) cb(err, keepClient);
}

} // namespace router
} // namespace devproxy
