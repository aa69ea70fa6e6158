#pragma once

#include "devproxy/common/noncopyable.h"
#include "devproxy/network/TcpConnection.h"
#include "devproxy/protocol/BodyFramer.h"
#include "devproxy/protocol/ChunkedEncoder.h"
#include "devproxy/protocol/HttpRequest.h"
#include "devproxy/protocol/HttpResponseContext.h"
#include "devproxy/router/ProxyRuleSet.h"
#include "devproxy/router/UpstreamConnectionPool.h"

#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace devproxy {
namespace router {

// One forwarded exchange: client request -> upstream -> client response.
// Lives on the client connection's loop; the upstream connection is created
// on the same loop. Owned by the client connection's context.
//
//   kReceived -> kMatched -> kForwarding -> kResponseHeaderReceived
//             -> kHeaderMutated -> kStreaming -> kCompleted | kFailed
class ForwardSession : public std::enable_shared_from_this<ForwardSession>,
                       devproxy::common::noncopyable {
public:
    enum State {
        kReceived,
        kMatched,
        kForwarding,
        kResponseHeaderReceived,
        kHeaderMutated,
        kStreaming,
        kCompleted,
        kFailed,
    };

    enum ProxyError {
        kNone,
        kUpstreamUnavailable,
        kUpstreamStreamError,
        kClientAborted,
    };

    struct Options {
        size_t highWaterMark{1024 * 1024};
    };

    // keepClient: the client connection may carry its next request.
    using CompletionCallback = std::function<void(ProxyError error, bool keepClient)>;

    ForwardSession(const devproxy::network::TcpConnectionPtr& client,
                   ProxyRuleSetPtr rules,
                   const ProxyRule* rule,
                   const protocol::HttpRequest& request,
                   protocol::BodyFramer::Mode bodyMode,
                   size_t contentLength,
                   UpstreamConnectionPool* pool);
    ForwardSession(const devproxy::network::TcpConnectionPtr& client,
                   ProxyRuleSetPtr rules,
                   const ProxyRule* rule,
                   const protocol::HttpRequest& request,
                   protocol::BodyFramer::Mode bodyMode,
                   size_t contentLength,
                   UpstreamConnectionPool* pool,
                   Options opts);
    ~ForwardSession();

    void SetCompletionCallback(const CompletionCallback& cb) { completionCallback_ = cb; }

    void Start();
    // Takes this request's body bytes off the client input buffer; pipelined
    // bytes after the body are left in place.
    void OnClientData(devproxy::network::Buffer* buf);
    // The client connection went away; the upstream connection is closed, not pooled.
    void Cancel();

    State state() const { return state_; }
    ProxyError error() const { return error_; }
    bool finished() const { return state_ == kCompleted || state_ == kFailed; }
    bool requestBodyDone() const { return requestFramer_.done(); }
    bool responseStarted() const { return responseStarted_; }
    const std::string& forwardedTarget() const { return forwardedTarget_; }
    const ProxyRule* rule() const { return rule_; }

    static const char* StateName(State s);
    static const char* ErrorName(ProxyError e);

    // Request line and header block for the upstream.
    static std::string BuildRequestHead(const ProxyRule& rule,
                                        const protocol::HttpRequest& request,
                                        const std::string& forwardedTarget,
                                        const devproxy::network::InetAddress& clientPeer);

private:
    void OnUpstreamReady(UpstreamConnectionPool::LeasePtr lease, int err);
    void OnUpstreamMessage(devproxy::network::Buffer* buf);
    void OnUpstreamClosed();
    bool OnResponseHead(devproxy::network::Buffer* buf);
    void RelayBody(devproxy::network::Buffer* buf);
    void SendToClient(const char* data, size_t len);
    void Finish(ProxyError err);

    devproxy::network::EventLoop* loop_;
    std::weak_ptr<devproxy::network::TcpConnection> client_;
    ProxyRuleSetPtr rules_;
    const ProxyRule* rule_;
    protocol::HttpRequest request_;
    std::string forwardedTarget_;
    UpstreamConnectionPool* pool_;
    Options opts_;

    State state_{kReceived};
    ProxyError error_{kNone};

    UpstreamConnectionPool::PendingAcquirePtr pendingAcquire_;
    UpstreamConnectionPool::LeasePtr lease_;
    devproxy::network::TcpConnectionPtr upstream_;

    protocol::BodyFramer requestFramer_;
    protocol::HttpResponseContext response_;
    protocol::BodyFramer responseFramer_;
    protocol::ChunkedEncoder encoder_;
    protocol::BodyFramer::Mode upstreamMode_{protocol::BodyFramer::kNoBody};
    bool reframe_{false};
    // Upstream chunk framing stripped for an HTTP/1.0 client.
    bool dechunk_{false};
    bool upstreamKeepAlive_{false};
    bool closeClientAfter_{false};
    bool responseStarted_{false};
    int finalStatus_{0};

    std::chrono::steady_clock::time_point startTime_;
    CompletionCallback completionCallback_;
};

using ForwardSessionPtr = std::shared_ptr<ForwardSession>;

} // namespace router
} // namespace devproxy
