#pragma once

#include "devproxy/common/noncopyable.h"
#include "devproxy/network/TcpConnection.h"
#include "devproxy/protocol/HttpContext.h"
#include "devproxy/router/ForwardSession.h"
#include "devproxy/router/ProxyRuleSet.h"
#include "devproxy/router/UpstreamConnectionPool.h"

#include <memory>

namespace devproxy {
namespace router {

// Entry point for every parsed request head: forwards it when a rule matches,
// otherwise hands it back untouched.
class ProxyRouter : devproxy::common::noncopyable {
public:
    enum HandleResult {
        kUnhandled, // no rule matched; no I/O was done
        kForwarded, // *session now owns the exchange
    };

    struct Options {
        ForwardSession::Options session;
        UpstreamConnectionPool::Config pool;
    };

    explicit ProxyRouter(ProxyRuleSetPtr rules);
    ProxyRouter(ProxyRuleSetPtr rules, Options opts);
    ~ProxyRouter();

    // Must run on client's loop. On kForwarded the body (if any) is still in
    // the client's input buffer and must be fed through session->OnClientData.
    HandleResult Handle(const devproxy::network::TcpConnectionPtr& client,
                        const protocol::HttpContext& head,
                        const ForwardSession::CompletionCallback& done,
                        ForwardSessionPtr* session);

    const ProxyRuleSet& rules() const { return *rules_; }
    UpstreamConnectionPool& pool() { return pool_; }

private:
    ProxyRuleSetPtr rules_;
    Options opts_;
    UpstreamConnectionPool pool_;
};

} // namespace router
} // namespace devproxy
