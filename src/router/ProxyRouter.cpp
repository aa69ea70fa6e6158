#include "devproxy/router/ProxyRouter.h"
#include "devproxy/monitor/Stats.h"
#include "devproxy/common/Logger.h"

#include <utility>

namespace devproxy {
namespace router {

ProxyRouter::ProxyRouter(ProxyRuleSetPtr rules) : ProxyRouter(std::move(rules), Options()) {}

ProxyRouter::ProxyRouter(ProxyRuleSetPtr rules, Options opts)
    : rules_(std::move(rules)), opts_(opts), pool_(opts.pool) {
}

ProxyRouter::~ProxyRouter() {
    pool_.Clear();
}

ProxyRouter::HandleResult ProxyRouter::Handle(const devproxy::network::TcpConnectionPtr& client,
                                              const protocol::HttpContext& head,
                                              const ForwardSession::CompletionCallback& done,
                                              ForwardSessionPtr* session) {
    const protocol::HttpRequest& req = head.request();
    const ProxyRule* rule = rules_->Match(req.path());
    if (!rule) {
        devproxy::monitor::Stats::Instance().IncUnmatchedRequests();
        LOG_DEBUG << req.method() << " " << req.target() << " matches no proxy rule";
        return kUnhandled;
    }

    auto s = std::make_shared<ForwardSession>(client, rules_, rule, req, head.bodyMode(), head.contentLength(),
                                              &pool_, opts_.session);
    s->SetCompletionCallback(done);
    if (session) *session = s;
    s->Start();
    return kForwarded;
}

} // namespace router
} // namespace devproxy
