#pragma once

#include "devproxy/network/InetAddress.h"
#include "devproxy/protocol/Url.h"
#include "devproxy/router/PathRewrite.h"
#include "devproxy/router/ResponseInterceptor.h"

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace devproxy {
namespace network {
class TlsContext;
}

namespace router {

// One forwarding rule: requests whose path starts with matchPrefix go to target.
struct ProxyRule {
    std::string matchPrefix;
    std::string target;

    bool changeOrigin{false};
    bool xfwd{false};
    bool secure{true};
    int connectTimeoutMs{5000};

    // Set on the forwarded request, replacing same-named client headers.
    std::vector<std::pair<std::string, std::string>> requestHeaders;
    PathRewrite rewrite;
    ResponseInterceptorPtr onResponse;

    // Filled in by ProxyRuleSet::Build.
    protocol::Url targetUrl;
    network::InetAddress targetAddr;
    std::shared_ptr<network::TlsContext> tls;

    // basePath of the target followed by the rewritten path.
    std::string ForwardedPath(const std::string& path) const;

    bool Matches(const std::string& path) const { return path.rfind(matchPrefix, 0) == 0; }
};

} // namespace router
} // namespace devproxy
