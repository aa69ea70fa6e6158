#include "devproxy/router/ProxyRule.h"

namespace devproxy {
namespace router {

std::string ProxyRule::ForwardedPath(const std::string& path) const {
    std::string rewritten = rewrite.Apply(path);
    if (rewritten.empty() || rewritten[0] != '/') {
        rewritten.insert(rewritten.begin(), '/');
    }
    return targetUrl.basePath + rewritten;
}

} // namespace router
} // namespace devproxy
