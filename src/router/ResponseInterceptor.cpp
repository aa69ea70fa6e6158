#include "devproxy/router/ResponseInterceptor.h"

namespace devproxy {
namespace router {

void HeaderRewriteInterceptor::OnResponse(int, protocol::HttpHeaders* headers) const {
    if (!headers) return;
    for (const auto& name : removes_) {
        headers->remove(name);
    }
    for (const auto& kv : sets_) {
        headers->set(kv.first, kv.second);
    }
}

} // namespace router
} // namespace devproxy
