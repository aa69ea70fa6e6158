#pragma once

#include "devproxy/protocol/HttpHeaders.h"

#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace devproxy {
namespace router {

// Hook run once per forwarded request on the final upstream response head,
// before any byte of it reaches the client. Only headers are visible.
// Shared by every event loop, so implementations must not mutate themselves.
class ResponseInterceptor {
public:
    virtual ~ResponseInterceptor() = default;

    virtual void OnResponse(int statusCode, protocol::HttpHeaders* headers) const = 0;
};

// Fixed header edits: removals first, then sets (replace or append).
class HeaderRewriteInterceptor : public ResponseInterceptor {
public:
    void SetHeader(const std::string& name, const std::string& value) { sets_.emplace_back(name, value); }
    void RemoveHeader(const std::string& name) { removes_.push_back(name); }
    bool empty() const { return sets_.empty() && removes_.empty(); }

    void OnResponse(int statusCode, protocol::HttpHeaders* headers) const override;

private:
    std::vector<std::pair<std::string, std::string>> sets_;
    std::vector<std::string> removes_;
};

class FunctionInterceptor : public ResponseInterceptor {
public:
    using Function = std::function<void(int statusCode, protocol::HttpHeaders* headers)>;

    explicit FunctionInterceptor(Function fn) : fn_(std::move(fn)) {}

    void OnResponse(int statusCode, protocol::HttpHeaders* headers) const override {
        if (fn_) fn_(statusCode, headers);
    }

private:
    Function fn_;
};

using ResponseInterceptorPtr = std::shared_ptr<const ResponseInterceptor>;

} // namespace router
} // namespace devproxy
