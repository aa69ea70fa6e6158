#pragma once

#include "devproxy/router/ProxyRule.h"

#include <memory>
#include <string>
#include <vector>

namespace devproxy {
namespace common {
class Config;
}

namespace router {

class ProxyRuleSet;
using ProxyRuleSetPtr = std::shared_ptr<const ProxyRuleSet>;

// Validated, immutable list of proxy rules. Lookups need no locking.
class ProxyRuleSet {
public:
    // Throws common::ConfigError for a missing or duplicate prefix, a prefix
    // not starting with '/', an unparsable or unresolvable target, a rewrite
    // that produces an invalid path, or a TLS context that cannot be set up.
    static ProxyRuleSetPtr Build(std::vector<ProxyRule> rules);

    // Reads [proxy:N] sections in numeric order of N, then calls Build.
    static ProxyRuleSetPtr FromConfig(const common::Config& conf);

    // First rule whose prefix starts path, or nullptr.
    const ProxyRule* Match(const std::string& path) const;

    const std::vector<ProxyRule>& rules() const { return rules_; }
    size_t size() const { return rules_.size(); }
    bool empty() const { return rules_.empty(); }

private:
    ProxyRuleSet() = default;

    std::vector<ProxyRule> rules_;
};

} // namespace router
} // namespace devproxy
