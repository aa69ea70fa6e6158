#include "devproxy/router/ProxyRuleSet.h"
#include "devproxy/common/Config.h"
#include "devproxy/common/ConfigError.h"
#include "devproxy/common/Logger.h"
#include "devproxy/network/TlsContext.h"

#include <algorithm>
#include <cctype>
#include <set>
#include <sstream>

namespace devproxy {
namespace router {

namespace {

const char kSectionPrefix[] = "proxy:";
const char kRewritePrefix[] = "rewrite.";
const char kRequestHeaderPrefix[] = "set_request_header.";
const char kResponseHeaderPrefix[] = "set_response_header.";

bool IsHeaderName(const std::string& name) {
    if (name.empty()) return false;
    for (unsigned char c : name) {
        if (c <= 0x20 || c >= 0x7f) return false;
        if (c == ':' || c == '(' || c == ')' || c == ',' || c == ';' || c == '"' ||
            c == '/' || c == '[' || c == ']' || c == '?' || c == '=' || c == '{' ||
            c == '}' || c == '<' || c == '>' || c == '@' || c == '\\') {
            return false;
        }
    }
    return true;
}

bool IsHeaderValue(const std::string& value) {
    for (unsigned char c : value) {
        if (c == '\r' || c == '\n' || c == 0) return false;
    }
    return true;
}

std::string RuleName(size_t idx, const ProxyRule& rule) {
    std::ostringstream os;
    os << "proxy rule #" << (idx + 1);
    if (!rule.matchPrefix.empty()) os << " (" << rule.matchPrefix << ")";
    return os.str();
}

int ParseIndex(const std::string& text, const std::string& what) {
    size_t used = 0;
    int idx = 0;
    try {
        idx = std::stoi(text, &used);
    } catch (const std::exception&) {
        throw common::ConfigError(what + ": '" + text + "' is not a number");
    }
    if (used != text.size()) {
        throw common::ConfigError(what + ": '" + text + "' is not a number");
    }
    return idx;
}

bool ParseBool(const std::string& section, const std::string& key, const std::string& value) {
    std::string v = value;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw common::ConfigError("[" + section + "] " + key + " is not a boolean: " + value);
}

std::vector<std::string> SplitList(const std::string& s) {
    std::vector<std::string> out;
    std::string item;
    std::istringstream in(s);
    while (std::getline(in, item, ',')) {
        item = common::Config::Trim(item);
        if (!item.empty()) out.push_back(item);
    }
    return out;
}

// Paths every rewrite must map to something forwardable.
std::vector<std::string> SamplePaths(const std::string& prefix) {
    std::vector<std::string> out{prefix};
    out.push_back(prefix.back() == '/' ? prefix + "index" : prefix + "/index");
    return out;
}

void ValidateRule(size_t idx, ProxyRule* rule, std::set<std::string>* prefixes) {
    const std::string name = RuleName(idx, *rule);
    if (rule->matchPrefix.empty()) {
        throw common::ConfigError(name + ": match_prefix is required");
    }
    if (rule->matchPrefix[0] != '/') {
        throw common::ConfigError(name + ": match_prefix must start with '/'");
    }
    if (!prefixes->insert(rule->matchPrefix).second) {
        throw common::ConfigError(name + ": duplicate match_prefix");
    }

    std::string err;
    if (!protocol::Url::parse(rule->target, &rule->targetUrl, &err)) {
        throw common::ConfigError(name + ": invalid target '" + rule->target + "': " + err);
    }
    if (!network::InetAddress::Resolve(rule->targetUrl.host, rule->targetUrl.port, &rule->targetAddr)) {
        throw common::ConfigError(name + ": cannot resolve target host '" + rule->targetUrl.host + "'");
    }
    if (rule->connectTimeoutMs < 0) {
        throw common::ConfigError(name + ": connect_timeout_ms must not be negative");
    }

    for (const auto& kv : rule->requestHeaders) {
        if (!IsHeaderName(kv.first) || !IsHeaderValue(kv.second)) {
            throw common::ConfigError(name + ": invalid request header '" + kv.first + "'");
        }
    }

    for (const auto& sample : SamplePaths(rule->matchPrefix)) {
        try {
            rule->rewrite.Validate(sample);
        } catch (const common::ConfigError& e) {
            throw common::ConfigError(name + ": " + e.what());
        }
        const std::string forwarded = rule->ForwardedPath(sample);
        if (!PathRewrite::IsValidPath(forwarded)) {
            throw common::ConfigError(name + ": '" + sample + "' would be forwarded as invalid path '" +
                                      forwarded + "'");
        }
    }
}

} // namespace

ProxyRuleSetPtr ProxyRuleSet::Build(std::vector<ProxyRule> rules) {
    std::set<std::string> prefixes;
    std::shared_ptr<network::TlsContext> verifying;
    std::shared_ptr<network::TlsContext> insecure;

    for (size_t i = 0; i < rules.size(); ++i) {
        ProxyRule& rule = rules[i];
        ValidateRule(i, &rule, &prefixes);

        if (!rule.targetUrl.isHttps()) {
            rule.tls.reset();
            continue;
        }
        std::shared_ptr<network::TlsContext>& ctx = rule.secure ? verifying : insecure;
        if (!ctx) {
            ctx = std::make_shared<network::TlsContext>();
            if (!ctx->InitClient(rule.secure)) {
                throw common::ConfigError(RuleName(i, rule) + ": TLS client setup failed: " +
                                          network::TlsContext::LastError());
            }
        }
        rule.tls = ctx;
    }

    std::shared_ptr<ProxyRuleSet> set(new ProxyRuleSet());
    set->rules_ = std::move(rules);
    for (const auto& r : set->rules_) {
        LOG_INFO << "Proxy rule " << r.matchPrefix << " -> " << r.targetUrl.origin() << r.targetUrl.basePath
                 << " (" << r.targetAddr.toIpPort() << ")"
                 << (r.changeOrigin ? " changeOrigin" : "")
                 << (r.rewrite.empty() ? "" : " rewrite")
                 << (r.onResponse ? " onResponse" : "");
    }
    return set;
}

ProxyRuleSetPtr ProxyRuleSet::FromConfig(const common::Config& conf) {
    auto secs = conf.GetSectionsWithPrefix(kSectionPrefix);
    std::vector<std::pair<int, const common::Config::Section*>> ordered;
    for (const auto& sec : secs) {
        const std::string suffix = sec.first.substr(sizeof(kSectionPrefix) - 1);
        ordered.push_back({ParseIndex(suffix, "section [" + sec.first + "]"), &sec.second});
    }
    std::sort(ordered.begin(), ordered.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });

    std::vector<ProxyRule> rules;
    for (const auto& entry : ordered) {
        const std::string section = std::string(kSectionPrefix) + std::to_string(entry.first);
        const auto& m = *entry.second;

        ProxyRule r;
        std::vector<std::pair<int, std::pair<std::string, std::string>>> rewrites;
        auto headers = std::make_shared<HeaderRewriteInterceptor>();

        for (const auto& kv : m) {
            const std::string& key = kv.first;
            const std::string& value = kv.second;
            if (key == "match_prefix") {
                r.matchPrefix = value;
            } else if (key == "target") {
                r.target = value;
            } else if (key == "change_origin") {
                r.changeOrigin = ParseBool(section, key, value);
            } else if (key == "xfwd") {
                r.xfwd = ParseBool(section, key, value);
            } else if (key == "secure") {
                r.secure = ParseBool(section, key, value);
            } else if (key == "connect_timeout_ms") {
                r.connectTimeoutMs = ParseIndex(value, "[" + section + "] connect_timeout_ms");
            } else if (key.rfind(kRewritePrefix, 0) == 0) {
                const int k = ParseIndex(key.substr(sizeof(kRewritePrefix) - 1), "[" + section + "] " + key);
                const size_t pos = value.find("=>");
                if (pos == std::string::npos) {
                    throw common::ConfigError("[" + section + "] " + key + " must look like 'pattern => replacement'");
                }
                rewrites.push_back({k, {common::Config::Trim(value.substr(0, pos)),
                                        common::Config::Trim(value.substr(pos + 2))}});
            } else if (key.rfind(kRequestHeaderPrefix, 0) == 0) {
                r.requestHeaders.emplace_back(key.substr(sizeof(kRequestHeaderPrefix) - 1), value);
            } else if (key.rfind(kResponseHeaderPrefix, 0) == 0) {
                const std::string header = key.substr(sizeof(kResponseHeaderPrefix) - 1);
                if (!IsHeaderName(header) || !IsHeaderValue(value)) {
                    throw common::ConfigError("[" + section + "] invalid response header '" + header + "'");
                }
                headers->SetHeader(header, value);
            } else if (key == "remove_response_header") {
                for (const auto& h : SplitList(value)) headers->RemoveHeader(h);
            } else {
                throw common::ConfigError("[" + section + "] unknown key '" + key + "'");
            }
        }

        std::sort(rewrites.begin(), rewrites.end(),
                  [](const auto& a, const auto& b) { return a.first < b.first; });
        for (const auto& rw : rewrites) {
            r.rewrite.Add(rw.second.first, rw.second.second);
        }
        if (!headers->empty()) r.onResponse = headers;
        rules.push_back(std::move(r));
    }

    if (rules.empty()) {
        LOG_WARN << "No [proxy:N] sections configured; every request falls through";
    }
    return Build(std::move(rules));
}

const ProxyRule* ProxyRuleSet::Match(const std::string& path) const {
    for (const auto& r : rules_) {
        if (r.Matches(path)) return &r;
    }
    return nullptr;
}

} // namespace router
} // namespace devproxy
