#include "devproxy/router/PathRewrite.h"
#include "devproxy/common/ConfigError.h"

namespace devproxy {
namespace router {

void PathRewrite::Add(const std::string& pattern, const std::string& replacement) {
    try {
        entries_.push_back({pattern, std::regex(pattern, std::regex::ECMAScript), replacement});
    } catch (const std::regex_error& e) {
        throw common::ConfigError("invalid rewrite pattern '" + pattern + "': " + e.what());
    }
}

std::string PathRewrite::Apply(const std::string& path) const {
    for (const auto& e : entries_) {
        if (!std::regex_search(path, e.re)) continue;
        std::string out = std::regex_replace(path, e.re, e.replacement,
                                             std::regex_constants::format_first_only);
        if (out.empty()) out = "/";
        return out;
    }
    return path;
}

void PathRewrite::Validate(const std::string& samplePath) const {
    const std::string out = Apply(samplePath);
    if (!IsValidPath(out)) {
        throw common::ConfigError("rewrite turns '" + samplePath + "' into invalid path '" + out + "'");
    }
}

bool PathRewrite::IsValidPath(const std::string& path) {
    if (path.empty() || path[0] != '/') return false;
    for (unsigned char c : path) {
        if (c <= 0x20 || c == 0x7f) return false;
    }
    return true;
}

} // namespace router
} // namespace devproxy
