#pragma once

#include <regex>
#include <string>
#include <vector>

namespace devproxy {
namespace router {

// Ordered (pattern, replacement) list applied to a request path before forwarding.
// The first entry whose pattern matches rewrites the first match only; later
// entries are not consulted. An empty list leaves the path unchanged.
class PathRewrite {
public:
    // Throws common::ConfigError if pattern is not a valid ECMAScript regex.
    void Add(const std::string& pattern, const std::string& replacement);

    std::string Apply(const std::string& path) const;

    // Throws common::ConfigError if rewriting samplePath yields an invalid path.
    void Validate(const std::string& samplePath) const;

    bool empty() const { return entries_.empty(); }
    size_t size() const { return entries_.size(); }

    // Starts with '/' and holds no whitespace or control characters.
    static bool IsValidPath(const std::string& path);

private:
    struct Entry {
        std::string pattern;
        std::regex re;
        std::string replacement;
    };

    std::vector<Entry> entries_;
};

} // namespace router
} // namespace devproxy
