#pragma once

#include <stdexcept>
#include <string>

namespace devproxy {
namespace common {

// Raised while building startup configuration (proxy rules, targets, rewrites).
// Never thrown on the request path.
class ConfigError : public std::invalid_argument {
public:
    explicit ConfigError(const std::string& what) : std::invalid_argument(what) {}
};

} // namespace common
} // namespace devproxy
