#pragma once

#include <cstdint>
#include <string>

namespace devproxy {
namespace protocol {

// An upstream origin plus optional base path: scheme://host[:port][/basePath].
struct Url {
    std::string scheme;   // "http" or "https"
    std::string host;
    uint16_t port{0};
    std::string basePath; // no trailing '/', empty for the root

    bool isHttps() const { return scheme == "https"; }
    uint16_t defaultPort() const { return isHttps() ? 443 : 80; }

    // host, plus ":port" when it is not the scheme default.
    std::string hostHeader() const;
    // scheme://host:port, used as the pooling key.
    std::string origin() const;

    // Returns false and fills *err for anything but an absolute http(s) URL
    // without credentials, query or fragment.
    static bool parse(const std::string& text, Url* out, std::string* err);
};

} // namespace protocol
} // namespace devproxy
