#include "devproxy/protocol/Url.h"

#include <cctype>

namespace devproxy {
namespace protocol {

std::string Url::hostHeader() const {
    if (port == defaultPort()) return host;
    return host + ":" + std::to_string(port);
}

std::string Url::origin() const {
    return scheme + "://" + host + ":" + std::to_string(port);
}

bool Url::parse(const std::string& text, Url* out, std::string* err) {
    Url url;
    const size_t sep = text.find("://");
    if (sep == std::string::npos) {
        *err = "missing scheme in '" + text + "'";
        return false;
    }
    for (size_t i = 0; i < sep; ++i) {
        url.scheme.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(text[i]))));
    }
    if (url.scheme != "http" && url.scheme != "https") {
        *err = "unsupported scheme '" + url.scheme + "'";
        return false;
    }

    const size_t authStart = sep + 3;
    size_t authEnd = text.find_first_of("/?#", authStart);
    if (authEnd == std::string::npos) authEnd = text.size();
    if (authEnd < text.size() && text[authEnd] != '/') {
        *err = "query or fragment not allowed in target '" + text + "'";
        return false;
    }
    const std::string authority = text.substr(authStart, authEnd - authStart);
    if (authority.empty()) {
        *err = "missing host in '" + text + "'";
        return false;
    }
    if (authority.find('@') != std::string::npos) {
        *err = "credentials not allowed in target '" + text + "'";
        return false;
    }

    std::string portText;
    if (authority[0] == '[') {
        const size_t close = authority.find(']');
        if (close == std::string::npos) {
            *err = "unterminated IPv6 literal in '" + text + "'";
            return false;
        }
        url.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') {
                *err = "malformed authority in '" + text + "'";
                return false;
            }
            portText = authority.substr(close + 2);
        }
    } else {
        const size_t colon = authority.rfind(':');
        url.host = authority.substr(0, colon);
        if (colon != std::string::npos) portText = authority.substr(colon + 1);
    }
    if (url.host.empty()) {
        *err = "missing host in '" + text + "'";
        return false;
    }
    for (char c : url.host) {
        if (std::isspace(static_cast<unsigned char>(c)) || std::iscntrl(static_cast<unsigned char>(c))) {
            *err = "invalid host in '" + text + "'";
            return false;
        }
    }

    url.port = url.defaultPort();
    if (!portText.empty()) {
        unsigned long p = 0;
        for (char c : portText) {
            if (!std::isdigit(static_cast<unsigned char>(c)) || portText.size() > 5) {
                *err = "invalid port '" + portText + "'";
                return false;
            }
            p = p * 10 + static_cast<unsigned long>(c - '0');
        }
        if (p == 0 || p > 65535) {
            *err = "port out of range '" + portText + "'";
            return false;
        }
        url.port = static_cast<uint16_t>(p);
    }

    url.basePath = text.substr(authEnd);
    for (unsigned char c : url.basePath) {
        if (c == '?' || c == '#') {
            *err = "query or fragment not allowed in target '" + text + "'";
            return false;
        }
        if (c <= 0x20 || c == 0x7f) {
            *err = "whitespace or control character in target path '" + text + "'";
            return false;
        }
    }
    while (!url.basePath.empty() && url.basePath.back() == '/') url.basePath.pop_back();

    *out = url;
    return true;
}

} // namespace protocol
} // namespace devproxy
