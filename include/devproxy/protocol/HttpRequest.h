#pragma once

#include "devproxy/protocol/HttpHeaders.h"

#include <string>

namespace devproxy {
namespace protocol {

// Request head as received from the client. The body is never stored here;
// it is streamed through BodyFramer.
class HttpRequest {
public:
    enum Version {
        kUnknown, kHttp10, kHttp11
    };

    HttpRequest() : version_(kUnknown) {}

    void setVersion(Version v) { version_ = v; }
    Version getVersion() const { return version_; }
    const char* versionString() const { return version_ == kHttp10 ? "HTTP/1.0" : "HTTP/1.1"; }

    // Any RFC 9110 token is accepted so unusual methods (PATCH, OPTIONS, PROPFIND) pass through.
    bool setMethod(const char* start, const char* end) {
        if (start == end) return false;
        for (const char* p = start; p != end; ++p) {
            if (!isTokenChar(*p)) return false;
        }
        method_.assign(start, end);
        return true;
    }
    void setMethod(const std::string& m) { method_ = m; }
    const std::string& method() const { return method_; }
    bool isHead() const { return method_ == "HEAD"; }

    void setPath(const char* start, const char* end) { path_.assign(start, end); }
    void setPath(const std::string& path) { path_ = path; }
    const std::string& path() const { return path_; }

    // Includes the leading '?', empty when absent.
    void setQuery(const char* start, const char* end) { query_.assign(start, end); }
    void setQuery(const std::string& query) { query_ = query; }
    const std::string& query() const { return query_; }

    std::string target() const { return path_ + query_; }

    HttpHeaders& headers() { return headers_; }
    const HttpHeaders& headers() const { return headers_; }
    std::string getHeader(const std::string& field) const { return headers_.get(field); }

    // HTTP/1.1 defaults to persistent, HTTP/1.0 needs an explicit keep-alive.
    bool keepAlive() const {
        if (version_ == kHttp10) {
            return headers_.containsToken("Connection", "keep-alive");
        }
        return !headers_.containsToken("Connection", "close");
    }

    void swap(HttpRequest& that) {
        method_.swap(that.method_);
        std::swap(version_, that.version_);
        path_.swap(that.path_);
        query_.swap(that.query_);
        std::swap(headers_, that.headers_);
    }

private:
    static bool isTokenChar(char c) {
        if (c >= 'a' && c <= 'z') return true;
        if (c >= 'A' && c <= 'Z') return true;
        if (c >= '0' && c <= '9') return true;
        switch (c) {
            case '!': case '#': case '$': case '%': case '&': case '\'': case '*':
            case '+': case '-': case '.': case '^': case '_': case '`': case '|': case '~':
                return true;
            default:
                return false;
        }
    }

    std::string method_;
    Version version_;
    std::string path_;
    std::string query_;
    HttpHeaders headers_;
};

} // namespace protocol
} // namespace devproxy
