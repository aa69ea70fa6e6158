#pragma once

#include "devproxy/protocol/BodyFramer.h"
#include "devproxy/protocol/HttpHeaders.h"

#include <cstddef>
#include <string>

namespace devproxy {
namespace network {
class Buffer;
}

namespace protocol {

// Incremental HTTP/1.x response-head parser for the upstream side of a proxy.
// Consumes the status line and header block; the body is left in the buffer
// and framed by bodyMode():
// - Transfer-Encoding: chunked
// - Content-Length
// - neither: read until close (connection not reusable)
class HttpResponseContext {
public:
    enum ParseState { kExpectStatusLine, kExpectHeaders, kGotHead, kError };

    static const size_t kMaxHeadBytes = 64 * 1024;

    // return false if the head is malformed
    bool parseResponse(devproxy::network::Buffer* buf);

    bool gotHead() const { return state_ == kGotHead; }
    bool hasError() const { return state_ == kError; }
    void reset();

    int statusCode() const { return statusCode_; }
    const std::string& reason() const { return reason_; }
    int httpMajor() const { return httpMajor_; }
    int httpMinor() const { return httpMinor_; }
    // Version written by appendHeadTo.
    void setHttpVersion(int major, int minor) {
        httpMajor_ = major;
        httpMinor_ = minor;
    }

    HttpHeaders& headers() { return headers_; }
    const HttpHeaders& headers() const { return headers_; }

    // 1xx other than 101: another head follows on the same connection.
    bool isInterim() const { return statusCode_ >= 100 && statusCode_ < 200 && statusCode_ != 101; }

    // Body framing of the upstream message as received. HEAD, 1xx, 204 and 304 carry no body.
    BodyFramer::Mode bodyMode(bool requestWasHead) const;
    size_t contentLength() const { return contentLength_; }

    // Whether the upstream connection may carry another request afterwards.
    bool keepAlive() const;

    // Status line, current headers and the blank line.
    void appendHeadTo(std::string* out) const;

private:
    bool processStatusLine(const char* begin, const char* end);
    bool decideBodyFraming();

    ParseState state_{kExpectStatusLine};
    size_t headBytes_{0};

    int httpMajor_{1};
    int httpMinor_{1};
    int statusCode_{0};
    std::string reason_;

    HttpHeaders headers_;
    bool chunked_{false};
    bool hasContentLength_{false};
    size_t contentLength_{0};
};

} // namespace protocol
} // namespace devproxy
