#pragma once

#include "devproxy/protocol/BodyFramer.h"
#include "devproxy/protocol/HttpRequest.h"

#include <cstddef>

namespace devproxy {
namespace network {
class Buffer;
}

namespace protocol {

// Incremental request-head parser. Consumes the request line and header
// block from the buffer and stops; body bytes stay in the buffer for the
// caller to stream according to bodyMode().
class HttpContext {
public:
    enum HttpRequestParseState {
        kExpectRequestLine,
        kExpectHeaders,
        kGotHead,
        kError,
    };

    static const size_t kMaxHeadBytes = 64 * 1024;

    HttpContext() : state_(kExpectRequestLine), headBytes_(0), tooLarge_(false), bodyMode_(BodyFramer::kNoBody), contentLength_(0) {}

    // return false if the head is malformed
    bool parseRequest(devproxy::network::Buffer* buf);

    bool gotHead() const { return state_ == kGotHead; }
    bool hasError() const { return state_ == kError; }
    // The error was a head over kMaxHeadBytes.
    bool headTooLarge() const { return tooLarge_; }
    void reset();

    const HttpRequest& request() const { return request_; }
    HttpRequest& request() { return request_; }

    BodyFramer::Mode bodyMode() const { return bodyMode_; }
    size_t contentLength() const { return contentLength_; }

private:
    bool processRequestLine(const char* begin, const char* end);
    bool decideBodyFraming();

    HttpRequestParseState state_;
    HttpRequest request_;
    size_t headBytes_;
    bool tooLarge_;
    BodyFramer::Mode bodyMode_;
    size_t contentLength_;
};

} // namespace protocol
} // namespace devproxy
