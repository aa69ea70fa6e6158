#include "devproxy/protocol/HttpResponseContext.h"
#include "devproxy/network/Buffer.h"

#include <algorithm>
#include <cctype>
#include <cstdio>

namespace devproxy {
namespace protocol {

void HttpResponseContext::reset() {
    state_ = kExpectStatusLine;
    headBytes_ = 0;
    httpMajor_ = 1;
    httpMinor_ = 1;
    statusCode_ = 0;
    reason_.clear();
    headers_.clear();
    chunked_ = false;
    hasContentLength_ = false;
    contentLength_ = 0;
}

bool HttpResponseContext::processStatusLine(const char* begin, const char* end) {
    // HTTP/1.1 200 OK
    if (end - begin < 12 || !std::equal(begin, begin + 5, "HTTP/")) return false;
    const char* p = begin + 5;
    if (!std::isdigit(static_cast<unsigned char>(p[0])) || p[1] != '.' ||
        !std::isdigit(static_cast<unsigned char>(p[2])) || p[3] != ' ') {
        return false;
    }
    httpMajor_ = p[0] - '0';
    httpMinor_ = p[2] - '0';
    if (httpMajor_ != 1) return false;

    p += 4;
    if (end - p < 3) return false;
    int code = 0;
    for (int i = 0; i < 3; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(p[i]))) return false;
        code = code * 10 + (p[i] - '0');
    }
    if (code < 100) return false;
    statusCode_ = code;
    p += 3;
    if (p != end && *p != ' ') return false;
    reason_ = (p == end) ? std::string() : std::string(p + 1, end);
    return true;
}

bool HttpResponseContext::decideBodyFraming() {
    chunked_ = headers_.containsToken("Transfer-Encoding", "chunked");
    hasContentLength_ = false;
    contentLength_ = 0;
    if (chunked_) {
        headers_.remove("Content-Length");
        return true;
    }
    for (const auto& field : headers_) {
        if (!HttpHeaders::iequals(field.first, "Content-Length")) continue;
        const std::string& v = field.second;
        if (v.empty() || v.size() > 18) return false;
        size_t n = 0;
        for (char c : v) {
            if (!std::isdigit(static_cast<unsigned char>(c))) return false;
            n = n * 10 + static_cast<size_t>(c - '0');
        }
        if (hasContentLength_ && n != contentLength_) return false;
        contentLength_ = n;
        hasContentLength_ = true;
    }
    return true;
}

bool HttpResponseContext::parseResponse(devproxy::network::Buffer* buf) {
    while (state_ == kExpectStatusLine || state_ == kExpectHeaders) {
        const char* crlf = buf->FindCRLF();
        if (crlf == nullptr) {
            if (headBytes_ + buf->ReadableBytes() > kMaxHeadBytes) {
                state_ = kError;
            }
            break;
        }
        const size_t lineLen = crlf + 2 - buf->Peek();
        headBytes_ += lineLen;
        if (headBytes_ > kMaxHeadBytes) {
            state_ = kError;
            break;
        }

        if (state_ == kExpectStatusLine) {
            if (!processStatusLine(buf->Peek(), crlf)) {
                state_ = kError;
                break;
            }
            state_ = kExpectHeaders;
        } else if (crlf == buf->Peek()) {
            state_ = decideBodyFraming() ? kGotHead : kError;
        } else if (!headers_.addLine(buf->Peek(), crlf)) {
            state_ = kError;
            break;
        }
        buf->Retrieve(lineLen);
    }
    return state_ != kError;
}

BodyFramer::Mode HttpResponseContext::bodyMode(bool requestWasHead) const {
    if (requestWasHead) return BodyFramer::kNoBody;
    if (statusCode_ == 101) return BodyFramer::kUntilClose;
    if (statusCode_ < 200 || statusCode_ == 204 || statusCode_ == 304) return BodyFramer::kNoBody;
    if (chunked_) return BodyFramer::kChunked;
    if (hasContentLength_) return contentLength_ == 0 ? BodyFramer::kNoBody : BodyFramer::kContentLength;
    return BodyFramer::kUntilClose;
}

bool HttpResponseContext::keepAlive() const {
    if (!chunked_ && !hasContentLength_ && statusCode_ >= 200 && statusCode_ != 204 && statusCode_ != 304) {
        // Close delimited, unless it was a body-less response to HEAD; be conservative.
        return false;
    }
    if (httpMajor_ == 1 && httpMinor_ == 0) {
        return headers_.containsToken("Connection", "keep-alive");
    }
    return !headers_.containsToken("Connection", "close");
}

void HttpResponseContext::appendHeadTo(std::string* out) const {
    char buf[32];
    snprintf(buf, sizeof buf, "HTTP/%d.%d %03d", httpMajor_, httpMinor_, statusCode_);
    out->append(buf);
    out->append(" ");
    out->append(reason_);
    out->append("\r\n");
    headers_.appendTo(out);
    out->append("\r\n");
}

} // namespace protocol
} // namespace devproxy
