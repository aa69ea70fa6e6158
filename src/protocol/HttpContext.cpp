#include "devproxy/protocol/HttpContext.h"
#include "devproxy/network/Buffer.h"
#include "devproxy/common/Logger.h"

#include <algorithm>
#include <cctype>

namespace devproxy {
namespace protocol {

namespace {

bool parseContentLength(const std::string& v, size_t* out) {
    if (v.empty() || v.size() > 18) return false;
    size_t n = 0;
    for (char c : v) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        n = n * 10 + static_cast<size_t>(c - '0');
    }
    *out = n;
    return true;
}

} // namespace

void HttpContext::reset() {
    state_ = kExpectRequestLine;
    HttpRequest dummy;
    request_.swap(dummy);
    headBytes_ = 0;
    tooLarge_ = false;
    bodyMode_ = BodyFramer::kNoBody;
    contentLength_ = 0;
}

bool HttpContext::processRequestLine(const char* begin, const char* end) {
    const char* start = begin;
    const char* space = std::find(start, end, ' ');
    if (space == end || !request_.setMethod(start, space)) return false;

    start = space + 1;
    space = std::find(start, end, ' ');
    if (space == end || start == space || *start != '/') return false;
    for (const char* p = start; p != space; ++p) {
        if (static_cast<unsigned char>(*p) <= 0x20 || *p == 0x7f) return false;
    }
    const char* question = std::find(start, space, '?');
    request_.setPath(start, question);
    request_.setQuery(question, space);

    start = space + 1;
    if (end - start != 8 || !std::equal(start, end - 1, "HTTP/1.")) return false;
    if (*(end - 1) == '1') {
        request_.setVersion(HttpRequest::kHttp11);
    } else if (*(end - 1) == '0') {
        request_.setVersion(HttpRequest::kHttp10);
    } else {
        return false;
    }
    return true;
}

bool HttpContext::decideBodyFraming() {
    HttpHeaders& headers = request_.headers();
    if (headers.has("Transfer-Encoding")) {
        if (!headers.containsToken("Transfer-Encoding", "chunked")) {
            LOG_DEBUG << "HttpContext: unsupported Transfer-Encoding " << headers.get("Transfer-Encoding");
            return false;
        }
        // Transfer-Encoding overrides Content-Length; forwarding both would let the origin disagree.
        headers.remove("Content-Length");
        bodyMode_ = BodyFramer::kChunked;
        return true;
    }

    bool seen = false;
    for (const auto& field : headers) {
        if (!HttpHeaders::iequals(field.first, "Content-Length")) continue;
        size_t n = 0;
        if (!parseContentLength(field.second, &n)) return false;
        if (seen && n != contentLength_) return false;
        contentLength_ = n;
        seen = true;
    }
    bodyMode_ = (seen && contentLength_ > 0) ? BodyFramer::kContentLength : BodyFramer::kNoBody;
    return true;
}

bool HttpContext::parseRequest(devproxy::network::Buffer* buf) {
    while (state_ == kExpectRequestLine || state_ == kExpectHeaders) {
        const char* crlf = buf->FindCRLF();
        if (crlf == nullptr) {
            if (headBytes_ + buf->ReadableBytes() > kMaxHeadBytes) {
                state_ = kError;
                tooLarge_ = true;
            }
            break;
        }
        const size_t lineLen = crlf + 2 - buf->Peek();
        headBytes_ += lineLen;
        if (headBytes_ > kMaxHeadBytes) {
            state_ = kError;
            tooLarge_ = true;
            break;
        }

        if (state_ == kExpectRequestLine) {
            // Tolerate stray CRLFs between pipelined requests.
            if (crlf == buf->Peek()) {
                headBytes_ -= lineLen;
                buf->Retrieve(lineLen);
                continue;
            }
            if (!processRequestLine(buf->Peek(), crlf)) {
                state_ = kError;
                break;
            }
            state_ = kExpectHeaders;
        } else if (crlf == buf->Peek()) {
            // empty line, end of headers
            state_ = decideBodyFraming() ? kGotHead : kError;
        } else if (!request_.headers().addLine(buf->Peek(), crlf)) {
            state_ = kError;
            break;
        }
        buf->Retrieve(lineLen);
    }
    return state_ != kError;
}

} // namespace protocol
} // namespace devproxy
