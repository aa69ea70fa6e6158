#include "devproxy/protocol/BodyFramer.h"

#include <algorithm>
#include <cctype>

namespace devproxy {
namespace protocol {

void BodyFramer::reset(Mode mode, size_t contentLength) {
    mode_ = mode;
    remaining_ = 0;
    payloadBytes_ = 0;
    truncated_ = false;
    line_.clear();
    switch (mode) {
        case kNoBody:
            state_ = kDone;
            break;
        case kContentLength:
            remaining_ = contentLength;
            state_ = contentLength == 0 ? kDone : kIdentity;
            break;
        case kChunked:
            state_ = kSizeLine;
            break;
        case kUntilClose:
            state_ = kIdentity;
            break;
    }
}

bool BodyFramer::finishSizeLine() {
    std::string s = line_;
    line_.clear();
    if (!s.empty() && s.back() == '\r') s.pop_back();
    const size_t semi = s.find(';');
    if (semi != std::string::npos) s.resize(semi);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.pop_back();
    if (s.empty() || s.size() > 16) return false;

    size_t size = 0;
    for (char c : s) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) return false;
        const int digit = std::isdigit(static_cast<unsigned char>(c))
            ? c - '0'
            : std::tolower(static_cast<unsigned char>(c)) - 'a' + 10;
        size = size * 16 + static_cast<size_t>(digit);
    }
    if (size == 0) {
        state_ = kTrailer;
    } else {
        remaining_ = size;
        state_ = kData;
    }
    return true;
}

size_t BodyFramer::consume(const char* data, size_t len, std::string* payload) {
    size_t off = 0;
    while (off < len && state_ != kDone && state_ != kError) {
        switch (state_) {
            case kIdentity: {
                if (mode_ == kUntilClose) {
                    if (payload) payload->append(data + off, len - off);
                    payloadBytes_ += len - off;
                    off = len;
                    break;
                }
                const size_t take = std::min(remaining_, len - off);
                if (payload) payload->append(data + off, take);
                remaining_ -= take;
                payloadBytes_ += take;
                off += take;
                if (remaining_ == 0) state_ = kDone;
                break;
            }
            case kSizeLine: {
                const char c = data[off++];
                if (c == '\n') {
                    if (!finishSizeLine()) state_ = kError;
                } else if (line_.size() >= kMaxLineLength) {
                    state_ = kError;
                } else {
                    line_.push_back(c);
                }
                break;
            }
            case kData: {
                const size_t take = std::min(remaining_, len - off);
                if (payload) payload->append(data + off, take);
                remaining_ -= take;
                payloadBytes_ += take;
                off += take;
                if (remaining_ == 0) state_ = kDataCrlf;
                break;
            }
            case kDataCrlf: {
                const char c = data[off++];
                if (c == '\r' && line_.empty()) {
                    line_.push_back(c);
                } else if (c == '\n') {
                    line_.clear();
                    state_ = kSizeLine;
                } else {
                    state_ = kError;
                }
                break;
            }
            case kTrailer: {
                const char c = data[off++];
                if (c == '\n') {
                    if (!line_.empty() && line_.back() == '\r') line_.pop_back();
                    if (line_.empty()) {
                        state_ = kDone;
                    }
                    line_.clear();
                } else if (line_.size() >= kMaxLineLength) {
                    state_ = kError;
                } else {
                    line_.push_back(c);
                }
                break;
            }
            case kDone:
            case kError:
                break;
        }
    }
    return off;
}

void BodyFramer::onEof() {
    if (state_ == kDone || state_ == kError) return;
    if (mode_ == kUntilClose) {
        state_ = kDone;
        return;
    }
    truncated_ = true;
    state_ = kError;
}

} // namespace protocol
} // namespace devproxy
