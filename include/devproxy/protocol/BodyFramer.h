#pragma once

#include <cstddef>
#include <string>

namespace devproxy {
namespace protocol {

// Finds where an HTTP/1.1 message body ends without copying or altering it.
// Bytes are relayed as they are consumed; whatever is not consumed belongs
// to the next message on the connection.
class BodyFramer {
public:
    enum Mode {
        kNoBody,
        kContentLength,
        kChunked,
        kUntilClose,
    };

    BodyFramer() { reset(kNoBody); }

    void reset(Mode mode, size_t contentLength = 0);

    // Returns how many leading bytes of [data, data+len) belong to this body.
    // Check hasError() afterwards for malformed chunk framing.
    size_t consume(const char* data, size_t len) { return consume(data, len, nullptr); }
    // Same, and appends the payload bytes (chunk framing stripped) to *payload.
    size_t consume(const char* data, size_t len, std::string* payload);

    // The peer closed the connection. Completes kUntilClose bodies; any other
    // unfinished body is truncated.
    void onEof();

    Mode mode() const { return mode_; }
    bool done() const { return state_ == kDone; }
    bool hasError() const { return state_ == kError; }
    bool truncated() const { return truncated_; }
    // Payload bytes seen so far (chunk framing excluded).
    size_t payloadBytes() const { return payloadBytes_; }

private:
    enum State {
        kSizeLine,
        kData,
        kDataCrlf,
        kTrailer,
        kIdentity,
        kDone,
        kError,
    };

    static const size_t kMaxLineLength = 4096;

    bool finishSizeLine();

    Mode mode_;
    State state_;
    size_t remaining_;
    size_t payloadBytes_;
    bool truncated_;
    std::string line_;
};

} // namespace protocol
} // namespace devproxy
