#pragma once

#include <cstddef>
#include <string>

namespace devproxy {
namespace protocol {

// Wraps a raw payload stream in HTTP/1.1 chunked transfer coding.
class ChunkedEncoder {
public:
    // Appends one chunk holding [data, data+len). Empty input writes nothing,
    // since a zero-size chunk would end the body.
    void encode(const char* data, size_t len, std::string* out);
    // Appends the terminating zero-size chunk (no trailers). Idempotent.
    void finish(std::string* out);

    bool finished() const { return finished_; }
    size_t payloadBytes() const { return payloadBytes_; }

    static const char kLastChunk[];

private:
    bool finished_{false};
    size_t payloadBytes_{0};
};

} // namespace protocol
} // namespace devproxy
