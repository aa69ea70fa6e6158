#include "devproxy/protocol/ChunkedEncoder.h"

#include <cstdio>

namespace devproxy {
namespace protocol {

const char ChunkedEncoder::kLastChunk[] = "0\r\n\r\n";

void ChunkedEncoder::encode(const char* data, size_t len, std::string* out) {
    if (len == 0 || finished_) return;
    char sizeLine[32];
    const int n = snprintf(sizeLine, sizeof sizeLine, "%zx\r\n", len);
    out->append(sizeLine, static_cast<size_t>(n));
    out->append(data, len);
    out->append("\r\n");
    payloadBytes_ += len;
}

void ChunkedEncoder::finish(std::string* out) {
    if (finished_) return;
    finished_ = true;
    out->append(kLastChunk, sizeof(kLastChunk) - 1);
}

} // namespace protocol
} // namespace devproxy
