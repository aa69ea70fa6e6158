#include "devproxy/network/Buffer.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <sys/uio.h>

namespace devproxy {
namespace network {

const char* Buffer::FindCRLF() const {
    const char* begin = Peek();
    const char* end = begin + ReadableBytes();
    for (const char* p = begin; p + 1 < end; ++p) {
        p = static_cast<const char*>(std::memchr(p, '\r', static_cast<size_t>(end - p)));
        if (!p || p + 1 >= end) return nullptr;
        if (p[1] == '\n') return p;
    }
    return nullptr;
}

void Buffer::Retrieve(size_t len) {
    if (len >= ReadableBytes()) {
        RetrieveAll();
    } else {
        readIndex_ += len;
    }
}

std::string Buffer::RetrieveAllAsString() {
    std::string out(Peek(), ReadableBytes());
    RetrieveAll();
    return out;
}

void Buffer::Append(const char* data, size_t len) {
    Reserve(len);
    std::memcpy(data_.data() + writeIndex_, data, len);
    writeIndex_ += len;
}

void Buffer::Reserve(size_t len) {
    if (data_.size() - writeIndex_ >= len) return;
    const size_t readable = ReadableBytes();
    if (readIndex_ > 0) {
        std::memmove(data_.data(), Peek(), readable);
        readIndex_ = 0;
        writeIndex_ = readable;
    }
    if (data_.size() - writeIndex_ < len) {
        data_.resize(std::max(data_.size() * 2, writeIndex_ + len));
    }
}

ssize_t Buffer::ReadFd(int fd, int* savedErrno) {
    char spill[65536];
    const size_t room = data_.size() - writeIndex_;
    struct iovec vec[2];
    vec[0].iov_base = data_.data() + writeIndex_;
    vec[0].iov_len = room;
    vec[1].iov_base = spill;
    vec[1].iov_len = sizeof spill;
    const ssize_t n = ::readv(fd, vec, 2);
    if (n < 0) {
        *savedErrno = errno;
    } else if (static_cast<size_t>(n) <= room) {
        writeIndex_ += static_cast<size_t>(n);
    } else {
        writeIndex_ = data_.size();
        Append(spill, static_cast<size_t>(n) - room);
    }
    return n;
}

} // namespace network
} // namespace devproxy
