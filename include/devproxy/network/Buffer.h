#pragma once

#include <string>
#include <sys/types.h>
#include <vector>

namespace devproxy {
namespace network {

/// Byte queue between a socket and the HTTP parsers.
///
/// Unread bytes are data_[readIndex_, writeIndex_). Consumed space at the
/// front is reclaimed lazily when an append would otherwise grow the vector.
class Buffer {
public:
    static const size_t kInitialSize = 4096;

    explicit Buffer(size_t initialSize = kInitialSize) : data_(initialSize), readIndex_(0), writeIndex_(0) {}

    Buffer(const Buffer&) = delete;
    Buffer& operator=(const Buffer&) = delete;
    Buffer(Buffer&&) noexcept = default;
    Buffer& operator=(Buffer&&) noexcept = default;

    size_t ReadableBytes() const { return writeIndex_ - readIndex_; }
    const char* Peek() const { return data_.data() + readIndex_; }

    // First "\r\n" in the readable bytes, or nullptr.
    const char* FindCRLF() const;

    void Retrieve(size_t len);
    void RetrieveAll() { readIndex_ = writeIndex_ = 0; }
    std::string RetrieveAllAsString();

    void Append(const std::string& str) { Append(str.data(), str.size()); }
    void Append(const char* data, size_t len);

    // Reads what the socket has, spilling into a stack buffer first so a
    // single call can take more than the current free space.
    ssize_t ReadFd(int fd, int* savedErrno);

private:
    void Reserve(size_t len);

    std::vector<char> data_;
    size_t readIndex_;
    size_t writeIndex_;
};

} // namespace network
} // namespace devproxy
