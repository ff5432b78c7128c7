#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include <sys/types.h>

namespace portico {
namespace network {

// Byte queue for one direction of a connection: append at the tail, consume from the head.
// Consumed space is reclaimed lazily when the tail runs out of room.
class Buffer {
public:
    explicit Buffer(size_t initialSize = 4096) : storage_(initialSize) {}

    Buffer(const Buffer&) = delete;
    Buffer& operator=(const Buffer&) = delete;
    Buffer(Buffer&&) noexcept = default;
    Buffer& operator=(Buffer&&) noexcept = default;

    size_t ReadableBytes() const { return tail_ - head_; }
    const char* Peek() const { return storage_.data() + head_; }

    // First CRLF in the readable bytes, or nullptr.
    const char* FindCRLF() const;

    void Retrieve(size_t len);
    void RetrieveUntil(const char* end) { Retrieve(static_cast<size_t>(end - Peek())); }

    void Append(const char* data, size_t len);
    void Append(const std::string& str) { Append(str.data(), str.size()); }

    // Reads whatever the socket has, growing as needed. Returns read(2)'s result.
    ssize_t ReadFd(int fd, int* savedErrno);

private:
    void Reserve(size_t len);

    std::vector<char> storage_;
    size_t head_{0};
    size_t tail_{0};
};

} // namespace network
} // namespace portico
