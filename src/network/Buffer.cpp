#include "portico/network/Buffer.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <sys/uio.h>

namespace portico {
namespace network {

const char* Buffer::FindCRLF() const {
    const char* begin = Peek();
    const char* end = begin + ReadableBytes();
    for (const char* p = begin; p + 1 < end; ++p) {
        p = static_cast<const char*>(std::memchr(p, '\r', static_cast<size_t>(end - p - 1)));
        if (p == nullptr) {
            return nullptr;
        }
        if (p[1] == '\n') {
            return p;
        }
    }
    return nullptr;
}

void Buffer::Retrieve(size_t len) {
    if (len >= ReadableBytes()) {
        head_ = tail_ = 0;
        return;
    }
    head_ += len;
}

void Buffer::Append(const char* data, size_t len) {
    Reserve(len);
    std::memcpy(storage_.data() + tail_, data, len);
    tail_ += len;
}

void Buffer::Reserve(size_t len) {
    if (storage_.size() - tail_ >= len) {
        return;
    }
    const size_t readable = ReadableBytes();
    if (head_ > 0) {
        std::memmove(storage_.data(), storage_.data() + head_, readable);
        head_ = 0;
        tail_ = readable;
    }
    if (storage_.size() - tail_ < len) {
        storage_.resize(std::max(storage_.size() * 2, tail_ + len));
    }
}

ssize_t Buffer::ReadFd(int fd, int* savedErrno) {
    // Overflow goes to the stack first so an idle connection keeps a small buffer.
    char spill[65536];
    iovec vec[2];
    const size_t room = storage_.size() - tail_;
    vec[0].iov_base = storage_.data() + tail_;
    vec[0].iov_len = room;
    vec[1].iov_base = spill;
    vec[1].iov_len = sizeof spill;
    const ssize_t n = ::readv(fd, vec, 2);
    if (n < 0) {
        *savedErrno = errno;
        return n;
    }
    const size_t got = static_cast<size_t>(n);
    if (got <= room) {
        tail_ += got;
    } else {
        tail_ = storage_.size();
        Append(spill, got - room);
    }
    return n;
}

} // namespace network
} // namespace portico
