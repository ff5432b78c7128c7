#pragma once

#include "portico/protocol/RequestHead.h"
#include "portico/network/Buffer.h"

#include <functional>

namespace portico {
namespace protocol {

// Incremental HTTP/1.x request parser. The head is parsed whole; the body is handed out
// piece by piece as it arrives instead of being accumulated. Bytes past the end of the
// current request stay in the buffer until reset().
class RequestParser {
public:
    // data/len may be empty; last is true exactly once per request.
    using BodyCallback = std::function<void(const char* data, size_t len, bool last)>;

    static constexpr size_t kMaxHeaderBytes = 64 * 1024;

    // return false if the head is malformed or too large
    bool parseHead(network::Buffer* buf);
    // return false if the body framing is malformed
    bool parseBody(network::Buffer* buf, const BodyCallback& onBody);

    bool headComplete() const { return stage_ == Stage::kBody || stage_ == Stage::kDone; }
    bool complete() const { return stage_ == Stage::kDone; }
    bool chunked() const { return chunked_; }
    const RequestHead& head() const { return head_; }

    void reset() { *this = RequestParser(); }

private:
    enum class Stage { kRequestLine, kHeaders, kBody, kDone };
    enum class Chunk { kSize, kData, kDataEnd, kTrailers };

    bool takeRequestLine(const char* begin, const char* end);
    bool takeHeader(const char* begin, const char* end);
    bool decideFraming();
    bool parseChunked(network::Buffer* buf, const BodyCallback& onBody);
    void finish(const BodyCallback& onBody);

    Stage stage_{Stage::kRequestLine};
    RequestHead head_;
    size_t headBytes_{0};

    bool chunked_{false};
    size_t remaining_{0};
    Chunk chunk_{Chunk::kSize};
};

} // namespace protocol
} // namespace portico
