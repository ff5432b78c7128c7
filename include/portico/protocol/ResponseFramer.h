#pragma once

#include "portico/protocol/RequestHead.h"

#include <string>
#include <vector>
#include <utility>

namespace portico {
namespace protocol {

// Serializes one HTTP/1.x response. The head is held back until the first body write so
// a response finished in one call can be framed with Content-Length; continuation writes
// switch to chunked coding (HTTP/1.1) or to close-delimited framing (HTTP/1.0).
class ResponseFramer {
public:
    ResponseFramer(RequestHead::Version version, bool headRequest, bool keepAlive);

    void setStatus(int status, const std::string& reason);
    void addHeader(const std::string& name, const std::string& value);

    bool headWritten() const { return headWritten_; }
    bool finished() const { return finished_; }
    // True when the connection must close once this response is flushed.
    bool closeAfter() const { return !keepAlive_; }

    // Non-final body write.
    std::string write(const std::string& chunk);
    // Final write; completes the response.
    std::string end(const std::string& chunk);

    static const char* defaultReason(int status);

private:
    enum Framing { kNone, kContentLength, kChunked, kUntilClose };

    std::string head(Framing framing, size_t contentLength);

    RequestHead::Version version_;
    bool headRequest_;
    bool keepAlive_;

    int status_{200};
    std::string reason_;
    std::vector<std::pair<std::string, std::string>> headers_;
    std::string appContentLength_;

    Framing framing_{kNone};
    bool headWritten_{false};
    bool finished_{false};
};

} // namespace protocol
} // namespace portico
