#pragma once

#include "portico/protocol/HeaderText.h"

#include <string>
#include <utility>
#include <vector>

namespace portico {
namespace protocol {

// Request line and header block of one HTTP/1.x request, as received.
class RequestHead {
public:
    enum Version { kUnknown, kHttp10, kHttp11 };

    using HeaderList = std::vector<std::pair<std::string, std::string>>;

    Version version() const { return version_; }
    const std::string& method() const { return method_; }
    const std::string& path() const { return path_; }
    // Without the leading '?'.
    const std::string& query() const { return query_; }
    // In arrival order, duplicates kept.
    const HeaderList& headers() const { return headers_; }

    // First value of name, or empty.
    std::string header(const std::string& name) const {
        for (const auto& h : headers_) {
            if (EqualsIgnoreCase(h.first, name)) return h.second;
        }
        return std::string();
    }

    bool hasHeader(const std::string& name) const {
        for (const auto& h : headers_) {
            if (EqualsIgnoreCase(h.first, name)) return true;
        }
        return false;
    }

    bool isHead() const { return method_ == "HEAD"; }

    // HTTP/1.1 stays open unless told to close; HTTP/1.0 closes unless asked to keep alive.
    bool keepAlive() const {
        const std::string connection = header("Connection");
        return version_ == kHttp11 ? !HasToken(connection, "close") : HasToken(connection, "keep-alive");
    }

private:
    friend class RequestParser;

    Version version_{kUnknown};
    std::string method_;
    std::string path_;
    std::string query_;
    HeaderList headers_;
};

} // namespace protocol
} // namespace portico
