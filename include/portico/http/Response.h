#pragma once

#include "portico/http/Headers.h"
#include "portico/http/BodyStream.h"

#include <memory>
#include <string>
#include <variant>

namespace portico {
namespace http {

// Canonical response: status, optional reason, headers and a body that is absent,
// a fixed buffer or a stream of chunks.
class Response {
public:
    enum class BodyKind { kNone, kBytes, kStream };

    explicit Response(int status = 200) : status_(status) {}

    static Response Text(int status, std::string body,
                         const std::string& contentType = "text/plain;charset=UTF-8");
    static Response Stream(int status, std::shared_ptr<BodyStream> body);

    int status() const { return status_; }
    void SetStatus(int status) { status_ = status; }

    // Empty means the standard phrase for the status.
    const std::string& reason() const { return reason_; }
    void SetReason(const std::string& reason) { reason_ = reason; }

    Headers& headers() { return headers_; }
    const Headers& headers() const { return headers_; }

    void SetBody(std::string bytes) { body_ = std::move(bytes); }
    void SetBody(std::shared_ptr<BodyStream> stream);
    void ClearBody() { body_ = std::monostate(); }

    BodyKind bodyKind() const;
    // Valid for kBytes.
    const std::string& bytes() const { return std::get<std::string>(body_); }
    // Valid for kStream.
    const std::shared_ptr<BodyStream>& stream() const { return std::get<std::shared_ptr<BodyStream>>(body_); }

private:
    int status_;
    std::string reason_;
    Headers headers_;
    std::variant<std::monostate, std::string, std::shared_ptr<BodyStream>> body_;
};

} // namespace http
} // namespace portico
