#pragma once

#include "portico/http/Headers.h"
#include "portico/http/BodyStream.h"

#include <memory>
#include <string>

namespace portico {
namespace http {

// Canonical request. Immutable apart from its body stream, which has a single consumer.
class Request {
public:
    Request(std::string method, std::string url, Headers headers,
            std::shared_ptr<BodyStream> body)
        : method_(std::move(method)),
          url_(std::move(url)),
          headers_(std::move(headers)),
          body_(std::move(body)) {}

    const std::string& method() const { return method_; }
    const std::string& url() const { return url_; }
    const Headers& headers() const { return headers_; }

    // Null for bodiless methods.
    const std::shared_ptr<BodyStream>& body() const { return body_; }
    bool hasBody() const { return body_ != nullptr; }

    // Path and query part of the URL, e.g. "/a/b?x=1".
    std::string target() const;
    // Path only, without the query.
    std::string path() const;

private:
    const std::string method_;
    const std::string url_;
    const Headers headers_;
    const std::shared_ptr<BodyStream> body_;
};

} // namespace http
} // namespace portico
