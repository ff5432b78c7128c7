#include "portico/http/Request.h"

namespace portico {
namespace http {

std::string Request::target() const {
    const size_t scheme = url_.find("://");
    if (scheme == std::string::npos) return url_;
    const size_t slash = url_.find('/', scheme + 3);
    if (slash == std::string::npos) {
        const size_t question = url_.find('?', scheme + 3);
        return question == std::string::npos ? "/" : "/" + url_.substr(question);
    }
    return url_.substr(slash);
}

std::string Request::path() const {
    std::string t = target();
    const size_t question = t.find('?');
    if (question != std::string::npos) t.resize(question);
    return t;
}

} // namespace http
} // namespace portico
