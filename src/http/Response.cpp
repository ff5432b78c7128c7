#include "portico/http/Response.h"

namespace portico {
namespace http {

Response Response::Text(int status, std::string body, const std::string& contentType) {
    Response response(status);
    response.headers().Set("content-type", contentType);
    response.SetBody(std::move(body));
    return response;
}

Response Response::Stream(int status, std::shared_ptr<BodyStream> body) {
    Response response(status);
    response.SetBody(std::move(body));
    return response;
}

void Response::SetBody(std::shared_ptr<BodyStream> stream) {
    if (stream) {
        body_ = std::move(stream);
    } else {
        body_ = std::monostate();
    }
}

Response::BodyKind Response::bodyKind() const {
    switch (body_.index()) {
        case 1: return BodyKind::kBytes;
        case 2: return BodyKind::kStream;
        default: return BodyKind::kNone;
    }
}

} // namespace http
} // namespace portico
