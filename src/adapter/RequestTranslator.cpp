#include "portico/adapter/RequestTranslator.h"
#include "portico/http/Errors.h"
#include "portico/common/Logger.h"

namespace portico {
namespace adapter {

RequestTranslator::RequestTranslator(const OriginResolver& resolver, size_t bodyHighWaterMark)
    : resolver_(resolver),
      bodyHighWaterMark_(bodyHighWaterMark) {}

bool RequestTranslator::IsBodiless(const std::string& method) {
    // Methods are case-sensitive; "get" is an extension method and keeps its body.
    return method == "GET" || method == "HEAD";
}

RequestTranslator::Translation RequestTranslator::Translate(
        const std::shared_ptr<NativeExchange>& exchange) const {
    const std::string method = exchange->method();
    const std::string path = exchange->rawPath();
    if (method.empty()) {
        throw http::TranslationError("request has no method");
    }

    http::Headers headers;
    exchange->ForEachHeader([&headers](const std::string& name, const std::string& value) {
        headers.Append(name, value);
    });

    const ConnectionInfo connection =
        resolver_.Describe(headers, exchange->peerAddressBytes(), exchange->tls());
    ResolvedOrigin origin = OriginResolver::Resolve(connection, path, exchange->rawQuery());

    std::shared_ptr<http::BodyStream> body;
    if (!IsBodiless(method)) {
        body = BindBody(exchange);
    }

    std::string url = origin.url;
    return Translation{http::Request(method, std::move(url), std::move(headers), std::move(body)),
                       std::move(origin)};
}

std::shared_ptr<http::BodyStream> RequestTranslator::BindBody(
        const std::shared_ptr<NativeExchange>& exchange) const {
    auto body = std::make_shared<http::BodyStream>(bodyHighWaterMark_);
    std::weak_ptr<NativeExchange> weakExchange(exchange);

    body->SetDrainCallback([weakExchange] {
        // The consumer may sit on another thread.
        if (auto ex = weakExchange.lock()) {
            ex->Post([weakExchange] {
                if (auto inner = weakExchange.lock()) inner->ResumeBody();
            });
        }
    });

    std::weak_ptr<http::BodyStream> weakBody(body);
    exchange->OnData([weakBody, weakExchange](const char* data, size_t len, bool last) {
        auto stream = weakBody.lock();
        if (!stream) return;
        if (len > 0 && !stream->Push(std::string(data, len))) {
            LOG_DEBUG << "request body chunk dropped, consumer is gone";
        }
        if (last) {
            stream->Close();
        } else if (stream->full()) {
            if (auto ex = weakExchange.lock()) ex->PauseBody();
        }
    });
    return body;
}

} // namespace adapter
} // namespace portico
