#pragma once

#include "portico/adapter/NativeExchange.h"
#include "portico/adapter/OriginResolver.h"
#include "portico/http/Request.h"

#include <memory>

namespace portico {
namespace adapter {

// Builds the canonical request of a native exchange.
class RequestTranslator {
public:
    struct Translation {
        http::Request request;
        ResolvedOrigin origin;
    };

    RequestTranslator(const OriginResolver& resolver, size_t bodyHighWaterMark);

    // Wires the exchange's body events into the request body stream. The target is used as
    // received, asterisk and absolute forms included. Throws http::TranslationError when the
    // exchange has no method.
    Translation Translate(const std::shared_ptr<NativeExchange>& exchange) const;

    static bool IsBodiless(const std::string& method);

private:
    std::shared_ptr<http::BodyStream> BindBody(const std::shared_ptr<NativeExchange>& exchange) const;

    const OriginResolver& resolver_;
    size_t bodyHighWaterMark_;
};

} // namespace adapter
} // namespace portico
