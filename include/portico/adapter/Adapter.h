#pragma once

#include "portico/common/noncopyable.h"
#include "portico/adapter/AdapterOptions.h"
#include "portico/adapter/DeferredWork.h"
#include "portico/adapter/NativeExchange.h"
#include "portico/adapter/OriginResolver.h"
#include "portico/adapter/RequestContext.h"
#include "portico/adapter/RequestTranslator.h"

#include <memory>

namespace portico {
namespace adapter {

// Binds one handler to native engines. Engines call Serve for every new request.
class Adapter : portico::common::noncopyable {
public:
    // Throws std::invalid_argument for unusable options.
    Adapter(Handler handler, const AdapterOptions& options);

    // Must be called on the exchange's thread. The adapter must outlive the exchange.
    void Serve(const std::shared_ptr<NativeExchange>& exchange);

    const AdapterOptions& options() const { return options_; }
    const OriginResolver& resolver() const { return resolver_; }
    // Work registered through waitUntil by finished requests.
    DeferredWork& deferred() { return deferred_; }

private:
    Handler handler_;
    AdapterOptions options_;
    OriginResolver resolver_;
    RequestTranslator translator_;
    DeferredWork deferred_;
};

} // namespace adapter
} // namespace portico
