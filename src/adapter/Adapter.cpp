#include "portico/adapter/Adapter.h"
#include "portico/adapter/RequestDispatch.h"

#include <stdexcept>

namespace portico {
namespace adapter {

namespace {

const AdapterOptions& Validated(const AdapterOptions& options) {
    options.Validate();
    return options;
}

} // namespace

Adapter::Adapter(Handler handler, const AdapterOptions& options)
    : handler_(std::move(handler)),
      options_(Validated(options)),
      resolver_(options_),
      translator_(resolver_, options_.bodyHighWaterMark) {
    if (!handler_) {
        throw std::invalid_argument("adapter needs a handler");
    }
}

void Adapter::Serve(const std::shared_ptr<NativeExchange>& exchange) {
    auto dispatch = std::make_shared<RequestDispatch>(exchange, handler_, translator_, deferred_);
    dispatch->Start();
}

} // namespace adapter
} // namespace portico
