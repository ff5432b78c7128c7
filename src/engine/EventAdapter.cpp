#include "portico/engine/EventAdapter.h"
#include "portico/engine/EventExchange.h"
#include "portico/common/Logger.h"

namespace portico {
namespace engine {

EventAdapter::EventAdapter(network::EventLoop* loop,
                           adapter::Handler handler,
                           const adapter::AdapterOptions& options,
                           const EventServerOptions& serverOptions,
                           const ConfigureServer& configureServer)
    : adapter_(std::move(handler), options),
      server_(loop, serverOptions) {
    if (configureServer) {
        configureServer(server_);
    }
    server_.SetRequestCallback([this](const std::shared_ptr<EventExchange>& exchange) {
        adapter_.Serve(exchange);
    });
}

bool EventAdapter::Start() {
    const auto& tls = adapter_.options().tls;
    if (tls && !server_.EnableTls(tls->certPath, tls->keyPath)) {
        return false;
    }
    return server_.Start();
}

bool EventAdapter::Shutdown(std::chrono::milliseconds deferredTimeout) {
    server_.CloseAll();
    const size_t pending = adapter_.deferred().Pending();
    if (pending > 0) {
        LOG_INFO << "waiting for " << pending << " deferred task(s)";
    }
    return adapter_.deferred().WaitAll(deferredTimeout);
}

} // namespace engine
} // namespace portico
