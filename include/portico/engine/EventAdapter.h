#pragma once

#include "portico/common/noncopyable.h"
#include "portico/adapter/Adapter.h"
#include "portico/engine/EventServer.h"

#include <chrono>
#include <functional>
#include <memory>

namespace portico {
namespace engine {

// The adapter bound to the event engine: one handler served over HTTP/1.x sockets.
class EventAdapter : portico::common::noncopyable {
public:
    // Receives the server before it starts, e.g. to tune threads or limits.
    using ConfigureServer = std::function<void(EventServer&)>;

    // Throws std::invalid_argument for unusable adapter options.
    EventAdapter(network::EventLoop* loop,
                 adapter::Handler handler,
                 const adapter::AdapterOptions& options,
                 const EventServerOptions& serverOptions,
                 const ConfigureServer& configureServer = ConfigureServer());

    // return false if TLS was requested but could not be set up, or the port is unusable
    bool Start();
    // Drops open connections, then waits for work registered through waitUntil.
    bool Shutdown(std::chrono::milliseconds deferredTimeout);

    EventServer& server() { return server_; }
    adapter::Adapter& adapter() { return adapter_; }

private:
    adapter::Adapter adapter_;
    EventServer server_;
};

} // namespace engine
} // namespace portico
