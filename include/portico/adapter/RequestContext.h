#pragma once

#include "portico/common/noncopyable.h"
#include "portico/adapter/DeferredWork.h"
#include "portico/adapter/PendingResponse.h"
#include "portico/adapter/Platform.h"
#include "portico/http/AbortSignal.h"
#include "portico/http/Request.h"

#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>

namespace portico {
namespace adapter {

// Everything a handler sees of one request. The context lives until the request is done or
// aborted and the handler call returned; work that runs later keeps signal() or the body.
class RequestContext : portico::common::noncopyable {
public:
    RequestContext(http::Request request,
                   std::string ip,
                   Platform platform,
                   std::shared_ptr<http::AbortSignal> signal)
        : request_(std::move(request)),
          ip_(std::move(ip)),
          platform_(std::move(platform)),
          signal_(std::move(signal)) {}

    const http::Request& request() const { return request_; }
    const std::string& ip() const { return ip_; }
    const Platform& platform() const { return platform_; }
    const std::shared_ptr<http::AbortSignal>& signal() const { return signal_; }

    std::optional<std::string> Env(const std::string& name) const;

    // Registers work that may outlive the response.
    void WaitUntil(std::future<void> task) { deferred_.Add(std::move(task)); }
    DeferredWork& deferred() { return deferred_; }

    // Result telling the engine to apply its default handling.
    HandlerResult PassThrough() const { return PassThroughTag{}; }

private:
    const http::Request request_;
    const std::string ip_;
    const Platform platform_;
    const std::shared_ptr<http::AbortSignal> signal_;
    DeferredWork deferred_;
};

using Handler = std::function<HandlerResult(RequestContext&)>;

} // namespace adapter
} // namespace portico
