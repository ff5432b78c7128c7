#pragma once

#include "portico/common/noncopyable.h"
#include "portico/http/Response.h"

#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <variant>

namespace portico {
namespace adapter {

class PendingResponse;

// Returned by a handler to let the engine's default handling answer.
struct PassThroughTag {};

using HandlerResult = std::variant<http::Response, PassThroughTag, std::shared_ptr<PendingResponse>>;
using Settlement = std::variant<http::Response, PassThroughTag, std::exception_ptr>;

// A handler result that becomes available later. Settled once, from any thread; later
// settlements are ignored. Dropping an unsettled one settles it with an error.
class PendingResponse : portico::common::noncopyable {
public:
    using Continuation = std::function<void(Settlement)>;

    static std::shared_ptr<PendingResponse> Create() { return std::make_shared<PendingResponse>(); }

    PendingResponse() = default;
    ~PendingResponse();

    bool Resolve(http::Response response);
    bool PassThrough();
    bool Reject(std::exception_ptr error);

    bool settled() const;

    // Runs cb once with the settlement, right away if already settled.
    void Then(Continuation cb);

private:
    bool Settle(Settlement settlement);

    mutable std::mutex mutex_;
    bool settled_{false};
    std::unique_ptr<Settlement> value_;
    Continuation continuation_;
};

} // namespace adapter
} // namespace portico
