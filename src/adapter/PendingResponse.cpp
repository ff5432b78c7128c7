#include "portico/adapter/PendingResponse.h"
#include "portico/common/Logger.h"

#include <stdexcept>

namespace portico {
namespace adapter {

PendingResponse::~PendingResponse() {
    Continuation cb;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (settled_ || !continuation_) return;
        cb.swap(continuation_);
    }
    LOG_WARN << "PendingResponse dropped without being settled";
    cb(std::make_exception_ptr(std::runtime_error("handler dropped its pending response")));
}

bool PendingResponse::Resolve(http::Response response) {
    return Settle(std::move(response));
}

bool PendingResponse::PassThrough() {
    return Settle(PassThroughTag{});
}

bool PendingResponse::Reject(std::exception_ptr error) {
    return Settle(error);
}

bool PendingResponse::settled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return settled_;
}

bool PendingResponse::Settle(Settlement settlement) {
    Continuation cb;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (settled_) {
            LOG_WARN << "PendingResponse settled twice, ignoring the second result";
            return false;
        }
        settled_ = true;
        if (continuation_) {
            cb.swap(continuation_);
        } else {
            value_ = std::make_unique<Settlement>(std::move(settlement));
            return true;
        }
    }
    cb(std::move(settlement));
    return true;
}

void PendingResponse::Then(Continuation cb) {
    std::unique_ptr<Settlement> value;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!settled_) {
            continuation_ = std::move(cb);
            return;
        }
        value.swap(value_);
    }
    if (value) cb(std::move(*value));
}

} // namespace adapter
} // namespace portico
