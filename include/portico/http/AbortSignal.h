#pragma once

#include "portico/common/noncopyable.h"

#include <atomic>
#include <functional>
#include <mutex>
#include <vector>

namespace portico {
namespace http {

// One-shot cancellation flag for one exchange. Once raised it stays raised.
class AbortSignal : portico::common::noncopyable {
public:
    using Listener = std::function<void()>;

    AbortSignal() : aborted_(false) {}

    bool aborted() const { return aborted_.load(std::memory_order_acquire); }

    // Returns true only for the call that raised the flag. Listeners run on that caller's thread.
    bool Abort();

    // Runs listener on abort, or immediately if already aborted.
    void OnAbort(Listener listener);

private:
    std::atomic<bool> aborted_;
    std::mutex mutex_;
    std::vector<Listener> listeners_;
};

} // namespace http
} // namespace portico
