#include "portico/http/AbortSignal.h"

namespace portico {
namespace http {

bool AbortSignal::Abort() {
    std::vector<Listener> listeners;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (aborted_.exchange(true, std::memory_order_acq_rel)) return false;
        listeners.swap(listeners_);
    }
    for (auto& listener : listeners) {
        listener();
    }
    return true;
}

void AbortSignal::OnAbort(Listener listener) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!aborted_.load(std::memory_order_acquire)) {
            listeners_.push_back(std::move(listener));
            return;
        }
    }
    listener();
}

} // namespace http
} // namespace portico
