#pragma once

#include "portico/common/noncopyable.h"

#include <chrono>
#include <future>
#include <mutex>
#include <vector>

namespace portico {
namespace adapter {

// Background tasks registered through waitUntil. They never hold up the response; the
// hosting process may wait for them, e.g. before exiting.
class DeferredWork : portico::common::noncopyable {
public:
    DeferredWork() = default;

    void Add(std::future<void> task);
    // Takes over every task of other. Tasks that already finished are reaped on the way.
    void Adopt(DeferredWork& other);

    // Tasks not finished yet. Finished ones are reaped and their errors logged.
    size_t Pending();
    // Futures currently held, finished or not. Does not reap.
    size_t Tracked();
    // Blocks until every task finished or timeout passed. Returns true if all finished.
    bool WaitAll(std::chrono::milliseconds timeout);

private:
    // Caller holds mutex_.
    void TakeFinished(std::vector<std::future<void>>* done);
    void Reap(std::future<void>& task);

    std::mutex mutex_;
    std::vector<std::future<void>> tasks_;
};

} // namespace adapter
} // namespace portico
