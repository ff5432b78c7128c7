#include "portico/adapter/DeferredWork.h"
#include "portico/common/Logger.h"

#include <algorithm>
#include <exception>
#include <iterator>

namespace portico {
namespace adapter {

namespace {

bool IsReady(const std::future<void>& task) {
    return task.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

} // namespace

void DeferredWork::Add(std::future<void> task) {
    if (!task.valid()) return;
    std::lock_guard<std::mutex> lock(mutex_);
    tasks_.push_back(std::move(task));
}

void DeferredWork::Adopt(DeferredWork& other) {
    if (&other == this) return;
    std::vector<std::future<void>> taken;
    {
        std::lock_guard<std::mutex> lock(other.mutex_);
        taken.swap(other.tasks_);
    }
    if (taken.empty()) return;
    std::vector<std::future<void>> done;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& task : taken) {
            tasks_.push_back(std::move(task));
        }
        // Finished tasks are dropped here as well as in Pending.
        TakeFinished(&done);
    }
    for (auto& task : done) {
        Reap(task);
    }
}

void DeferredWork::TakeFinished(std::vector<std::future<void>>* done) {
    auto it = std::partition(tasks_.begin(), tasks_.end(),
                             [](const std::future<void>& t) { return !IsReady(t); });
    std::move(it, tasks_.end(), std::back_inserter(*done));
    tasks_.erase(it, tasks_.end());
}

void DeferredWork::Reap(std::future<void>& task) {
    try {
        task.get();
    } catch (const std::exception& e) {
        LOG_ERROR << "deferred task failed: " << e.what();
    } catch (...) {
        LOG_ERROR << "deferred task failed: non-standard exception";
    }
}

size_t DeferredWork::Tracked() {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

size_t DeferredWork::Pending() {
    std::vector<std::future<void>> done;
    size_t pending = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        TakeFinished(&done);
        pending = tasks_.size();
    }
    for (auto& task : done) {
        Reap(task);
    }
    return pending;
}

bool DeferredWork::WaitAll(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::vector<std::future<void>> tasks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks.swap(tasks_);
    }
    bool all = true;
    for (auto& task : tasks) {
        if (task.wait_until(deadline) == std::future_status::ready) {
            Reap(task);
        } else {
            all = false;
        }
    }
    if (!all) {
        LOG_WARN << "deferred work still running after " << timeout.count() << "ms";
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& task : tasks) {
            if (task.valid()) tasks_.push_back(std::move(task));
        }
    }
    return all;
}

} // namespace adapter
} // namespace portico
