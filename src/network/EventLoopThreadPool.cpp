#include "portico/network/EventLoopThreadPool.h"
#include "portico/network/EventLoopThread.h"
#include "portico/network/EventLoop.h"

namespace portico {
namespace network {

EventLoopThreadPool::EventLoopThreadPool(EventLoop* baseLoop, std::string name)
    : baseLoop_(baseLoop), name_(std::move(name)) {}

// Threads stop in reverse start order.
EventLoopThreadPool::~EventLoopThreadPool() {
    while (!threads_.empty()) {
        threads_.pop_back();
    }
}

void EventLoopThreadPool::Start(int threads) {
    for (int i = 0; i < threads; ++i) {
        threads_.emplace_back(new EventLoopThread(name_ + "-io" + std::to_string(i)));
        loops_.push_back(threads_.back()->StartLoop());
    }
}

EventLoop* EventLoopThreadPool::GetNextLoop() {
    if (loops_.empty()) {
        return baseLoop_;
    }
    EventLoop* loop = loops_[next_];
    next_ = (next_ + 1) % loops_.size();
    return loop;
}

} // namespace network
} // namespace portico
