#include "portico/network/EventLoopThread.h"
#include "portico/network/EventLoop.h"
#include "portico/common/Logger.h"

#include <future>
#include <pthread.h>

namespace portico {
namespace network {

EventLoopThread::EventLoopThread(std::string name) : name_(std::move(name)) {}

EventLoopThread::~EventLoopThread() {
    if (!thread_.joinable()) {
        return;
    }
    // The loop lives on the thread's stack and stays valid until Loop() returns.
    loop_->Quit();
    thread_.join();
}

EventLoop* EventLoopThread::StartLoop() {
    std::promise<EventLoop*> ready;
    std::future<EventLoop*> started = ready.get_future();
    thread_ = std::thread([this, &ready]() {
        // Linux caps thread names at 15 characters.
        pthread_setname_np(pthread_self(), name_.substr(0, 15).c_str());
        EventLoop loop;
        ready.set_value(&loop);
        loop.Loop();
    });
    loop_ = started.get();
    LOG_DEBUG << "thread " << name_ << " running loop " << loop_;
    return loop_;
}

} // namespace network
} // namespace portico
