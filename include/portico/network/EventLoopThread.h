#pragma once

#include "portico/common/noncopyable.h"

#include <string>
#include <thread>

namespace portico {
namespace network {

class EventLoop;

// A thread running its own EventLoop until this object is destroyed.
class EventLoopThread : portico::common::noncopyable {
public:
    explicit EventLoopThread(std::string name = "loop");
    ~EventLoopThread();

    // Starts the thread and blocks until its loop exists. Call once.
    EventLoop* StartLoop();
    const std::string& name() const { return name_; }

private:
    const std::string name_;
    EventLoop* loop_{nullptr};
    std::thread thread_;
};

} // namespace network
} // namespace portico
