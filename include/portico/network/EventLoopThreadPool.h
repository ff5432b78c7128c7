#pragma once

#include "portico/common/noncopyable.h"

#include <memory>
#include <string>
#include <vector>

namespace portico {
namespace network {

class EventLoop;
class EventLoopThread;

// I/O loops that accepted connections are spread over. With no threads the base loop serves everything.
class EventLoopThreadPool : portico::common::noncopyable {
public:
    EventLoopThreadPool(EventLoop* baseLoop, std::string name);
    ~EventLoopThreadPool();

    void Start(int threads);
    EventLoop* GetNextLoop();

private:
    EventLoop* baseLoop_;
    const std::string name_;
    std::vector<std::unique_ptr<EventLoopThread>> threads_;
    std::vector<EventLoop*> loops_;
    size_t next_{0};
};

} // namespace network
} // namespace portico
