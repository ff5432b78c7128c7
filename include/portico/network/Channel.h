#pragma once

#include "portico/common/noncopyable.h"
#include <cstdint>
#include <functional>
#include <memory>

namespace portico {
namespace network {

class EventLoop;

// Binds one fd to the callbacks its readiness events trigger. The fd stays owned by the caller.
class Channel : portico::common::noncopyable {
public:
    using EventCallback = std::function<void()>;

    // Where the channel stands in its loop's epoll set.
    enum class PollState { kNew, kWatched, kParked };

    Channel(EventLoop* loop, int fd);
    ~Channel();

    void HandleEvent();

    void SetReadCallback(EventCallback cb) { onReadable_ = std::move(cb); }
    void SetWriteCallback(EventCallback cb) { onWritable_ = std::move(cb); }
    void SetCloseCallback(EventCallback cb) { onHangup_ = std::move(cb); }
    void SetErrorCallback(EventCallback cb) { onError_ = std::move(cb); }

    // Events are dropped once owner has been destroyed; while they run, owner is pinned.
    void Tie(const std::shared_ptr<void>& owner);

    void EnableReading() { SetInterest(interest_ | kReadable); }
    void DisableReading() { SetInterest(interest_ & ~kReadable); }
    void EnableWriting() { SetInterest(interest_ | kWritable); }
    void DisableWriting() { SetInterest(interest_ & ~kWritable); }
    void DisableAll() { SetInterest(0); }
    void Remove();

    bool IsWriting() const { return (interest_ & kWritable) != 0; }
    bool IsNoneEvent() const { return interest_ == 0; }

    int fd() const { return fd_; }
    std::uint32_t events() const { return interest_; }
    void setReadyEvents(std::uint32_t events) { ready_ = events; }
    PollState pollState() const { return pollState_; }
    void setPollState(PollState state) { pollState_ = state; }

private:
    static const std::uint32_t kReadable;
    static const std::uint32_t kWritable;

    void SetInterest(std::uint32_t interest);
    void Dispatch();

    EventLoop* loop_;
    const int fd_;
    std::uint32_t interest_{0};
    std::uint32_t ready_{0};
    PollState pollState_{PollState::kNew};
    bool registered_{false};

    bool tied_{false};
    std::weak_ptr<void> owner_;

    EventCallback onReadable_;
    EventCallback onWritable_;
    EventCallback onHangup_;
    EventCallback onError_;
};

} // namespace network
} // namespace portico
