#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "portico/common/noncopyable.h"
#include "portico/network/Callbacks.h"
#include "portico/network/Channel.h"
#include "portico/network/EpollPoller.h"

namespace portico {
namespace network {

// One loop per thread. Everything a connection does happens on its loop's thread;
// other threads hand work over with RunInLoop/QueueInLoop.
class EventLoop : portico::common::noncopyable {
public:
    using Functor = std::function<void()>;
    using TimerId = std::int64_t;

    EventLoop();
    ~EventLoop();

    void Loop();
    void Quit();

    // Runs cb now when called on the loop thread, otherwise queues it.
    void RunInLoop(Functor cb);
    // Always queues; cb runs after the current batch of events.
    void QueueInLoop(Functor cb);

    // One-shot timer. Safe to call from any thread.
    TimerId RunAfter(std::chrono::milliseconds delay, TimerCallback cb);
    void CancelTimer(TimerId id);

    void WakeUp();
    void UpdateChannel(Channel* channel);
    void RemoveChannel(Channel* channel);
    bool HasChannel(const Channel* channel) const;

    bool IsInLoopThread() const { return threadId_ == std::this_thread::get_id(); }

    static EventLoop* GetEventLoopOfCurrentThread();

private:
    struct Timer {
        int fd{-1};
        std::unique_ptr<Channel> channel;
        TimerCallback callback;
    };

    void DrainWakeup();
    void RunQueued();
    void ArmTimer(TimerId id, std::chrono::milliseconds delay, TimerCallback cb);
    void FireTimer(TimerId id);
    void DestroyTimer(TimerId id);

    std::atomic<bool> quit_{false};
    std::atomic<bool> runningQueued_{false};
    const std::thread::id threadId_;

    EpollPoller poller_;
    EpollPoller::ChannelList ready_;

    int wakeupFd_;
    std::unique_ptr<Channel> wakeupChannel_;

    std::mutex mutex_;
    std::vector<Functor> queued_;

    std::atomic<TimerId> nextTimerId_{1};
    std::map<TimerId, Timer> timers_;
};

} // namespace network
} // namespace portico
