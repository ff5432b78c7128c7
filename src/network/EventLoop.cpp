#include "portico/network/EventLoop.h"
#include "portico/common/Logger.h"

#include <sys/eventfd.h>
#include <sys/timerfd.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace portico {
namespace network {

namespace {

thread_local EventLoop* t_currentLoop = nullptr;

// Upper bound on one epoll_wait; a Quit from another thread also wakes the loop.
constexpr int kWaitMs = 10000;

int CreateWakeupFd() {
    int fd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (fd < 0) {
        LOG_FATAL << "eventfd failed: " << std::strerror(errno);
    }
    return fd;
}

itimerspec OneShot(std::chrono::milliseconds delay) {
    itimerspec spec;
    std::memset(&spec, 0, sizeof spec);
    const auto ms = delay.count() > 0 ? delay.count() : 0;
    spec.it_value.tv_sec = static_cast<time_t>(ms / 1000);
    spec.it_value.tv_nsec = static_cast<long>((ms % 1000) * 1000000);
    if (ms == 0) {
        spec.it_value.tv_nsec = 1000; // zero disarms
    }
    return spec;
}

} // namespace

EventLoop* EventLoop::GetEventLoopOfCurrentThread() {
    return t_currentLoop;
}

EventLoop::EventLoop()
    : threadId_(std::this_thread::get_id()),
      wakeupFd_(CreateWakeupFd()),
      wakeupChannel_(new Channel(this, wakeupFd_)) {
    if (t_currentLoop) {
        LOG_FATAL << "thread " << threadId_ << " already runs loop " << t_currentLoop;
    }
    t_currentLoop = this;
    wakeupChannel_->SetReadCallback([this]() { DrainWakeup(); });
    wakeupChannel_->EnableReading();
}

EventLoop::~EventLoop() {
    while (!timers_.empty()) {
        DestroyTimer(timers_.begin()->first);
    }
    wakeupChannel_->DisableAll();
    wakeupChannel_->Remove();
    ::close(wakeupFd_);
    t_currentLoop = nullptr;
}

void EventLoop::Loop() {
    LOG_DEBUG << "loop " << this << " running in thread " << threadId_;
    while (!quit_) {
        ready_.clear();
        poller_.Wait(kWaitMs, &ready_);
        for (Channel* channel : ready_) {
            channel->HandleEvent();
        }
        RunQueued();
    }
    // Teardown queued by the last batch still has to run.
    RunQueued();
    LOG_DEBUG << "loop " << this << " stopped";
}

void EventLoop::Quit() {
    quit_ = true;
    if (!IsInLoopThread()) {
        WakeUp();
    }
}

void EventLoop::RunInLoop(Functor cb) {
    if (IsInLoopThread()) {
        cb();
        return;
    }
    QueueInLoop(std::move(cb));
}

void EventLoop::QueueInLoop(Functor cb) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queued_.push_back(std::move(cb));
    }
    // Inside RunQueued the new functor would otherwise wait for the next event.
    if (!IsInLoopThread() || runningQueued_) {
        WakeUp();
    }
}

EventLoop::TimerId EventLoop::RunAfter(std::chrono::milliseconds delay, TimerCallback cb) {
    const TimerId id = nextTimerId_.fetch_add(1);
    RunInLoop([this, id, delay, cb = std::move(cb)]() mutable {
        ArmTimer(id, delay, std::move(cb));
    });
    return id;
}

void EventLoop::CancelTimer(TimerId id) {
    RunInLoop([this, id]() { DestroyTimer(id); });
}

void EventLoop::ArmTimer(TimerId id, std::chrono::milliseconds delay, TimerCallback cb) {
    int fd = ::timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (fd < 0) {
        LOG_ERROR << "timerfd_create failed: " << std::strerror(errno);
        return;
    }
    const itimerspec spec = OneShot(delay);
    if (::timerfd_settime(fd, 0, &spec, nullptr) != 0) {
        LOG_ERROR << "timerfd_settime failed: " << std::strerror(errno);
        ::close(fd);
        return;
    }

    Timer& timer = timers_[id];
    timer.fd = fd;
    timer.callback = std::move(cb);
    timer.channel.reset(new Channel(this, fd));
    timer.channel->SetReadCallback([this, id]() { FireTimer(id); });
    timer.channel->EnableReading();
}

void EventLoop::FireTimer(TimerId id) {
    auto it = timers_.find(id);
    if (it == timers_.end()) {
        return;
    }
    std::uint64_t expirations = 0;
    if (::read(it->second.fd, &expirations, sizeof expirations) != sizeof expirations) {
        LOG_ERROR << "short read on timer " << id;
    }
    TimerCallback cb = std::move(it->second.callback);
    // The channel is mid-dispatch; drop it once this batch is done.
    QueueInLoop([this, id]() { DestroyTimer(id); });
    if (cb) {
        cb();
    }
}

void EventLoop::DestroyTimer(TimerId id) {
    auto it = timers_.find(id);
    if (it == timers_.end()) {
        return;
    }
    it->second.channel->DisableAll();
    it->second.channel->Remove();
    ::close(it->second.fd);
    timers_.erase(it);
}

void EventLoop::WakeUp() {
    const std::uint64_t one = 1;
    if (::write(wakeupFd_, &one, sizeof one) != sizeof one) {
        LOG_ERROR << "wakeup write failed: " << std::strerror(errno);
    }
}

void EventLoop::DrainWakeup() {
    std::uint64_t count = 0;
    if (::read(wakeupFd_, &count, sizeof count) != sizeof count) {
        LOG_ERROR << "wakeup read failed: " << std::strerror(errno);
    }
}

void EventLoop::UpdateChannel(Channel* channel) {
    poller_.Watch(channel);
}

void EventLoop::RemoveChannel(Channel* channel) {
    poller_.Forget(channel);
}

bool EventLoop::HasChannel(const Channel* channel) const {
    return poller_.Knows(channel);
}

void EventLoop::RunQueued() {
    std::vector<Functor> batch;
    runningQueued_ = true;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        batch.swap(queued_);
    }
    for (const Functor& fn : batch) {
        fn();
    }
    runningQueued_ = false;
}

} // namespace network
} // namespace portico
