#include "portico/network/EpollPoller.h"
#include "portico/network/Channel.h"
#include "portico/common/Logger.h"

#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace portico {
namespace network {

namespace {
constexpr size_t kInitialReadySlots = 32;
}

EpollPoller::EpollPoller()
    : epollFd_(::epoll_create1(EPOLL_CLOEXEC)),
      ready_(kInitialReadySlots) {
    if (epollFd_ < 0) {
        LOG_FATAL << "epoll_create1 failed: " << std::strerror(errno);
    }
}

EpollPoller::~EpollPoller() {
    ::close(epollFd_);
}

int EpollPoller::Wait(int timeoutMs, ChannelList* ready) {
    int n = ::epoll_wait(epollFd_, ready_.data(), static_cast<int>(ready_.size()), timeoutMs);
    if (n < 0) {
        if (errno != EINTR) {
            LOG_ERROR << "epoll_wait failed: " << std::strerror(errno);
        }
        return 0;
    }
    for (int i = 0; i < n; ++i) {
        auto* channel = static_cast<Channel*>(ready_[i].data.ptr);
        channel->setReadyEvents(ready_[i].events);
        ready->push_back(channel);
    }
    // A full batch means more fds may be waiting; give the next round more room.
    if (static_cast<size_t>(n) == ready_.size()) {
        ready_.resize(ready_.size() * 2);
    }
    return n;
}

void EpollPoller::Watch(Channel* channel) {
    switch (channel->pollState()) {
    case Channel::PollState::kNew:
        channels_[channel->fd()] = channel;
        [[fallthrough]];
    case Channel::PollState::kParked:
        if (channel->IsNoneEvent()) {
            channel->setPollState(Channel::PollState::kParked);
        } else {
            Control(EPOLL_CTL_ADD, channel);
            channel->setPollState(Channel::PollState::kWatched);
        }
        break;
    case Channel::PollState::kWatched:
        if (channel->IsNoneEvent()) {
            Control(EPOLL_CTL_DEL, channel);
            channel->setPollState(Channel::PollState::kParked);
        } else {
            Control(EPOLL_CTL_MOD, channel);
        }
        break;
    }
}

void EpollPoller::Forget(Channel* channel) {
    channels_.erase(channel->fd());
    if (channel->pollState() == Channel::PollState::kWatched) {
        Control(EPOLL_CTL_DEL, channel);
    }
    channel->setPollState(Channel::PollState::kNew);
}

bool EpollPoller::Knows(const Channel* channel) const {
    auto it = channels_.find(channel->fd());
    return it != channels_.end() && it->second == channel;
}

void EpollPoller::Control(int op, Channel* channel) {
    epoll_event event;
    std::memset(&event, 0, sizeof(event));
    event.events = channel->events();
    event.data.ptr = channel;
    if (::epoll_ctl(epollFd_, op, channel->fd(), &event) == 0) {
        return;
    }
    // A DEL can race with the peer closing the fd; anything else means the loop is corrupt.
    if (op == EPOLL_CTL_DEL) {
        LOG_ERROR << "epoll_ctl DEL fd=" << channel->fd() << ": " << std::strerror(errno);
    } else {
        LOG_FATAL << "epoll_ctl op=" << op << " fd=" << channel->fd() << ": " << std::strerror(errno);
    }
}

} // namespace network
} // namespace portico
