#pragma once

#include "portico/common/noncopyable.h"
#include <sys/epoll.h>
#include <unordered_map>
#include <vector>

namespace portico {
namespace network {

class Channel;

// Level-triggered epoll set owned by one EventLoop. Not thread safe.
class EpollPoller : portico::common::noncopyable {
public:
    using ChannelList = std::vector<Channel*>;

    EpollPoller();
    ~EpollPoller();

    // Appends the ready channels to ready. Returns the number of ready fds.
    int Wait(int timeoutMs, ChannelList* ready);

    void Watch(Channel* channel);
    void Forget(Channel* channel);
    bool Knows(const Channel* channel) const;

private:
    void Control(int op, Channel* channel);

    int epollFd_;
    std::vector<epoll_event> ready_;
    std::unordered_map<int, Channel*> channels_;
};

} // namespace network
} // namespace portico
