#pragma once

#include "portico/common/noncopyable.h"
#include "portico/network/Channel.h"
#include "portico/network/InetAddress.h"

#include <functional>
#include <memory>

namespace portico {
namespace network {

class EventLoop;

// Listening socket driven by the base loop. Accepted fds go to the callback, which owns them.
class Acceptor : portico::common::noncopyable {
public:
    using NewConnectionCallback = std::function<void(int fd, const InetAddress& peer)>;

    Acceptor(EventLoop* loop, const InetAddress& listenAddr, bool reusePort);
    ~Acceptor();

    void SetNewConnectionCallback(NewConnectionCallback cb) { onAccept_ = std::move(cb); }

    // Binds and starts accepting. Loop thread only; false if the address is unusable.
    bool Listen();
    bool listening() const { return fd_ >= 0; }

private:
    void AcceptReady();

    EventLoop* loop_;
    const InetAddress listenAddr_;
    const bool reusePort_;
    int fd_{-1};
    // Spare fd given up to drain the backlog when the process runs out of descriptors.
    int spareFd_;
    std::unique_ptr<Channel> channel_;
    NewConnectionCallback onAccept_;
};

} // namespace network
} // namespace portico
