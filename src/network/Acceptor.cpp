#include "portico/network/Acceptor.h"
#include "portico/network/EventLoop.h"
#include "portico/network/SocketOps.h"
#include "portico/common/Logger.h"

#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace portico {
namespace network {

Acceptor::Acceptor(EventLoop* loop, const InetAddress& listenAddr, bool reusePort)
    : loop_(loop),
      listenAddr_(listenAddr),
      reusePort_(reusePort),
      spareFd_(::open("/dev/null", O_RDONLY | O_CLOEXEC)) {}

Acceptor::~Acceptor() {
    if (channel_) {
        channel_->DisableAll();
        channel_->Remove();
    }
    if (fd_ >= 0) {
        sockets::Close(fd_);
    }
    if (spareFd_ >= 0) {
        ::close(spareFd_);
    }
}

bool Acceptor::Listen() {
    if (listening()) {
        return true;
    }
    fd_ = sockets::OpenListener(listenAddr_, reusePort_);
    if (fd_ < 0) {
        return false;
    }
    channel_.reset(new Channel(loop_, fd_));
    channel_->SetReadCallback([this]() { AcceptReady(); });
    channel_->EnableReading();
    return true;
}

void Acceptor::AcceptReady() {
    InetAddress peer;
    const int fd = sockets::AcceptPeer(fd_, &peer);
    if (fd >= 0) {
        if (onAccept_) {
            onAccept_(fd, peer);
        } else {
            sockets::Close(fd);
        }
        return;
    }
    const int err = errno;
    if (err == EAGAIN || err == EINTR || err == ECONNABORTED) {
        return;
    }
    LOG_ERROR << "accept on " << listenAddr_.toIpPort() << " failed: " << std::strerror(err);
    if (err == EMFILE && spareFd_ >= 0) {
        // Level-triggered epoll would spin on the pending peer; accept it and hang up.
        ::close(spareFd_);
        const int dropped = ::accept(fd_, nullptr, nullptr);
        if (dropped >= 0) {
            ::close(dropped);
        }
        spareFd_ = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
    }
}

} // namespace network
} // namespace portico
