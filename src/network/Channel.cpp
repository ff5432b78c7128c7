#include "portico/network/Channel.h"
#include "portico/network/EventLoop.h"
#include "portico/common/Logger.h"

#include <sys/epoll.h>

namespace portico {
namespace network {

const std::uint32_t Channel::kReadable = EPOLLIN | EPOLLPRI;
const std::uint32_t Channel::kWritable = EPOLLOUT;

Channel::Channel(EventLoop* loop, int fd) : loop_(loop), fd_(fd) {}

Channel::~Channel() {
    if (registered_ && loop_->HasChannel(this)) {
        LOG_WARN << "channel fd=" << fd_ << " destroyed while its loop still watches it";
    }
}

void Channel::Tie(const std::shared_ptr<void>& owner) {
    owner_ = owner;
    tied_ = true;
}

void Channel::SetInterest(std::uint32_t interest) {
    interest_ = interest;
    registered_ = true;
    loop_->UpdateChannel(this);
}

void Channel::Remove() {
    registered_ = false;
    loop_->RemoveChannel(this);
}

void Channel::HandleEvent() {
    if (!tied_) {
        Dispatch();
        return;
    }
    if (std::shared_ptr<void> pin = owner_.lock()) {
        Dispatch();
    }
}

void Channel::Dispatch() {
    // Hangup with nothing left to read is a close; with data pending, read first and
    // let the zero-length read report it.
    if ((ready_ & EPOLLHUP) && !(ready_ & EPOLLIN) && onHangup_) {
        onHangup_();
    }
    if ((ready_ & EPOLLERR) && onError_) {
        onError_();
    }
    if ((ready_ & (EPOLLIN | EPOLLPRI | EPOLLRDHUP)) && onReadable_) {
        onReadable_();
    }
    if ((ready_ & EPOLLOUT) && onWritable_) {
        onWritable_();
    }
}

} // namespace network
} // namespace portico
