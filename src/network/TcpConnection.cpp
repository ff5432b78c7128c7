#include "portico/network/TcpConnection.h"
#include "portico/network/Channel.h"
#include "portico/network/EventLoop.h"
#include "portico/network/SocketOps.h"
#include "portico/network/TlsContext.h"
#include "portico/common/Logger.h"

#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace portico {
namespace network {

namespace {

// OpenSSL hands out one record per SSL_read.
constexpr size_t kTlsReadChunk = 16 * 1024;

bool WouldBlock(int err) {
    return err == EAGAIN || err == EWOULDBLOCK || err == EINTR;
}

} // namespace

TcpConnection::TcpConnection(EventLoop* loop,
                             std::string name,
                             int fd,
                             const InetAddress& localAddr,
                             const InetAddress& peerAddr,
                             std::shared_ptr<TlsContext> tls)
    : loop_(loop),
      name_(std::move(name)),
      fd_(fd),
      channel_(new Channel(loop, fd)),
      localAddr_(localAddr),
      peerAddr_(peerAddr),
      tlsContext_(std::move(tls)),
      lastActive_(std::chrono::steady_clock::now().time_since_epoch().count()) {
    channel_->SetReadCallback([this]() { OnReadable(); });
    channel_->SetWriteCallback([this]() { OnWritable(); });
    channel_->SetCloseCallback([this]() { OnHangup(); });
    channel_->SetErrorCallback([this]() { OnError(); });
    sockets::TuneConnection(fd_);
    LOG_DEBUG << "connection " << name_ << " fd=" << fd_ << " created";
}

TcpConnection::~TcpConnection() {
    LOG_DEBUG << "connection " << name_ << " fd=" << fd_ << " destroyed";
    sockets::Close(fd_);
}

bool TcpConnection::tlsEstablished() const {
    return tls_ && tls_->established();
}

void TcpConnection::ConnectEstablished() {
    state_ = State::kConnected;
    Touch();
    channel_->Tie(shared_from_this());
    channel_->EnableReading();
    if (connectionCallback_) {
        connectionCallback_(shared_from_this());
    }
}

void TcpConnection::ConnectDestroyed() {
    if (state_ == State::kConnected || state_ == State::kDisconnecting) {
        state_ = State::kDisconnected;
        channel_->DisableAll();
        if (connectionCallback_) {
            connectionCallback_(shared_from_this());
        }
    }
    channel_->Remove();
}

bool TcpConnection::DetectTls() {
    switch (TlsSession::Sniff(fd_)) {
    case TlsSession::Greeting::kNothingYet:
        return false;
    case TlsSession::Greeting::kPlain:
    case TlsSession::Greeting::kEof:
        tlsContext_.reset();
        return true;
    case TlsSession::Greeting::kTls:
        break;
    }
    tls_.reset(new TlsSession(std::move(tlsContext_), fd_));
    if (!tls_->valid()) {
        OnHangup();
        return false;
    }
    return true;
}

bool TcpConnection::AdvanceHandshake() {
    switch (tls_->Handshake()) {
    case TlsSession::Io::kOk:
        if (output_.ReadableBytes() > 0 && !channel_->IsWriting()) {
            channel_->EnableWriting();
        }
        return true;
    case TlsSession::Io::kWantRead:
        return false;
    case TlsSession::Io::kWantWrite:
        if (!channel_->IsWriting()) {
            channel_->EnableWriting();
        }
        return false;
    case TlsSession::Io::kClosed:
    case TlsSession::Io::kFailed:
        break;
    }
    LOG_WARN << "TLS handshake with " << peerAddr_.toIpPort() << " failed: " << TlsSession::LastError();
    OnHangup();
    return false;
}

void TcpConnection::OnReadable() {
    if (tlsContext_ && !DetectTls()) {
        return;
    }
    if (tls_ && !tls_->established() && !AdvanceHandshake()) {
        return;
    }

    size_t received = 0;
    bool eof = false;
    bool failed = false;
    int savedErrno = 0;
    if (tls_) {
        // Drain every record OpenSSL already decrypted; epoll will not report them again.
        char chunk[kTlsReadChunk];
        for (;;) {
            size_t got = 0;
            const TlsSession::Io io = tls_->Read(chunk, sizeof chunk, &got);
            if (io == TlsSession::Io::kOk) {
                input_.Append(chunk, got);
                received += got;
                continue;
            }
            if (io == TlsSession::Io::kWantWrite && !channel_->IsWriting()) {
                channel_->EnableWriting();
            }
            eof = io == TlsSession::Io::kClosed;
            failed = io == TlsSession::Io::kFailed;
            break;
        }
    } else {
        const ssize_t n = input_.ReadFd(fd_, &savedErrno);
        if (n > 0) {
            received = static_cast<size_t>(n);
        } else if (n == 0) {
            eof = true;
        } else if (!WouldBlock(savedErrno)) {
            failed = true;
        }
    }

    if (received > 0) {
        Touch();
        if (messageCallback_) {
            messageCallback_(shared_from_this(), &input_);
        }
    }
    if (failed) {
        LOG_DEBUG << "read from " << name_ << " failed: "
                  << (tls_ ? TlsSession::LastError() : std::string(std::strerror(savedErrno)));
        OnHangup();
    } else if (eof) {
        OnHangup();
    }
}

bool TcpConnection::CanWriteNow() const {
    return !tls_ || tls_->established();
}

ssize_t TcpConnection::WriteSome(const char* data, size_t len, int* savedErrno) {
    if (tls_) {
        size_t wrote = 0;
        switch (tls_->Write(data, len, &wrote)) {
        case TlsSession::Io::kOk:
            return static_cast<ssize_t>(wrote);
        case TlsSession::Io::kWantRead:
        case TlsSession::Io::kWantWrite:
            return 0;
        case TlsSession::Io::kClosed:
        case TlsSession::Io::kFailed:
            break;
        }
        *savedErrno = EPIPE;
        return -1;
    }
    const ssize_t n = ::write(fd_, data, len);
    if (n >= 0) {
        return n;
    }
    if (WouldBlock(errno)) {
        return 0;
    }
    *savedErrno = errno;
    return -1;
}

void TcpConnection::OnWritable() {
    if (tls_ && !tls_->established() && !AdvanceHandshake()) {
        return;
    }
    if (output_.ReadableBytes() == 0) {
        // Armed only for the handshake or a TLS read that needed to write.
        channel_->DisableWriting();
        if (state_ == State::kDisconnecting) {
            ShutdownInLoop();
        }
        return;
    }

    int savedErrno = 0;
    const ssize_t n = WriteSome(output_.Peek(), output_.ReadableBytes(), &savedErrno);
    if (n < 0) {
        LOG_DEBUG << "write to " << name_ << " failed: " << std::strerror(savedErrno);
        OnHangup();
        return;
    }
    if (n == 0) {
        return;
    }
    Touch();
    output_.Retrieve(static_cast<size_t>(n));
    if (output_.ReadableBytes() > 0) {
        return;
    }
    channel_->DisableWriting();
    if (writeCompleteCallback_) {
        loop_->QueueInLoop([self = shared_from_this()]() { self->writeCompleteCallback_(self); });
    }
    if (state_ == State::kDisconnecting) {
        ShutdownInLoop();
    }
}

void TcpConnection::OnHangup() {
    if (state_ == State::kDisconnected) {
        return;
    }
    state_ = State::kDisconnected;
    channel_->DisableAll();

    TcpConnectionPtr self(shared_from_this());
    if (connectionCallback_) {
        connectionCallback_(self);
    }
    if (closeCallback_) {
        closeCallback_(self);
    }
}

void TcpConnection::OnError() {
    LOG_DEBUG << "connection " << name_ << " socket error: " << std::strerror(sockets::PendingError(fd_));
}

void TcpConnection::Send(const std::string& message) {
    Send(message.data(), message.size());
}

void TcpConnection::Send(const void* data, size_t len) {
    if (state_ != State::kConnected) {
        return;
    }
    if (loop_->IsInLoopThread()) {
        SendInLoop(static_cast<const char*>(data), len);
        return;
    }
    loop_->RunInLoop([self = shared_from_this(), bytes = std::string(static_cast<const char*>(data), len)]() {
        self->SendInLoop(bytes.data(), bytes.size());
    });
}

void TcpConnection::SendInLoop(const char* data, size_t len) {
    if (state_ == State::kDisconnected) {
        LOG_DEBUG << "dropping " << len << " bytes for closed connection " << name_;
        return;
    }
    if (len == 0) {
        return;
    }

    size_t written = 0;
    if (CanWriteNow() && !channel_->IsWriting() && output_.ReadableBytes() == 0) {
        int savedErrno = 0;
        const ssize_t n = WriteSome(data, len, &savedErrno);
        if (n < 0) {
            LOG_DEBUG << "write to " << name_ << " failed: " << std::strerror(savedErrno);
            // Close outside the caller's stack so it never sees the connection vanish mid-call.
            loop_->QueueInLoop([self = shared_from_this()]() { self->OnHangup(); });
            return;
        }
        written = static_cast<size_t>(n);
        if (written > 0) {
            Touch();
        }
        if (written == len) {
            if (writeCompleteCallback_) {
                loop_->QueueInLoop([self = shared_from_this()]() { self->writeCompleteCallback_(self); });
            }
            return;
        }
    }

    output_.Append(data + written, len - written);
    if (CanWriteNow() && !channel_->IsWriting()) {
        channel_->EnableWriting();
    }
}

void TcpConnection::Shutdown() {
    State expected = State::kConnected;
    if (state_.compare_exchange_strong(expected, State::kDisconnecting)) {
        loop_->RunInLoop([self = shared_from_this()]() { self->ShutdownInLoop(); });
    }
}

void TcpConnection::ShutdownInLoop() {
    if (channel_->IsWriting()) {
        return;
    }
    if (tls_) {
        tls_->Close();
    }
    sockets::ShutdownWrite(fd_);
}

void TcpConnection::ForceClose() {
    if (state_ == State::kDisconnected) {
        return;
    }
    loop_->RunInLoop([self = shared_from_this()]() { self->OnHangup(); });
}

void TcpConnection::StartRead() {
    loop_->RunInLoop([self = shared_from_this()]() {
        if (!self->reading_ && self->state_ != State::kDisconnected) {
            self->reading_ = true;
            self->channel_->EnableReading();
        }
    });
}

void TcpConnection::StopRead() {
    loop_->RunInLoop([self = shared_from_this()]() {
        if (self->reading_) {
            self->reading_ = false;
            self->channel_->DisableReading();
        }
    });
}

void TcpConnection::Touch() {
    lastActive_.store(std::chrono::steady_clock::now().time_since_epoch().count(), std::memory_order_relaxed);
}

std::chrono::steady_clock::time_point TcpConnection::lastActive() const {
    return std::chrono::steady_clock::time_point(
        std::chrono::steady_clock::duration(lastActive_.load(std::memory_order_relaxed)));
}

} // namespace network
} // namespace portico
