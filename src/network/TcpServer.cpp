#include "portico/network/TcpServer.h"
#include "portico/network/Acceptor.h"
#include "portico/network/SocketOps.h"
#include "portico/network/TlsContext.h"
#include "portico/common/Logger.h"

#include <algorithm>
#include <vector>

namespace portico {
namespace network {

namespace {

// How often idle connections are looked for, relative to the timeout.
constexpr int kSweepsPerTimeout = 4;
constexpr std::chrono::milliseconds kMinSweepInterval(100);

} // namespace

TcpServer::TcpServer(EventLoop* loop, const InetAddress& listenAddr, std::string name, bool reusePort)
    : loop_(loop),
      name_(std::move(name)),
      hostport_(listenAddr.toIpPort()),
      acceptor_(new Acceptor(loop, listenAddr, reusePort)),
      pool_(loop, name_) {
    acceptor_->SetNewConnectionCallback([this](int fd, const InetAddress& peer) { OnAccept(fd, peer); });
}

TcpServer::~TcpServer() {
    if (sweepTimer_ != 0) {
        loop_->CancelTimer(sweepTimer_);
    }
    for (auto& entry : connections_) {
        TcpConnectionPtr conn = std::move(entry.second);
        conn->getLoop()->RunInLoop([conn]() { conn->ConnectDestroyed(); });
    }
}

bool TcpServer::EnableTls(const std::string& certPath, const std::string& keyPath) {
    tls_ = TlsContext::Load(certPath, keyPath);
    return tls_ != nullptr;
}

bool TcpServer::Start() {
    if (started_) {
        return true;
    }
    if (!acceptor_->Listen()) {
        return false;
    }
    started_ = true;
    pool_.Start(threads_);
    if (idleTimeout_.count() > 0) {
        ScheduleSweep();
    }
    return true;
}

void TcpServer::CloseAll() {
    std::vector<TcpConnectionPtr> live;
    live.reserve(connections_.size());
    for (const auto& entry : connections_) {
        live.push_back(entry.second);
    }
    for (const TcpConnectionPtr& conn : live) {
        conn->ForceClose();
    }
}

void TcpServer::ScheduleSweep() {
    const auto interval = std::max(idleTimeout_ / kSweepsPerTimeout, kMinSweepInterval);
    sweepTimer_ = loop_->RunAfter(interval, [this]() {
        SweepIdle();
        ScheduleSweep();
    });
}

void TcpServer::SweepIdle() {
    const auto cutoff = std::chrono::steady_clock::now() - idleTimeout_;
    std::vector<TcpConnectionPtr> idle;
    for (const auto& entry : connections_) {
        if (entry.second->lastActive() < cutoff) {
            idle.push_back(entry.second);
        }
    }
    for (const TcpConnectionPtr& conn : idle) {
        LOG_INFO << "closing idle connection " << conn->name() << " from " << conn->peerAddress().toIpPort();
        conn->ForceClose();
    }
}

void TcpServer::OnAccept(int fd, const InetAddress& peer) {
    if (maxConnections_ > 0 && connections_.size() >= static_cast<size_t>(maxConnections_)) {
        LOG_WARN << name_ << " refusing " << peer.toIpPort() << ": " << connections_.size()
                 << " connections open, limit " << maxConnections_;
        sockets::Close(fd);
        return;
    }

    const std::uint64_t id = nextId_++;
    EventLoop* ioLoop = pool_.GetNextLoop();
    auto conn = std::make_shared<TcpConnection>(ioLoop, name_ + "#" + std::to_string(id), fd,
                                                sockets::LocalAddress(fd), peer, tls_);
    conn->SetConnectionCallback(connectionCallback_);
    conn->SetMessageCallback(messageCallback_);
    conn->SetWriteCompleteCallback(writeCompleteCallback_);
    conn->SetCloseCallback([this, id](const TcpConnectionPtr& c) { OnClosed(c, id); });
    connections_[id] = conn;

    LOG_DEBUG << "accepted " << conn->name() << " from " << peer.toIpPort();
    ioLoop->RunInLoop([conn]() { conn->ConnectEstablished(); });
}

void TcpServer::OnClosed(const TcpConnectionPtr& conn, std::uint64_t id) {
    // Runs on the I/O loop inside the connection's own callback; unregister on the base loop,
    // then destroy back on the I/O loop once the callback has returned.
    loop_->RunInLoop([this, conn, id]() {
        connections_.erase(id);
        conn->getLoop()->QueueInLoop([conn]() { conn->ConnectDestroyed(); });
    });
}

} // namespace network
} // namespace portico
