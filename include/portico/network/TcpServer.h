#pragma once

#include "portico/common/noncopyable.h"
#include "portico/network/Callbacks.h"
#include "portico/network/EventLoop.h"
#include "portico/network/EventLoopThreadPool.h"
#include "portico/network/InetAddress.h"
#include "portico/network/TcpConnection.h"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>

namespace portico {
namespace network {

class Acceptor;
class TlsContext;

// Accepts on the base loop and hands each connection to one of the I/O loops.
// Configure before Start(); all other members are base loop only.
class TcpServer : portico::common::noncopyable {
public:
    TcpServer(EventLoop* loop, const InetAddress& listenAddr, std::string name, bool reusePort = false);
    ~TcpServer();

    const std::string& name() const { return name_; }
    const std::string& hostport() const { return hostport_; }
    bool tlsEnabled() const { return tls_ != nullptr; }

    void SetThreadNum(int threads) { threads_ = threads; }
    // 0 means unlimited.
    void SetMaxConnections(int maxConnections) { maxConnections_ = maxConnections; }
    // Connections silent for longer than timeout are closed. Zero disables the sweep.
    void SetIdleTimeout(std::chrono::milliseconds timeout) { idleTimeout_ = timeout; }
    // Serves TLS and plaintext on the same port, told apart by the first byte a client sends.
    bool EnableTls(const std::string& certPath, const std::string& keyPath);

    // false if the listener could not be bound.
    bool Start();
    void CloseAll();

    void SetConnectionCallback(ConnectionCallback cb) { connectionCallback_ = std::move(cb); }
    void SetMessageCallback(MessageCallback cb) { messageCallback_ = std::move(cb); }
    void SetWriteCompleteCallback(WriteCompleteCallback cb) { writeCompleteCallback_ = std::move(cb); }

private:
    void OnAccept(int fd, const InetAddress& peer);
    void OnClosed(const TcpConnectionPtr& conn, std::uint64_t id);
    void ScheduleSweep();
    void SweepIdle();

    EventLoop* loop_;
    const std::string name_;
    const std::string hostport_;
    std::unique_ptr<Acceptor> acceptor_;
    EventLoopThreadPool pool_;
    std::shared_ptr<TlsContext> tls_;

    int threads_{0};
    int maxConnections_{0};
    std::chrono::milliseconds idleTimeout_{0};
    EventLoop::TimerId sweepTimer_{0};
    bool started_{false};

    std::uint64_t nextId_{1};
    std::unordered_map<std::uint64_t, TcpConnectionPtr> connections_;

    ConnectionCallback connectionCallback_;
    MessageCallback messageCallback_;
    WriteCompleteCallback writeCompleteCallback_;
};

} // namespace network
} // namespace portico
