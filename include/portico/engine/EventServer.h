#pragma once

#include "portico/common/noncopyable.h"
#include "portico/network/Callbacks.h"
#include "portico/network/InetAddress.h"
#include "portico/network/TcpServer.h"

#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace portico {
namespace common {
class Config;
} // namespace common

namespace network {
class Buffer;
class EventLoop;
} // namespace network

namespace engine {

class EventExchange;

struct EventServerOptions {
    network::InetAddress listenAddr{8080};
    std::string name{"portico"};
    int threads{0};
    bool reusePort{false};
    int maxConnections{0};
    double idleTimeoutSec{0.0};
    // Pending output above which writes report backpressure.
    size_t writeHighWaterMark{64 * 1024};

    // [global] listen_addr, listen_port, threads, reuse_port and [connection_limit].
    static EventServerOptions FromConfig(const common::Config& config);
};

// HTTP/1.x front end over TcpServer. Every parsed request head becomes an EventExchange
// handed to the request callback; requests on one connection are served one at a time.
class EventServer : portico::common::noncopyable {
public:
    using RequestCallback = std::function<void(const std::shared_ptr<EventExchange>&)>;

    EventServer(network::EventLoop* loop, const EventServerOptions& options);
    ~EventServer();

    void SetRequestCallback(RequestCallback cb) { requestCallback_ = std::move(cb); }
    bool EnableTls(const std::string& certPemPath, const std::string& keyPemPath);

    // Base loop thread. false if the listener could not be bound.
    bool Start();
    // Drops every open connection; in-flight exchanges see an abort.
    void CloseAll();

    network::EventLoop* getLoop() const { return loop_; }
    network::TcpServer& tcpServer() { return server_; }
    const EventServerOptions& options() const { return options_; }

private:
    struct Session;

    void OnConnection(const network::TcpConnectionPtr& conn);
    void OnWriteComplete(const network::TcpConnectionPtr& conn);
    void ProcessInput(const network::TcpConnectionPtr& conn);
    void StartExchange(const network::TcpConnectionPtr& conn, Session* session);

    static Session* GetSession(const network::TcpConnectionPtr& conn);

    network::EventLoop* loop_;
    EventServerOptions options_;
    network::TcpServer server_;
    RequestCallback requestCallback_;
};

} // namespace engine
} // namespace portico
