#pragma once

#include "portico/common/noncopyable.h"
#include "portico/network/Buffer.h"
#include "portico/network/Callbacks.h"
#include "portico/network/InetAddress.h"

#include <any>
#include <atomic>
#include <chrono>
#include <memory>
#include <string>

namespace portico {
namespace network {

class Channel;
class EventLoop;
class TlsContext;
class TlsSession;

// One accepted socket, bound to a single loop. Owns the fd.
// When constructed with a TlsContext the first bytes decide between TLS and plaintext.
class TcpConnection : portico::common::noncopyable,
                      public std::enable_shared_from_this<TcpConnection> {
public:
    TcpConnection(EventLoop* loop,
                  std::string name,
                  int fd,
                  const InetAddress& localAddr,
                  const InetAddress& peerAddr,
                  std::shared_ptr<TlsContext> tls = nullptr);
    ~TcpConnection();

    EventLoop* getLoop() const { return loop_; }
    const std::string& name() const { return name_; }
    const InetAddress& localAddress() const { return localAddr_; }
    const InetAddress& peerAddress() const { return peerAddr_; }
    bool connected() const { return state_ == State::kConnected; }
    // Loop thread only.
    bool tlsEstablished() const;

    void SetContext(const std::any& context) { context_ = context; }
    std::any* GetMutableContext() { return &context_; }

    // Loop thread only.
    Buffer* inputBuffer() { return &input_; }
    size_t outputBytes() const { return output_.ReadableBytes(); }
    bool reading() const { return reading_; }

    // Thread safe.
    void Send(const std::string& message);
    void Send(const void* data, size_t len);
    // Half-closes once the queued output has been written.
    void Shutdown();
    void ForceClose();
    void StartRead();
    void StopRead();

    std::chrono::steady_clock::time_point lastActive() const;

    void SetConnectionCallback(ConnectionCallback cb) { connectionCallback_ = std::move(cb); }
    void SetMessageCallback(MessageCallback cb) { messageCallback_ = std::move(cb); }
    void SetWriteCompleteCallback(WriteCompleteCallback cb) { writeCompleteCallback_ = std::move(cb); }
    void SetCloseCallback(CloseCallback cb) { closeCallback_ = std::move(cb); }

    // TcpServer drives these on the connection's loop.
    void ConnectEstablished();
    void ConnectDestroyed();

private:
    enum class State { kConnecting, kConnected, kDisconnecting, kDisconnected };

    void OnReadable();
    void OnWritable();
    void OnHangup();
    void OnError();

    // false once the connection has been closed or the handshake is still running.
    bool DetectTls();
    bool AdvanceHandshake();
    // Bytes written, 0 when the socket would block, -1 on a dead peer.
    ssize_t WriteSome(const char* data, size_t len, int* savedErrno);
    bool CanWriteNow() const;

    void SendInLoop(const char* data, size_t len);
    void ShutdownInLoop();
    void Touch();

    EventLoop* loop_;
    const std::string name_;
    const int fd_;
    std::atomic<State> state_{State::kConnecting};
    bool reading_{true};
    std::unique_ptr<Channel> channel_;

    const InetAddress localAddr_;
    const InetAddress peerAddr_;

    // Set until the first bytes tell TLS from plaintext.
    std::shared_ptr<TlsContext> tlsContext_;
    std::unique_ptr<TlsSession> tls_;

    ConnectionCallback connectionCallback_;
    MessageCallback messageCallback_;
    WriteCompleteCallback writeCompleteCallback_;
    CloseCallback closeCallback_;

    Buffer input_;
    Buffer output_;
    std::any context_;

    std::atomic<std::chrono::steady_clock::rep> lastActive_;
};

} // namespace network
} // namespace portico
