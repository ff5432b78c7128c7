#pragma once

#include <functional>
#include <memory>

namespace portico {
namespace network {

class Buffer;
class TcpConnection;

using TcpConnectionPtr = std::shared_ptr<TcpConnection>;

// Fired on connect and again on disconnect; check connected() to tell them apart.
using ConnectionCallback = std::function<void(const TcpConnectionPtr&)>;
using CloseCallback = std::function<void(const TcpConnectionPtr&)>;
using WriteCompleteCallback = std::function<void(const TcpConnectionPtr&)>;
// New bytes are in the buffer; consume what can be parsed and leave the rest.
using MessageCallback = std::function<void(const TcpConnectionPtr&, Buffer*)>;
using TimerCallback = std::function<void()>;

} // namespace network
} // namespace portico
