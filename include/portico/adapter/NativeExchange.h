#pragma once

#include "portico/adapter/Platform.h"

#include <cstddef>
#include <functional>
#include <string>

namespace portico {
namespace adapter {

enum class WriteResult {
    kOk,
    // Accepted, but the engine is holding more than it wants to; wait for OnWritable.
    kBackpressure,
    // The connection is gone; nothing was written.
    kFailed,
};

// One request/response exchange as a native engine exposes it. All callbacks are invoked
// on the engine thread that owns the exchange, and every method except Post must be
// called on that thread.
class NativeExchange {
public:
    using DataCallback = std::function<void(const char* data, size_t len, bool last)>;
    using HeaderVisitor = std::function<void(const std::string& name, const std::string& value)>;
    using Task = std::function<void()>;

    virtual ~NativeExchange() = default;

    // Request metadata, as received.
    virtual std::string method() const = 0;
    virtual std::string rawPath() const = 0;
    // Without the leading '?'.
    virtual std::string rawQuery() const = 0;
    virtual void ForEachHeader(const HeaderVisitor& visitor) const = 0;
    // 4 or 16 bytes in network order, or empty.
    virtual std::string peerAddressBytes() const = 0;
    virtual bool tls() const = 0;
    virtual Platform platform() = 0;

    // Request body events. Data that arrived before registration is replayed.
    virtual void OnData(DataCallback cb) = 0;
    virtual void OnAborted(Task cb) = 0;
    virtual void PauseBody() = 0;
    virtual void ResumeBody() = 0;

    // Response. Writes issued inside cb go out as one unit.
    virtual void Cork(const Task& cb) = 0;
    virtual void WriteStatus(int status, const std::string& reason) = 0;
    virtual void WriteHeader(const std::string& name, const std::string& value) = 0;
    virtual WriteResult Write(const std::string& chunk) = 0;
    // Final write; completes the response.
    virtual WriteResult End(const std::string& chunk) = 0;
    // Runs cb once the engine can take more data.
    virtual void OnWritable(Task cb) = 0;

    // Schedules task on the owning thread. Safe from any thread.
    virtual void Post(Task task) = 0;
    // Hands the request to the engine's default handling.
    virtual void PassThrough() = 0;
    // Drops the connection without completing the response.
    virtual void Close() = 0;
};

} // namespace adapter
} // namespace portico
