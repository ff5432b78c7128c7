#pragma once

#include "portico/adapter/NativeExchange.h"
#include "portico/network/Callbacks.h"
#include "portico/protocol/RequestHead.h"
#include "portico/protocol/ResponseFramer.h"

#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace portico {
namespace network {
class EventLoop;
} // namespace network

namespace engine {

// One HTTP/1.x request on a TcpConnection, seen through the native binding interface.
// Lives on the connection's loop thread.
class EventExchange : public adapter::NativeExchange,
                      public std::enable_shared_from_this<EventExchange> {
public:
    EventExchange(const network::TcpConnectionPtr& conn,
                  const protocol::RequestHead& head,
                  size_t writeHighWaterMark);

    // NativeExchange
    std::string method() const override { return head_.method(); }
    std::string rawPath() const override { return head_.path(); }
    std::string rawQuery() const override { return head_.query(); }
    void ForEachHeader(const HeaderVisitor& visitor) const override;
    std::string peerAddressBytes() const override { return peerBytes_; }
    bool tls() const override { return tls_; }
    adapter::Platform platform() override;

    void OnData(DataCallback cb) override;
    void OnAborted(Task cb) override { abortCallback_ = std::move(cb); }
    void PauseBody() override;
    void ResumeBody() override;

    void Cork(const Task& cb) override;
    void WriteStatus(int status, const std::string& reason) override;
    void WriteHeader(const std::string& name, const std::string& value) override;
    adapter::WriteResult Write(const std::string& chunk) override;
    adapter::WriteResult End(const std::string& chunk) override;
    void OnWritable(Task cb) override;

    void Post(Task task) override;
    void PassThrough() override;
    void Close() override;

    // Engine side.
    void DeliverBody(const char* data, size_t len, bool last);
    // Connection lost. Fires the abort callback once, unless the response already finished.
    void Abort();
    // Output buffer drained.
    void NotifyWritable();
    // Runs on the loop once the response is complete.
    void SetCompleteCallback(std::function<void()> cb) { completeCallback_ = std::move(cb); }

    const protocol::RequestHead& head() const { return head_; }
    bool responseFinished() const { return finished_; }
    bool aborted() const { return aborted_; }
    bool closeAfter() const { return framer_.closeAfter(); }

private:
    void Send(const std::string& bytes);
    adapter::WriteResult Status() const;

    std::weak_ptr<network::TcpConnection> conn_;
    network::EventLoop* loop_;
    const protocol::RequestHead head_;
    const std::string peerBytes_;
    const bool tls_;
    const size_t writeHighWaterMark_;
    protocol::ResponseFramer framer_;

    DataCallback dataCallback_;
    std::vector<std::pair<std::string, bool>> earlyBody_;
    bool bodyComplete_{false};
    Task abortCallback_;
    Task writableCallback_;
    std::function<void()> completeCallback_;

    int corkDepth_{0};
    std::string corked_;

    bool finished_{false};
    bool aborted_{false};
    bool paused_{false};
};

} // namespace engine
} // namespace portico
