#pragma once

#include "portico/adapter/NativeExchange.h"

#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace portico {
namespace engine {

// Native exchange without a network. The host plays the client: it describes the request,
// feeds body chunks, raises aborts, backpressure and write failures, runs posted tasks,
// and inspects every native call the adapter made.
//
// Not thread safe apart from Post; drive it from one thread.
class MemoryExchange : public adapter::NativeExchange,
                       public std::enable_shared_from_this<MemoryExchange> {
public:
    enum class CallKind {
        kCorkBegin,
        kCorkEnd,
        kStatus,
        kHeader,
        kWrite,
        kEnd,
        kPassThrough,
        kClose,
        kPause,
        kResume,
    };

    struct Call {
        CallKind kind;
        std::string first;
        std::string second;
    };

    static std::shared_ptr<MemoryExchange> Create(const std::string& method,
                                                  const std::string& path,
                                                  const std::string& query = std::string());

    MemoryExchange(std::string method, std::string path, std::string query);

    // Request description, before the adapter serves the exchange.
    MemoryExchange& AddHeader(const std::string& name, const std::string& value);
    MemoryExchange& SetPeerAddress(const std::string& bytes);
    MemoryExchange& SetTls(bool tls);

    // Client side.
    void PushBody(const std::string& chunk, bool last);
    // Fires the abort callback once.
    void TriggerAbort();
    // Result reported by the following Write/End calls.
    void SetWriteResult(adapter::WriteResult result) { writeResult_ = result; }
    // Fires a pending writability callback.
    bool MakeWritable();
    // Runs posted tasks until none are left. Returns how many ran.
    size_t RunPending();

    // Inspection.
    const std::vector<Call>& calls() const { return calls_; }
    size_t CountCalls(CallKind kind) const;
    int status() const { return status_; }
    const std::string& reason() const { return reason_; }
    std::vector<std::string> HeaderValues(const std::string& name) const;
    // Bytes passed to Write and End, in order.
    const std::string& body() const { return body_; }
    bool ended() const { return ended_; }
    bool passedThrough() const { return passedThrough_; }
    bool closed() const { return closed_; }
    bool paused() const { return paused_; }
    bool hasWritableCallback() const { return static_cast<bool>(writableCallback_); }

    // NativeExchange
    std::string method() const override { return method_; }
    std::string rawPath() const override { return path_; }
    std::string rawQuery() const override { return query_; }
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
    void OnWritable(Task cb) override { writableCallback_ = std::move(cb); }

    void Post(Task task) override;
    void PassThrough() override;
    void Close() override;

private:
    const std::string method_;
    const std::string path_;
    const std::string query_;
    std::vector<std::pair<std::string, std::string>> headers_;
    std::string peerBytes_;
    bool tls_{false};

    DataCallback dataCallback_;
    std::vector<std::pair<std::string, bool>> earlyBody_;
    Task abortCallback_;
    Task writableCallback_;
    bool aborted_{false};

    adapter::WriteResult writeResult_{adapter::WriteResult::kOk};
    std::vector<Call> calls_;
    int status_{0};
    std::string reason_;
    std::vector<std::pair<std::string, std::string>> responseHeaders_;
    std::string body_;
    bool ended_{false};
    bool passedThrough_{false};
    bool closed_{false};
    bool paused_{false};

    std::mutex taskMutex_;
    std::deque<Task> tasks_;
};

} // namespace engine
} // namespace portico
