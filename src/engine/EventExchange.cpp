#include "portico/engine/EventExchange.h"
#include "portico/network/EventLoop.h"
#include "portico/network/TcpConnection.h"
#include "portico/common/Logger.h"

namespace portico {
namespace engine {

EventExchange::EventExchange(const network::TcpConnectionPtr& conn,
                             const protocol::RequestHead& head,
                             size_t writeHighWaterMark)
    : conn_(conn),
      loop_(conn->getLoop()),
      head_(head),
      peerBytes_(conn->peerAddress().toBytes()),
      tls_(conn->tlsEstablished()),
      writeHighWaterMark_(writeHighWaterMark),
      framer_(head.version(), head.isHead(), head.keepAlive()) {}

void EventExchange::ForEachHeader(const HeaderVisitor& visitor) const {
    for (const auto& h : head_.headers()) {
        visitor(h.first, h.second);
    }
}

adapter::Platform EventExchange::platform() {
    adapter::EventPlatform p;
    p.exchange = shared_from_this();
    p.connection = conn_.lock();
    return p;
}

void EventExchange::OnData(DataCallback cb) {
    dataCallback_ = std::move(cb);
    std::vector<std::pair<std::string, bool>> early;
    early.swap(earlyBody_);
    for (const auto& piece : early) {
        if (!dataCallback_) break;
        dataCallback_(piece.first.data(), piece.first.size(), piece.second);
    }
}

void EventExchange::DeliverBody(const char* data, size_t len, bool last) {
    if (bodyComplete_) return;
    if (last) bodyComplete_ = true;
    if (aborted_) return;
    if (dataCallback_) {
        dataCallback_(data, len, last);
    } else {
        earlyBody_.emplace_back(std::string(data, len), last);
    }
}

void EventExchange::PauseBody() {
    if (paused_ || bodyComplete_) return;
    auto conn = conn_.lock();
    if (!conn) return;
    paused_ = true;
    conn->StopRead();
}

void EventExchange::ResumeBody() {
    if (!paused_) return;
    paused_ = false;
    if (auto conn = conn_.lock()) conn->StartRead();
}

void EventExchange::Cork(const Task& cb) {
    ++corkDepth_;
    cb();
    if (--corkDepth_ == 0 && !corked_.empty()) {
        std::string out;
        out.swap(corked_);
        Send(out);
    }
}

void EventExchange::Send(const std::string& bytes) {
    if (bytes.empty()) return;
    if (corkDepth_ > 0) {
        corked_.append(bytes);
        return;
    }
    if (auto conn = conn_.lock()) conn->Send(bytes);
}

adapter::WriteResult EventExchange::Status() const {
    auto conn = conn_.lock();
    if (!conn || !conn->connected() || aborted_) return adapter::WriteResult::kFailed;
    if (conn->outputBytes() + corked_.size() > writeHighWaterMark_) {
        return adapter::WriteResult::kBackpressure;
    }
    return adapter::WriteResult::kOk;
}

void EventExchange::WriteStatus(int status, const std::string& reason) {
    framer_.setStatus(status, reason);
}

void EventExchange::WriteHeader(const std::string& name, const std::string& value) {
    framer_.addHeader(name, value);
}

adapter::WriteResult EventExchange::Write(const std::string& chunk) {
    if (finished_ || aborted_) return adapter::WriteResult::kFailed;
    Send(framer_.write(chunk));
    return Status();
}

adapter::WriteResult EventExchange::End(const std::string& chunk) {
    if (finished_ || aborted_) return adapter::WriteResult::kFailed;
    Send(framer_.end(chunk));
    const adapter::WriteResult result = Status();
    finished_ = true;
    writableCallback_ = nullptr;
    if (completeCallback_) {
        // The parser may be mid-call; let the server move on from a fresh stack.
        loop_->QueueInLoop(completeCallback_);
    }
    return result;
}

void EventExchange::OnWritable(Task cb) {
    if (finished_ || aborted_) return;
    auto conn = conn_.lock();
    if (!conn) return;
    if (conn->outputBytes() <= writeHighWaterMark_) {
        loop_->QueueInLoop(std::move(cb));
        return;
    }
    writableCallback_ = std::move(cb);
}

void EventExchange::NotifyWritable() {
    if (!writableCallback_) return;
    Task cb;
    cb.swap(writableCallback_);
    cb();
}

void EventExchange::Post(Task task) {
    loop_->QueueInLoop(std::move(task));
}

void EventExchange::PassThrough() {
    if (finished_ || aborted_) return;
    framer_.setStatus(404, "Not Found");
    framer_.addHeader("content-type", "text/plain;charset=UTF-8");
    Send(framer_.end("Not Found"));
    finished_ = true;
    if (completeCallback_) loop_->QueueInLoop(completeCallback_);
}

void EventExchange::Close() {
    if (aborted_) return;
    finished_ = true;
    writableCallback_ = nullptr;
    dataCallback_ = nullptr;
    if (auto conn = conn_.lock()) {
        LOG_DEBUG << "EventExchange closing " << conn->name() << " mid-response";
        conn->ForceClose();
    }
}

void EventExchange::Abort() {
    if (aborted_ || finished_) return;
    aborted_ = true;
    writableCallback_ = nullptr;
    dataCallback_ = nullptr;
    Task cb;
    cb.swap(abortCallback_);
    if (cb) cb();
}

} // namespace engine
} // namespace portico
