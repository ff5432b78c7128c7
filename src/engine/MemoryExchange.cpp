#include "portico/engine/MemoryExchange.h"
#include "portico/http/Headers.h"

namespace portico {
namespace engine {

std::shared_ptr<MemoryExchange> MemoryExchange::Create(const std::string& method,
                                                       const std::string& path,
                                                       const std::string& query) {
    return std::make_shared<MemoryExchange>(method, path, query);
}

MemoryExchange::MemoryExchange(std::string method, std::string path, std::string query)
    : method_(std::move(method)),
      path_(std::move(path)),
      query_(std::move(query)) {}

MemoryExchange& MemoryExchange::AddHeader(const std::string& name, const std::string& value) {
    headers_.emplace_back(name, value);
    return *this;
}

MemoryExchange& MemoryExchange::SetPeerAddress(const std::string& bytes) {
    peerBytes_ = bytes;
    return *this;
}

MemoryExchange& MemoryExchange::SetTls(bool tls) {
    tls_ = tls;
    return *this;
}

void MemoryExchange::ForEachHeader(const HeaderVisitor& visitor) const {
    for (const auto& h : headers_) {
        visitor(h.first, h.second);
    }
}

adapter::Platform MemoryExchange::platform() {
    adapter::MemoryPlatform p;
    p.exchange = shared_from_this();
    return p;
}

void MemoryExchange::PushBody(const std::string& chunk, bool last) {
    if (aborted_) return;
    if (dataCallback_) {
        dataCallback_(chunk.data(), chunk.size(), last);
    } else {
        earlyBody_.emplace_back(chunk, last);
    }
}

void MemoryExchange::OnData(DataCallback cb) {
    dataCallback_ = std::move(cb);
    std::vector<std::pair<std::string, bool>> early;
    early.swap(earlyBody_);
    for (const auto& piece : early) {
        dataCallback_(piece.first.data(), piece.first.size(), piece.second);
    }
}

void MemoryExchange::TriggerAbort() {
    if (aborted_) return;
    aborted_ = true;
    writableCallback_ = nullptr;
    Task cb;
    cb.swap(abortCallback_);
    if (cb) cb();
}

bool MemoryExchange::MakeWritable() {
    if (!writableCallback_) return false;
    Task cb;
    cb.swap(writableCallback_);
    cb();
    return true;
}

size_t MemoryExchange::RunPending() {
    size_t ran = 0;
    while (true) {
        Task task;
        {
            std::lock_guard<std::mutex> lock(taskMutex_);
            if (tasks_.empty()) break;
            task = std::move(tasks_.front());
            tasks_.pop_front();
        }
        task();
        ++ran;
    }
    return ran;
}

size_t MemoryExchange::CountCalls(CallKind kind) const {
    size_t n = 0;
    for (const auto& c : calls_) {
        if (c.kind == kind) ++n;
    }
    return n;
}

std::vector<std::string> MemoryExchange::HeaderValues(const std::string& name) const {
    const std::string key = http::Headers::ToLower(name);
    std::vector<std::string> values;
    for (const auto& h : responseHeaders_) {
        if (http::Headers::ToLower(h.first) == key) values.push_back(h.second);
    }
    return values;
}

void MemoryExchange::PauseBody() {
    paused_ = true;
    calls_.push_back(Call{CallKind::kPause, std::string(), std::string()});
}

void MemoryExchange::ResumeBody() {
    paused_ = false;
    calls_.push_back(Call{CallKind::kResume, std::string(), std::string()});
}

void MemoryExchange::Cork(const Task& cb) {
    calls_.push_back(Call{CallKind::kCorkBegin, std::string(), std::string()});
    cb();
    calls_.push_back(Call{CallKind::kCorkEnd, std::string(), std::string()});
}

void MemoryExchange::WriteStatus(int status, const std::string& reason) {
    status_ = status;
    reason_ = reason;
    calls_.push_back(Call{CallKind::kStatus, std::to_string(status), reason});
}

void MemoryExchange::WriteHeader(const std::string& name, const std::string& value) {
    responseHeaders_.emplace_back(name, value);
    calls_.push_back(Call{CallKind::kHeader, name, value});
}

adapter::WriteResult MemoryExchange::Write(const std::string& chunk) {
    calls_.push_back(Call{CallKind::kWrite, chunk, std::string()});
    if (writeResult_ != adapter::WriteResult::kFailed) body_.append(chunk);
    return writeResult_;
}

adapter::WriteResult MemoryExchange::End(const std::string& chunk) {
    calls_.push_back(Call{CallKind::kEnd, chunk, std::string()});
    if (writeResult_ != adapter::WriteResult::kFailed) {
        body_.append(chunk);
        ended_ = true;
    }
    return writeResult_;
}

void MemoryExchange::Post(Task task) {
    std::lock_guard<std::mutex> lock(taskMutex_);
    tasks_.push_back(std::move(task));
}

void MemoryExchange::PassThrough() {
    passedThrough_ = true;
    calls_.push_back(Call{CallKind::kPassThrough, std::string(), std::string()});
}

void MemoryExchange::Close() {
    closed_ = true;
    calls_.push_back(Call{CallKind::kClose, std::string(), std::string()});
}

} // namespace engine
} // namespace portico
