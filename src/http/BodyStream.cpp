#include "portico/http/BodyStream.h"
#include "portico/http/Errors.h"

#include <limits>

namespace portico {
namespace http {

BodyStream::BodyStream(size_t highWaterMark)
    : highWaterMark_(highWaterMark > 0 ? highWaterMark : kDefaultHighWaterMark) {}

std::shared_ptr<BodyStream> BodyStream::FromChunks(const std::vector<std::string>& chunks) {
    auto stream = std::make_shared<BodyStream>(std::numeric_limits<size_t>::max());
    for (const auto& chunk : chunks) {
        stream->Push(chunk);
    }
    stream->Close();
    return stream;
}

bool BodyStream::Push(std::string chunk) {
    ReadCallback reader;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || cancelled_ || error_) return false;
        if (chunk.empty()) return true;
        if (collecting_) {
            collected_.append(chunk);
            return true;
        }
        if (pendingRead_ && queue_.empty()) {
            reader.swap(pendingRead_);
        } else {
            buffered_ += chunk.size();
            queue_.push_back(std::move(chunk));
            if (buffered_ >= highWaterMark_) wasFull_ = true;
            return true;
        }
    }
    reader(ReadResult{ReadStatus::kChunk, std::move(chunk), nullptr});
    return true;
}

void BodyStream::Close() {
    ReadCallback reader;
    ReadAllCallback collectDone;
    std::string collected;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || cancelled_ || error_) return;
        closed_ = true;
        if (collecting_) {
            collectDone.swap(collectDone_);
            collected.swap(collected_);
            collecting_ = false;
            endDelivered_ = true;
        } else if (pendingRead_) {
            reader.swap(pendingRead_);
            endDelivered_ = true;
        }
    }
    if (collectDone) collectDone(std::move(collected), nullptr);
    if (reader) reader(ReadResult{ReadStatus::kEnd, std::string(), nullptr});
}

void BodyStream::Fail(std::exception_ptr error) {
    ReadCallback reader;
    ReadAllCallback collectDone;
    DrainCallback drain;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_ || error_ || endDelivered_) return;
        error_ = error;
        queue_.clear();
        buffered_ = 0;
        if (wasFull_) {
            wasFull_ = false;
            drain = drainCallback_;
        }
        if (collecting_) {
            collectDone.swap(collectDone_);
            collected_.clear();
            collecting_ = false;
        } else if (pendingRead_) {
            reader.swap(pendingRead_);
        }
    }
    if (drain) drain();
    if (collectDone) collectDone(std::string(), error);
    if (reader) reader(ReadResult{ReadStatus::kError, std::string(), error});
}

bool BodyStream::full() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buffered_ >= highWaterMark_;
}

void BodyStream::SetDrainCallback(DrainCallback cb) {
    std::lock_guard<std::mutex> lock(mutex_);
    drainCallback_ = std::move(cb);
}

void BodyStream::Read(ReadCallback cb) {
    ReadResult result{ReadStatus::kEnd, std::string(), nullptr};
    DrainCallback drain;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_) throw StreamUsageError("body stream was cancelled");
        if (collecting_) throw StreamUsageError("body stream is being collected");
        if (endDelivered_) throw StreamUsageError("body stream already exhausted");
        if (pendingRead_) throw StreamUsageError("body stream already has a pending read");
        started_ = true;

        if (error_) {
            result = ReadResult{ReadStatus::kError, std::string(), error_};
        } else if (!queue_.empty()) {
            result.status = ReadStatus::kChunk;
            result.data = std::move(queue_.front());
            queue_.pop_front();
            buffered_ -= result.data.size();
            if (wasFull_ && buffered_ < highWaterMark_) {
                wasFull_ = false;
                drain = drainCallback_;
            }
        } else if (closed_) {
            endDelivered_ = true;
        } else {
            pendingRead_ = std::move(cb);
            return;
        }
    }
    if (drain) drain();
    cb(std::move(result));
}

void BodyStream::ReadAll(ReadAllCallback done) {
    std::string body;
    std::exception_ptr error;
    DrainCallback drain;
    bool finished = true;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (started_ || cancelled_) throw StreamUsageError("body stream already consumed");
        started_ = true;
        for (auto& chunk : queue_) body.append(chunk);
        queue_.clear();
        buffered_ = 0;
        if (wasFull_) {
            wasFull_ = false;
            drain = drainCallback_;
        }
        if (error_) {
            error = error_;
            body.clear();
        } else if (closed_) {
            endDelivered_ = true;
        } else {
            collecting_ = true;
            collected_.swap(body);
            collectDone_ = std::move(done);
            finished = false;
        }
    }
    if (drain) drain();
    if (finished && done) done(std::move(body), error);
}

void BodyStream::Cancel() {
    ReadCallback dropped;
    ReadAllCallback droppedCollect;
    DrainCallback drain;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_) return;
        cancelled_ = true;
        queue_.clear();
        buffered_ = 0;
        collected_.clear();
        collecting_ = false;
        dropped.swap(pendingRead_);
        droppedCollect.swap(collectDone_);
        if (wasFull_) {
            wasFull_ = false;
            drain = drainCallback_;
        }
    }
    if (drain) drain();
}

bool BodyStream::started() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return started_;
}

bool BodyStream::cancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
}

size_t BodyStream::bufferedBytes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buffered_;
}

} // namespace http
} // namespace portico
