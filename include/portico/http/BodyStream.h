#pragma once

#include "portico/common/noncopyable.h"

#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace portico {
namespace http {

// Single-producer, single-consumer byte stream bridging push-style chunk callbacks to a
// pull-style reader. The producer pushes chunks and finally closes or fails the stream;
// the consumer issues one Read at a time. Callbacks run on whichever thread completes
// them, never under the stream's lock.
class BodyStream : portico::common::noncopyable,
                   public std::enable_shared_from_this<BodyStream> {
public:
    enum class ReadStatus { kChunk, kEnd, kError };

    struct ReadResult {
        ReadStatus status;
        std::string data;
        std::exception_ptr error;
    };

    using ReadCallback = std::function<void(ReadResult)>;
    using ReadAllCallback = std::function<void(std::string body, std::exception_ptr error)>;
    using DrainCallback = std::function<void()>;

    static constexpr size_t kDefaultHighWaterMark = 64 * 1024;

    explicit BodyStream(size_t highWaterMark = kDefaultHighWaterMark);

    // A closed stream holding the given chunks.
    static std::shared_ptr<BodyStream> FromChunks(const std::vector<std::string>& chunks);

    // Producer side. Push returns false once the stream no longer accepts data.
    // Empty chunks are dropped.
    bool Push(std::string chunk);
    void Close();
    void Fail(std::exception_ptr error);
    // True while buffered bytes are at or above the high-water mark.
    bool full() const;
    // Called once buffered bytes fall below the high-water mark after the stream was full.
    void SetDrainCallback(DrainCallback cb);

    // Consumer side. Throws StreamUsageError on a second outstanding read or after the
    // end has been delivered.
    void Read(ReadCallback cb);
    // Collects the whole body. Only valid before any Read.
    void ReadAll(ReadAllCallback done);
    // Consumer gives up: buffered data is released and later pushes are rejected.
    void Cancel();

    bool started() const;
    bool cancelled() const;
    size_t bufferedBytes() const;

private:
    const size_t highWaterMark_;

    mutable std::mutex mutex_;
    std::deque<std::string> queue_;
    size_t buffered_{0};
    bool wasFull_{false};

    bool closed_{false};
    bool endDelivered_{false};
    bool cancelled_{false};
    bool started_{false};
    std::exception_ptr error_;

    ReadCallback pendingRead_;
    bool collecting_{false};
    std::string collected_;
    ReadAllCallback collectDone_;

    DrainCallback drainCallback_;
};

} // namespace http
} // namespace portico
