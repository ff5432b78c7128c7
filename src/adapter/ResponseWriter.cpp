#include "portico/adapter/ResponseWriter.h"
#include "portico/http/Errors.h"
#include "portico/common/Logger.h"

namespace portico {
namespace adapter {

std::shared_ptr<ResponseWriter> ResponseWriter::Create(std::shared_ptr<NativeExchange> exchange,
                                                       std::shared_ptr<http::AbortSignal> signal) {
    return std::make_shared<ResponseWriter>(std::move(exchange), std::move(signal));
}

ResponseWriter::ResponseWriter(std::shared_ptr<NativeExchange> exchange,
                               std::shared_ptr<http::AbortSignal> signal)
    : exchange_(std::move(exchange)),
      signal_(std::move(signal)) {}

void ResponseWriter::Write(http::Response response, DoneCallback done) {
    done_ = std::move(done);
    if (response.bodyKind() == http::Response::BodyKind::kStream) {
        stream_ = response.stream();
    }

    if (signal_->aborted()) {
        Halt();
        return;
    }

    std::weak_ptr<ResponseWriter> weak(shared_from_this());
    signal_->OnAbort([weak] {
        auto self = weak.lock();
        if (!self) return;
        self->exchange_->Post([self] { self->Halt(); });
    });

    if (!WriteHead(response)) return;
    if (stream_) {
        ReadNext();
    }
}

bool ResponseWriter::WriteHead(const http::Response& response) {
    WriteResult result = WriteResult::kOk;
    const http::Response::BodyKind kind = response.bodyKind();
    exchange_->Cork([&] {
        exchange_->WriteStatus(response.status(), response.reason());
        // One line per value; set-cookie in particular must never be joined.
        for (const auto& header : response.headers()) {
            exchange_->WriteHeader(header.first, header.second);
        }
        if (kind == http::Response::BodyKind::kNone) {
            result = exchange_->End(std::string());
        } else if (kind == http::Response::BodyKind::kBytes) {
            result = exchange_->End(response.bytes());
        }
    });

    if (kind == http::Response::BodyKind::kStream) {
        if (result == WriteResult::kFailed) {
            Halt();
            return false;
        }
        return true;
    }
    Finish(result != WriteResult::kFailed);
    return false;
}

void ResponseWriter::ReadNext() {
    if (finished_) return;
    if (signal_->aborted()) {
        Halt();
        return;
    }
    auto self = shared_from_this();
    try {
        stream_->Read([self](http::BodyStream::ReadResult result) {
            // Chunks may be produced on any thread; writes happen on the exchange's.
            self->exchange_->Post([self, result]() mutable { self->OnRead(std::move(result)); });
        });
    } catch (const http::StreamUsageError& e) {
        LOG_ERROR << "response body cannot be read: " << e.what();
        exchange_->Close();
        Finish(false);
    }
}

void ResponseWriter::OnRead(http::BodyStream::ReadResult result) {
    if (finished_) return;
    if (signal_->aborted()) {
        Halt();
        return;
    }

    switch (result.status) {
        case http::BodyStream::ReadStatus::kChunk: {
            std::optional<std::string> previous;
            previous.swap(held_);
            held_ = std::move(result.data);
            if (!previous) {
                ReadNext();
                return;
            }
            WriteResult written = WriteResult::kOk;
            exchange_->Cork([&] { written = exchange_->Write(*previous); });
            if (!Handle(written)) return;
            if (written == WriteResult::kBackpressure) {
                auto self = shared_from_this();
                exchange_->OnWritable([self] { self->ReadNext(); });
                return;
            }
            ReadNext();
            return;
        }
        case http::BodyStream::ReadStatus::kEnd: {
            const std::string last = held_ ? std::move(*held_) : std::string();
            held_.reset();
            WriteResult written = WriteResult::kOk;
            exchange_->Cork([&] { written = exchange_->End(last); });
            if (!Handle(written)) return;
            Finish(true);
            return;
        }
        case http::BodyStream::ReadStatus::kError:
            // The head is already out, so the response cannot be completed any more.
            LOG_ERROR << "response body stream failed: " << http::DescribeError(result.error);
            held_.reset();
            exchange_->Close();
            Finish(false);
            return;
    }
}

bool ResponseWriter::Handle(WriteResult result) {
    if (result != WriteResult::kFailed) return true;
    LOG_DEBUG << "native write failed, treating the exchange as aborted";
    signal_->Abort();
    Halt();
    return false;
}

void ResponseWriter::Halt() {
    if (finished_) return;
    held_.reset();
    if (stream_) stream_->Cancel();
    Finish(false);
}

void ResponseWriter::Finish(bool completed) {
    if (finished_) return;
    finished_ = true;
    stream_.reset();
    DoneCallback done;
    done.swap(done_);
    if (done) done(completed);
}

} // namespace adapter
} // namespace portico
