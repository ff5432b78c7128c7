#pragma once

#include "portico/adapter/NativeExchange.h"
#include "portico/http/AbortSignal.h"
#include "portico/http/BodyStream.h"
#include "portico/http/Response.h"

#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace portico {
namespace adapter {

// Emits one canonical response through a native exchange.
//
// Status line and headers go out in one cork scope. A streamed body is written with one
// chunk held back: each new chunk flushes the held one as a non-final write and the end of
// the stream flushes it as the final write. The abort signal is checked before every
// write; once raised, or once the engine reports a failed write, the body is released
// unwritten.
class ResponseWriter : public std::enable_shared_from_this<ResponseWriter> {
public:
    // completed is false when the response was cut short.
    using DoneCallback = std::function<void(bool completed)>;

    static std::shared_ptr<ResponseWriter> Create(std::shared_ptr<NativeExchange> exchange,
                                                  std::shared_ptr<http::AbortSignal> signal);

    ResponseWriter(std::shared_ptr<NativeExchange> exchange,
                   std::shared_ptr<http::AbortSignal> signal);

    // Must be called on the exchange's thread. done runs on that thread too.
    void Write(http::Response response, DoneCallback done);

    bool finished() const { return finished_; }

private:
    bool WriteHead(const http::Response& response);
    void ReadNext();
    void OnRead(http::BodyStream::ReadResult result);
    bool Handle(WriteResult result);
    void Halt();
    void Finish(bool completed);

    std::shared_ptr<NativeExchange> exchange_;
    std::shared_ptr<http::AbortSignal> signal_;
    std::shared_ptr<http::BodyStream> stream_;
    std::optional<std::string> held_;
    DoneCallback done_;
    bool finished_{false};
};

} // namespace adapter
} // namespace portico
