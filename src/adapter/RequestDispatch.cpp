#include "portico/adapter/RequestDispatch.h"
#include "portico/http/Errors.h"
#include "portico/common/Logger.h"

#include <optional>

namespace portico {
namespace adapter {

RequestDispatch::RequestDispatch(std::shared_ptr<NativeExchange> exchange,
                                 const Handler& handler,
                                 const RequestTranslator& translator,
                                 DeferredWork& host)
    : exchange_(std::move(exchange)),
      handler_(handler),
      translator_(translator),
      host_(host),
      state_(State::kReceiving),
      signal_(std::make_shared<http::AbortSignal>()) {}

const char* RequestDispatch::StateName(State state) {
    switch (state) {
        case State::kReceiving: return "Receiving";
        case State::kHandling: return "Handling";
        case State::kResponding: return "Responding";
        case State::kDone: return "Done";
        case State::kAborted: return "Aborted";
    }
    return "?";
}

void RequestDispatch::Start() {
    std::weak_ptr<RequestDispatch> weak(shared_from_this());
    exchange_->OnAborted([weak] {
        if (auto self = weak.lock()) self->OnAborted();
    });

    std::optional<RequestTranslator::Translation> translation;
    try {
        translation.emplace(translator_.Translate(exchange_));
    } catch (const http::TranslationError& e) {
        LOG_WARN << "request cannot be translated, passing through: " << e.what();
        PassThrough();
        return;
    }
    label_ = translation->request.method() + " " + translation->request.url();

    context_ = std::make_unique<RequestContext>(translation->request,
                                                translation->origin.ip,
                                                exchange_->platform(),
                                                signal_);
    state_ = State::kHandling;

    std::optional<HandlerResult> result;
    inHandler_ = true;
    try {
        result.emplace(handler_(*context_));
    } catch (const std::exception& e) {
        inHandler_ = false;
        HandleError(e.what());
        ReleaseContext();
        return;
    } catch (...) {
        inHandler_ = false;
        HandleError("non-standard exception");
        ReleaseContext();
        return;
    }
    inHandler_ = false;
    HandleResult(std::move(*result));
    ReleaseContext();
}

void RequestDispatch::DiscardResponse(http::Response& response) {
    if (response.bodyKind() == http::Response::BodyKind::kStream && response.stream()) {
        response.stream()->Cancel();
    }
}

void RequestDispatch::HandleResult(HandlerResult result) {
    if (state_ != State::kHandling) {
        // Aborted while the handler ran.
        if (auto* response = std::get_if<http::Response>(&result)) {
            DiscardResponse(*response);
        }
        LOG_DEBUG << "discarding result of aborted request " << label_;
        return;
    }
    if (auto* response = std::get_if<http::Response>(&result)) {
        Respond(std::move(*response));
        return;
    }
    if (std::holds_alternative<PassThroughTag>(result)) {
        PassThrough();
        return;
    }

    auto pending = std::get<std::shared_ptr<PendingResponse>>(std::move(result));
    if (!pending) {
        HandleError("handler returned an empty pending response");
        return;
    }
    auto self = shared_from_this();
    std::weak_ptr<NativeExchange> weakExchange(exchange_);
    pending->Then([self, weakExchange](Settlement settlement) {
        auto exchange = weakExchange.lock();
        if (!exchange) {
            // The engine dropped the exchange; only the body needs releasing.
            if (auto* response = std::get_if<http::Response>(&settlement)) {
                DiscardResponse(*response);
            }
            return;
        }
        exchange->Post([self, settlement]() mutable {
            self->HandleSettlement(std::move(settlement));
        });
    });
}

void RequestDispatch::HandleSettlement(Settlement settlement) {
    if (state_ != State::kHandling) {
        if (auto* response = std::get_if<http::Response>(&settlement)) {
            DiscardResponse(*response);
        }
        if (state_ == State::kAborted) {
            LOG_DEBUG << "discarding result of aborted request " << label_;
        } else {
            LOG_WARN << "suppressed second response for " << label_;
        }
        return;
    }

    if (auto* response = std::get_if<http::Response>(&settlement)) {
        Respond(std::move(*response));
    } else if (std::holds_alternative<PassThroughTag>(settlement)) {
        PassThrough();
    } else {
        HandleError(http::DescribeError(std::get<std::exception_ptr>(settlement)));
    }
}

void RequestDispatch::HandleError(const std::string& what) {
    if (state_ != State::kHandling) return;
    if (signal_->aborted()) {
        LOG_DEBUG << "handler failed after abort for " << label_ << ": " << what;
        Finish(State::kAborted);
        return;
    }
    LOG_ERROR << "handler failed for " << label_ << ": " << what;
    http::Response response(500);
    response.SetReason("Internal Server Error");
    Respond(std::move(response));
}

void RequestDispatch::Respond(http::Response response) {
    if (signal_->aborted()) {
        DiscardResponse(response);
        Finish(State::kAborted);
        return;
    }
    state_ = State::kResponding;
    auto self = shared_from_this();
    auto writer = ResponseWriter::Create(exchange_, signal_);
    writer_ = writer;
    writer->Write(std::move(response), [self](bool completed) {
        self->Finish(completed ? State::kDone : State::kAborted);
    });
}

void RequestDispatch::PassThrough() {
    if (signal_->aborted()) {
        Finish(State::kAborted);
        return;
    }
    exchange_->PassThrough();
    Finish(State::kDone);
}

void RequestDispatch::OnAborted() {
    if (state_ == State::kDone || state_ == State::kAborted) return;
    LOG_DEBUG << "client aborted " << label_ << " while " << StateName(state_);
    signal_->Abort();
    if (context_ && context_->request().body()) {
        context_->request().body()->Fail(std::make_exception_ptr(http::AbortError()));
    }
    Finish(State::kAborted);
}

void RequestDispatch::Finish(State terminal) {
    if (state_ == State::kDone || state_ == State::kAborted) return;
    state_ = terminal;
    LOG_DEBUG << "request " << label_ << " finished: " << StateName(terminal);

    if (context_) {
        const auto& body = context_->request().body();
        if (body && !body->started()) {
            // Nobody will read it; stop buffering.
            body->Cancel();
        }
    }
    writer_.reset();
    exchange_.reset();
    ReleaseContext();
}

void RequestDispatch::ReleaseContext() {
    if (!context_ || inHandler_) return;
    if (state_ != State::kDone && state_ != State::kAborted) return;
    // The context's platform handle holds the native connection.
    host_.Adopt(context_->deferred());
    context_.reset();
}

} // namespace adapter
} // namespace portico
