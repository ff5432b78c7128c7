#pragma once

#include "portico/adapter/DeferredWork.h"
#include "portico/adapter/NativeExchange.h"
#include "portico/adapter/RequestContext.h"
#include "portico/adapter/RequestTranslator.h"
#include "portico/adapter/ResponseWriter.h"
#include "portico/http/AbortSignal.h"

#include <memory>
#include <string>

namespace portico {
namespace adapter {

// Drives one exchange: translate, run the handler exactly once, write its response.
//
//   Receiving -> Handling -> Responding -> Done
//        \___________\____________\______-> Aborted
//
// Every method runs on the exchange's thread; results settled elsewhere are posted there.
class RequestDispatch : public std::enable_shared_from_this<RequestDispatch> {
public:
    enum class State {
        kReceiving,
        kHandling,
        kResponding,
        kDone,
        kAborted,
    };

    // handler, translator and host must outlive the dispatch.
    RequestDispatch(std::shared_ptr<NativeExchange> exchange,
                    const Handler& handler,
                    const RequestTranslator& translator,
                    DeferredWork& host);

    void Start();

    State state() const { return state_; }
    const std::shared_ptr<http::AbortSignal>& signal() const { return signal_; }

    static const char* StateName(State state);

private:
    void HandleResult(HandlerResult result);
    void HandleSettlement(Settlement settlement);
    void HandleError(const std::string& what);
    void Respond(http::Response response);
    void PassThrough();
    void OnAborted();
    void Finish(State terminal);
    // Drops the context once the request is over and the handler has returned.
    void ReleaseContext();
    static void DiscardResponse(http::Response& response);

    std::shared_ptr<NativeExchange> exchange_;
    const Handler& handler_;
    const RequestTranslator& translator_;
    DeferredWork& host_;

    State state_;
    bool inHandler_{false};
    std::shared_ptr<http::AbortSignal> signal_;
    std::unique_ptr<RequestContext> context_;
    std::shared_ptr<ResponseWriter> writer_;
    std::string label_;
};

} // namespace adapter
} // namespace portico
