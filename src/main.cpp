#include "portico/adapter/AdapterOptions.h"
#include "portico/adapter/PendingResponse.h"
#include "portico/adapter/RequestContext.h"
#include "portico/common/Config.h"
#include "portico/common/Logger.h"
#include "portico/engine/EventAdapter.h"
#include "portico/http/BodyStream.h"
#include "portico/http/Response.h"
#include "portico/network/Channel.h"
#include "portico/network/EventLoop.h"
#include "portico/network/TcpConnection.h"

#include <getopt.h>
#include <signal.h>
#include <sys/signalfd.h>
#include <unistd.h>

#include <atomic>
#include <cstdio>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>

namespace {

using portico::adapter::HandlerResult;
using portico::adapter::PendingResponse;
using portico::adapter::RequestContext;
using portico::http::BodyStream;
using portico::http::Response;

// Streams a few chunks with a pause between them. The stream's completion is registered
// through WaitUntil so shutdown waits for it.
HandlerResult BinStream(RequestContext& ctx) {
    auto stream = std::make_shared<BodyStream>();
    const auto* event = std::get_if<portico::adapter::EventPlatform>(&ctx.platform());
    if (!event || !event->connection) {
        stream->Push("0123456789");
        stream->Close();
        return Response::Stream(200, stream);
    }

    struct Progress {
        std::atomic_bool finished{false};
        std::promise<void> done;
        void Finish() {
            if (!finished.exchange(true)) done.set_value();
        }
    };
    auto progress = std::make_shared<Progress>();
    ctx.WaitUntil(progress->done.get_future());

    auto signal = ctx.signal();
    signal->OnAbort([progress] { progress->Finish(); });

    portico::network::EventLoop* loop = event->connection->getLoop();
    auto step = std::make_shared<std::function<void(int)>>();
    std::weak_ptr<std::function<void(int)>> weakStep = step;
    *step = [loop, stream, signal, progress, weakStep](int n) {
        if (signal->aborted()) return;
        if (n == 10) {
            stream->Close();
            progress->Finish();
            return;
        }
        if (!stream->Push(std::string(1, static_cast<char>('0' + n)))) {
            progress->Finish();
            return;
        }
        auto next = weakStep.lock();
        if (!next) return;
        loop->RunAfter(std::chrono::milliseconds(100), [next, n] { (*next)(n + 1); });
    };
    // The timer chain keeps the step alive between ticks.
    loop->RunAfter(std::chrono::milliseconds(0), [step] { (*step)(0); });

    Response res = Response::Stream(200, stream);
    res.headers().Set("content-type", "application/octet-stream");
    return res;
}

HandlerResult EchoText(RequestContext& ctx) {
    const auto& body = ctx.request().body();
    if (!body) {
        return Response::Text(200, "");
    }
    auto pending = PendingResponse::Create();
    body->ReadAll([pending](std::string text, std::exception_ptr error) {
        if (error) {
            pending->Reject(error);
        } else {
            pending->Resolve(Response::Text(200, std::move(text)));
        }
    });
    return pending;
}

HandlerResult Demo(RequestContext& ctx) {
    const std::string path = ctx.request().path();

    if (path == "/") {
        return Response::Text(200, "Hello from portico\nurl: " + ctx.request().url() +
                                   "\nip: " + ctx.ip() + "\n");
    }
    if (path == "/echo-text") {
        return EchoText(ctx);
    }
    if (path == "/bin-stream") {
        return BinStream(ctx);
    }
    if (path == "/set-cookie") {
        Response res = Response::Text(200, "cookies set\n");
        res.headers().Append("set-cookie", "a=1; Path=/");
        res.headers().Append("set-cookie", "b=2; Path=/; HttpOnly");
        return res;
    }
    if (path == "/status") {
        return Response::Text(403, "Forbidden\n");
    }
    if (path == "/headers") {
        std::string out;
        for (const auto& h : ctx.request().headers()) {
            out += h.first + ": " + h.second + "\n";
        }
        return Response::Text(200, out);
    }
    if (path == "/platform") {
        return Response::Text(200, std::string(portico::adapter::PlatformName(ctx.platform())) + "\n");
    }
    return ctx.PassThrough();
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace portico;

    std::string configFile = "../config/portico.conf";
    bool checkOnly = false;
    int ch;
    while ((ch = getopt(argc, argv, "c:hC")) != -1) {
        switch (ch) {
            case 'c':
                configFile = optarg;
                break;
            case 'C':
                checkOnly = true;
                break;
            case 'h':
            default:
                printf("Usage: %s [-c config_file] [-C]\n", argv[0]);
                printf("  -C  check config and exit\n");
                return 0;
        }
    }

    auto& conf = common::Config::Instance();
    if (!conf.Load(configFile)) {
        LOG_ERROR << "Failed to load config, using defaults.";
    }
    common::Logger::Instance().SetLevel(
        common::Logger::Instance().ParseLevel(conf.GetString("global", "log_level", "INFO")));

    adapter::AdapterOptions options;
    try {
        options = adapter::AdapterOptions::FromConfig(conf);
        options.Validate();
    } catch (const std::invalid_argument& e) {
        LOG_ERROR << "Invalid configuration: " << e.what();
        return 1;
    }
    const engine::EventServerOptions serverOptions = engine::EventServerOptions::FromConfig(conf);

    if (checkOnly) {
        printf("OK\n");
        return 0;
    }

    ::signal(SIGPIPE, SIG_IGN);

    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    if (::pthread_sigmask(SIG_BLOCK, &mask, nullptr) != 0) {
        LOG_FATAL << "pthread_sigmask failed";
        return 1;
    }
    // Blocked before the I/O threads start so only the signalfd sees them.
    const int sigFd = ::signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (sigFd < 0) {
        LOG_FATAL << "signalfd failed";
        return 1;
    }

    network::EventLoop loop;
    network::Channel sigChannel(&loop, sigFd);
    sigChannel.SetReadCallback([&loop, sigFd]() {
        signalfd_siginfo info;
        if (::read(sigFd, &info, sizeof(info)) == static_cast<ssize_t>(sizeof(info))) {
            LOG_INFO << "Received signal " << info.ssi_signo << ", shutting down";
            loop.Quit();
        }
    });
    sigChannel.EnableReading();

    engine::EventAdapter server(&loop, Demo, options, serverOptions,
                                [](engine::EventServer& s) {
                                    LOG_INFO << "Serving " << s.options().name << " on "
                                             << s.options().listenAddr.toIpPort()
                                             << " with " << s.options().threads << " I/O thread(s)";
                                });
    if (!server.Start()) {
        LOG_FATAL << "Server failed to start";
        sigChannel.DisableAll();
        sigChannel.Remove();
        ::close(sigFd);
        return 1;
    }

    loop.Loop();

    const bool drained = server.Shutdown(std::chrono::milliseconds(5000));
    if (!drained) {
        LOG_WARN << "Deferred work still running at exit";
    }
    sigChannel.DisableAll();
    sigChannel.Remove();
    ::close(sigFd);
    return 0;
}
