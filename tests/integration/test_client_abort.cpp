#include "portico/adapter/AdapterOptions.h"
#include "portico/adapter/PendingResponse.h"
#include "portico/adapter/RequestContext.h"
#include "portico/engine/EventAdapter.h"
#include "portico/http/BodyStream.h"
#include "portico/http/Errors.h"
#include "portico/http/Response.h"
#include "portico/network/EventLoop.h"
#include "portico/network/InetAddress.h"
#include "portico/common/Logger.h"

#include <arpa/inet.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <cassert>
#include <chrono>
#include <cstring>
#include <future>
#include <string>
#include <thread>

using namespace portico;
using namespace portico::common;
using adapter::HandlerResult;
using adapter::PendingResponse;
using adapter::RequestContext;
using http::BodyStream;
using http::Response;

static int connectTo(uint16_t port) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    assert(fd >= 0);

    sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    assert(::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr) == 1);

    int ret = ::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    assert(ret == 0);
    return fd;
}

static std::string recvUntil(int fd, const std::string& marker, int timeoutMs = 3000) {
    std::string out;
    pollfd pfd;
    pfd.fd = fd;
    pfd.events = POLLIN;
    while (out.find(marker) == std::string::npos) {
        int pret = ::poll(&pfd, 1, timeoutMs);
        assert(pret == 1);
        char buf[4096];
        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        assert(n > 0);
        out.append(buf, buf + n);
    }
    return out;
}

static bool waitFor(const std::atomic<bool>& flag, int timeoutMs = 3000) {
    for (int waited = 0; waited < timeoutMs && !flag.load(); waited += 10) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return flag.load();
}

struct Observed {
    std::atomic<bool> streamAborted{false};
    std::atomic<bool> producerStopped{false};
    std::atomic<bool> uploadAborted{false};
    std::atomic<bool> pendingAborted{false};
    std::shared_ptr<PendingResponse> neverSettled;
};

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);

    constexpr uint16_t port = 9982;
    network::EventLoop loop;
    Observed seen;

    auto handler = [&seen](RequestContext& ctx) -> HandlerResult {
        const std::string path = ctx.request().path();
        if (path == "/slow-stream") {
            auto stream = std::make_shared<BodyStream>();
            auto signal = ctx.signal();
            signal->OnAbort([&seen] { seen.streamAborted = true; });
            ctx.WaitUntil(std::async(std::launch::async, [stream, signal, &seen] {
                stream->Push("first");
                stream->Push("second");
                while (!signal->aborted()) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(20));
                }
                // The writer releases the stream on the loop thread shortly after the abort.
                while (stream->Push("late")) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(10));
                }
                seen.producerStopped = true;
            }));
            return Response::Stream(200, stream);
        }
        if (path == "/upload") {
            auto pending = PendingResponse::Create();
            ctx.request().body()->ReadAll([pending, &seen](std::string, std::exception_ptr error) {
                if (error) {
                    seen.uploadAborted = http::DescribeError(error) == http::AbortError().what();
                    pending->Reject(error);
                    return;
                }
                pending->Resolve(Response::Text(200, "unexpected"));
            });
            return pending;
        }
        if (path == "/pending") {
            seen.neverSettled = PendingResponse::Create();
            ctx.signal()->OnAbort([&seen] { seen.pendingAborted = true; });
            return seen.neverSettled;
        }
        return ctx.PassThrough();
    };

    engine::EventServerOptions serverOptions;
    serverOptions.listenAddr = network::InetAddress(port, true);
    serverOptions.name = "ClientAbortTest";
    serverOptions.threads = 1;
    engine::EventAdapter server(&loop, handler, adapter::AdapterOptions(), serverOptions);
    const bool started = server.Start();
    assert(started);

    std::thread client([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));

        // Disconnect in the middle of a streamed response.
        int fd = connectTo(port);
        const std::string req = "GET /slow-stream HTTP/1.1\r\nHost: t\r\n\r\n";
        assert(::send(fd, req.data(), req.size(), 0) == static_cast<ssize_t>(req.size()));
        std::string got = recvUntil(fd, "5\r\nfirst\r\n");
        assert(got.compare(0, 17, "HTTP/1.1 200 OK\r\n") == 0);
        ::close(fd);
        assert(waitFor(seen.streamAborted));
        assert(waitFor(seen.producerStopped));
        LOG_INFO << "Abort mid-stream PASS";

        // Disconnect while the request body is still arriving.
        fd = connectTo(port);
        const std::string upload =
            "POST /upload HTTP/1.1\r\nHost: t\r\nContent-Length: 100\r\n\r\npartial";
        assert(::send(fd, upload.data(), upload.size(), 0) == static_cast<ssize_t>(upload.size()));
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        ::close(fd);
        assert(waitFor(seen.uploadAborted));
        LOG_INFO << "Abort mid-body PASS";

        // Disconnect while the handler's result is outstanding; settling later writes nothing.
        fd = connectTo(port);
        const std::string wait = "GET /pending HTTP/1.1\r\nHost: t\r\n\r\n";
        assert(::send(fd, wait.data(), wait.size(), 0) == static_cast<ssize_t>(wait.size()));
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        ::close(fd);
        assert(waitFor(seen.pendingAborted));
        assert(seen.neverSettled->Resolve(Response::Text(200, "too late")));
        LOG_INFO << "Abort while pending PASS";

        loop.Quit();
    });

    loop.Loop();
    client.join();

    assert(server.Shutdown(std::chrono::milliseconds(2000)));
    return 0;
}
