#include "portico/adapter/AdapterOptions.h"
#include "portico/adapter/PendingResponse.h"
#include "portico/adapter/RequestContext.h"
#include "portico/engine/EventAdapter.h"
#include "portico/http/BodyStream.h"
#include "portico/http/Response.h"
#include "portico/network/EventLoop.h"
#include "portico/network/InetAddress.h"
#include "portico/common/Logger.h"

#include <arpa/inet.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cassert>
#include <chrono>
#include <cstring>
#include <future>
#include <stdexcept>
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

static void sendAll(int fd, const std::string& data) {
    size_t off = 0;
    while (off < data.size()) {
        ssize_t n = ::send(fd, data.data() + off, data.size() - off, 0);
        assert(n > 0);
        off += static_cast<size_t>(n);
    }
}

static std::string recvUntilClose(int fd, int timeoutMs = 3000) {
    std::string out;
    pollfd pfd;
    pfd.fd = fd;
    pfd.events = POLLIN | POLLHUP | POLLERR;
    while (true) {
        int pret = ::poll(&pfd, 1, timeoutMs);
        assert(pret == 1);
        char buf[4096];
        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n > 0) {
            out.append(buf, buf + n);
            continue;
        }
        break;
    }
    return out;
}

static std::string roundTrip(uint16_t port, const std::string& request) {
    int fd = connectTo(port);
    sendAll(fd, request);
    std::string resp = recvUntilClose(fd);
    ::close(fd);
    return resp;
}

static bool contains(const std::string& s, const std::string& part) {
    return s.find(part) != std::string::npos;
}

static HandlerResult Route(RequestContext& ctx) {
    const std::string path = ctx.request().path();
    if (path == "/hello") {
        return Response::Text(200, "hello " + ctx.request().url() + " from " + ctx.ip());
    }
    if (path == "/echo") {
        auto pending = PendingResponse::Create();
        ctx.request().body()->ReadAll([pending](std::string body, std::exception_ptr error) {
            if (error) {
                pending->Reject(error);
            } else {
                pending->Resolve(Response::Text(200, "echo:" + body));
            }
        });
        return pending;
    }
    if (path == "/cookies") {
        Response res = Response::Text(200, "ok");
        res.headers().Append("Set-Cookie", "a=1; Path=/");
        res.headers().Append("Set-Cookie", "b=2; Path=/");
        return res;
    }
    if (path == "/stream") {
        auto stream = std::make_shared<BodyStream>();
        ctx.WaitUntil(std::async(std::launch::async, [stream] {
            for (const char* piece : {"A", "B", "C"}) {
                std::this_thread::sleep_for(std::chrono::milliseconds(20));
                stream->Push(piece);
            }
            stream->Close();
        }));
        return Response::Stream(200, stream);
    }
    if (path == "/boom") {
        throw std::runtime_error("handler failure");
    }
    if (path == "/platform") {
        return Response::Text(200, adapter::PlatformName(ctx.platform()));
    }
    return ctx.PassThrough();
}

static void runClient(uint16_t port) {
    std::string resp = roundTrip(port,
        "GET /hello?x=1 HTTP/1.1\r\nHost: app.test\r\nConnection: close\r\n\r\n");
    assert(resp.compare(0, 17, "HTTP/1.1 200 OK\r\n") == 0);
    assert(contains(resp, "Content-Length: "));
    assert(contains(resp, "hello http://app.test/hello?x=1 from 127.0.0.1"));
    LOG_INFO << "GET PASS";

    resp = roundTrip(port,
        "POST /echo HTTP/1.1\r\nHost: t\r\nContent-Length: 5\r\nConnection: close\r\n\r\nhello");
    assert(contains(resp, "echo:hello"));

    resp = roundTrip(port,
        "POST /echo HTTP/1.1\r\nHost: t\r\nTransfer-Encoding: chunked\r\nConnection: close\r\n\r\n"
        "3\r\nhel\r\n2\r\nlo\r\n0\r\n\r\n");
    assert(contains(resp, "echo:hello"));
    LOG_INFO << "POST echo PASS";

    resp = roundTrip(port, "GET /cookies HTTP/1.1\r\nHost: t\r\nConnection: close\r\n\r\n");
    assert(contains(resp, "set-cookie: a=1; Path=/\r\n"));
    assert(contains(resp, "set-cookie: b=2; Path=/\r\n"));
    LOG_INFO << "Set-Cookie PASS";

    resp = roundTrip(port, "GET /stream HTTP/1.1\r\nHost: t\r\nConnection: close\r\n\r\n");
    assert(contains(resp, "Transfer-Encoding: chunked\r\n"));
    assert(contains(resp, "\r\n\r\n1\r\nA\r\n1\r\nB\r\n1\r\nC\r\n0\r\n\r\n"));

    resp = roundTrip(port, "GET /stream HTTP/1.0\r\nHost: t\r\n\r\n");
    assert(!contains(resp, "chunked"));
    assert(contains(resp, "Connection: close\r\n"));
    assert(resp.substr(resp.size() - 7) == "\r\n\r\nABC");
    LOG_INFO << "Streaming PASS";

    resp = roundTrip(port,
        "GET /hello HTTP/1.1\r\nHost: one\r\n\r\n"
        "\r\n"
        "GET /platform HTTP/1.1\r\nHost: two\r\n\r\n"
        "GET /hello HTTP/1.1\r\nHost: three\r\nConnection: close\r\n\r\n");
    const size_t first = resp.find("hello http://one/hello");
    const size_t second = resp.find("event");
    const size_t third = resp.find("hello http://three/hello");
    assert(first != std::string::npos && second != std::string::npos && third != std::string::npos);
    assert(first < second && second < third);
    LOG_INFO << "Pipelining PASS";

    resp = roundTrip(port, "HEAD /hello HTTP/1.1\r\nHost: t\r\nConnection: close\r\n\r\n");
    assert(resp.compare(0, 17, "HTTP/1.1 200 OK\r\n") == 0);
    assert(!contains(resp, "hello http"));
    LOG_INFO << "HEAD PASS";

    resp = roundTrip(port, "GET /nothing-here HTTP/1.1\r\nHost: t\r\nConnection: close\r\n\r\n");
    assert(resp.compare(0, 24, "HTTP/1.1 404 Not Found\r\n") == 0);
    assert(contains(resp, "\r\n\r\nNot Found"));
    LOG_INFO << "Pass-through PASS";

    resp = roundTrip(port, "GET /boom HTTP/1.1\r\nHost: t\r\nConnection: close\r\n\r\n");
    assert(resp.compare(0, 36, "HTTP/1.1 500 Internal Server Error\r\n") == 0);
    assert(!contains(resp, "handler failure"));
    LOG_INFO << "Handler error PASS";

    resp = roundTrip(port, "BROKEN\r\n\r\n");
    assert(resp.compare(0, 26, "HTTP/1.1 400 Bad Request\r\n") == 0);
    assert(contains(resp, "Connection: close\r\n"));
    LOG_INFO << "Bad request PASS";

    resp = roundTrip(port,
        "POST /echo HTTP/1.1\r\nHost: t\r\nExpect: 100-continue\r\nContent-Length: 2\r\n"
        "Connection: close\r\n\r\nok");
    assert(resp.compare(0, 25, "HTTP/1.1 100 Continue\r\n\r\n") == 0);
    assert(contains(resp, "echo:ok"));
    LOG_INFO << "100-continue PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);

    constexpr uint16_t port = 9981;
    network::EventLoop loop;

    engine::EventServerOptions serverOptions;
    serverOptions.listenAddr = network::InetAddress(port, true);
    serverOptions.name = "EventServerTest";
    bool configured = false;
    engine::EventAdapter server(&loop, Route, adapter::AdapterOptions(), serverOptions,
                                [&configured](engine::EventServer& s) {
                                    s.tcpServer().SetThreadNum(2);
                                    configured = true;
                                });
    assert(configured);
    const bool started = server.Start();
    assert(started);

    std::thread client([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        runClient(port);
        loop.Quit();
    });

    loop.Loop();
    client.join();

    assert(server.Shutdown(std::chrono::milliseconds(2000)));
    return 0;
}
