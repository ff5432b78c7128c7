#include "portico/engine/EventServer.h"
#include "portico/engine/EventExchange.h"
#include "portico/protocol/RequestParser.h"
#include "portico/network/Buffer.h"
#include "portico/network/EventLoop.h"
#include "portico/network/TcpConnection.h"
#include "portico/common/Config.h"
#include "portico/common/Logger.h"

namespace portico {
namespace engine {

namespace {

// Unparsed pipelined bytes tolerated while a request is in flight.
const size_t kMaxPipelinedBytes = 1024 * 1024;

const char kBadRequest[] =
    "HTTP/1.1 400 Bad Request\r\n"
    "Content-Length: 0\r\n"
    "Connection: close\r\n"
    "\r\n";

const char kContinue[] = "HTTP/1.1 100 Continue\r\n\r\n";

} // namespace

struct EventServer::Session {
    protocol::RequestParser parser;
    std::shared_ptr<EventExchange> exchange;
    bool broken{false};
};

EventServerOptions EventServerOptions::FromConfig(const common::Config& config) {
    EventServerOptions options;
    const std::string addr = config.GetString("global", "listen_addr", "0.0.0.0");
    const int port = config.GetInt("global", "listen_port", 8080);
    if (addr == "0.0.0.0" || addr.empty()) {
        options.listenAddr = network::InetAddress(static_cast<uint16_t>(port));
    } else if (addr == "::") {
        options.listenAddr = network::InetAddress(static_cast<uint16_t>(port), false, true);
    } else {
        options.listenAddr = network::InetAddress(addr, static_cast<uint16_t>(port));
    }
    options.threads = config.GetInt("global", "threads", 0);
    options.reusePort = config.GetBool("global", "reuse_port", false);
    options.maxConnections = config.GetInt("connection_limit", "max_total", 0);
    options.idleTimeoutSec = config.GetDouble("connection_limit", "idle_timeout_sec", 0.0);
    const int highWaterKb = config.GetInt("connection_limit", "write_high_water_kb", 64);
    if (highWaterKb > 0) {
        options.writeHighWaterMark = static_cast<size_t>(highWaterKb) * 1024;
    }
    return options;
}

EventServer::EventServer(network::EventLoop* loop, const EventServerOptions& options)
    : loop_(loop),
      options_(options),
      server_(loop, options.listenAddr, options.name, options.reusePort) {
    server_.SetThreadNum(options_.threads);
    server_.SetMaxConnections(options_.maxConnections);
    if (options_.idleTimeoutSec > 0.0) {
        server_.SetIdleTimeout(std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::duration<double>(options_.idleTimeoutSec)));
    }
    server_.SetConnectionCallback(
        std::bind(&EventServer::OnConnection, this, std::placeholders::_1));
    server_.SetMessageCallback(
        [this](const network::TcpConnectionPtr& conn, network::Buffer*) { ProcessInput(conn); });
    server_.SetWriteCompleteCallback(
        std::bind(&EventServer::OnWriteComplete, this, std::placeholders::_1));
}

EventServer::~EventServer() = default;

bool EventServer::EnableTls(const std::string& certPemPath, const std::string& keyPemPath) {
    if (!server_.EnableTls(certPemPath, keyPemPath)) {
        LOG_ERROR << "EventServer[" << options_.name << "] TLS setup failed";
        return false;
    }
    return true;
}

bool EventServer::Start() {
    if (!server_.Start()) {
        LOG_ERROR << "EventServer[" << options_.name << "] cannot listen on " << server_.hostport();
        return false;
    }
    LOG_INFO << "EventServer[" << options_.name << "] listening on " << server_.hostport()
             << (server_.tlsEnabled() ? " (tls)" : "");
    return true;
}

void EventServer::CloseAll() {
    loop_->RunInLoop([this] { server_.CloseAll(); });
}

EventServer::Session* EventServer::GetSession(const network::TcpConnectionPtr& conn) {
    auto* holder = std::any_cast<std::shared_ptr<Session>>(conn->GetMutableContext());
    return holder ? holder->get() : nullptr;
}

void EventServer::OnConnection(const network::TcpConnectionPtr& conn) {
    if (conn->connected()) {
        LOG_DEBUG << "EventServer connection up " << conn->name() << " from " << conn->peerAddress().toIpPort();
        conn->SetContext(std::make_shared<Session>());
        return;
    }

    LOG_DEBUG << "EventServer connection down " << conn->name();
    Session* session = GetSession(conn);
    if (session && session->exchange) {
        auto exchange = std::move(session->exchange);
        exchange->Abort();
    }
}

void EventServer::OnWriteComplete(const network::TcpConnectionPtr& conn) {
    Session* session = GetSession(conn);
    if (session && session->exchange) {
        session->exchange->NotifyWritable();
    }
}

void EventServer::ProcessInput(const network::TcpConnectionPtr& conn) {
    Session* session = GetSession(conn);
    if (!session || session->broken || !conn->connected()) return;
    network::Buffer* buf = conn->inputBuffer();
    protocol::RequestParser& parser = session->parser;

    while (true) {
        if (session->exchange) {
            std::shared_ptr<EventExchange> exchange = session->exchange;
            if (!parser.complete()) {
                const bool ok = parser.parseBody(buf, [&exchange](const char* data, size_t len, bool last) {
                    exchange->DeliverBody(data, len, last);
                });
                if (!ok) {
                    LOG_DEBUG << "EventServer malformed body framing on " << conn->name();
                    session->broken = true;
                    conn->ForceClose();
                    return;
                }
            }
            if (!parser.complete() || !exchange->responseFinished()) {
                if (!parser.complete()) {
                    if (exchange->responseFinished() && !conn->reading()) {
                        // Nobody reads the rest of this body; drain it so the connection can go on.
                        conn->StartRead();
                    }
                } else if (buf->ReadableBytes() > kMaxPipelinedBytes) {
                    conn->StopRead();
                }
                return;
            }

            // Request and response both complete.
            const bool close = exchange->closeAfter();
            session->exchange.reset();
            parser.reset();
            if (close) {
                session->broken = true;
                conn->Shutdown();
                return;
            }
            if (!conn->reading()) conn->StartRead();
            continue;
        }

        if (buf->ReadableBytes() == 0) return;
        if (!parser.parseHead(buf)) {
            LOG_DEBUG << "EventServer bad request on " << conn->name();
            session->broken = true;
            conn->Send(kBadRequest, sizeof(kBadRequest) - 1);
            conn->Shutdown();
            return;
        }
        if (!parser.headComplete()) return;
        StartExchange(conn, session);
    }
}

void EventServer::StartExchange(const network::TcpConnectionPtr& conn, Session* session) {
    const protocol::RequestHead& head = session->parser.head();
    auto exchange = std::make_shared<EventExchange>(conn, head, options_.writeHighWaterMark);
    session->exchange = exchange;

    std::weak_ptr<network::TcpConnection> weakConn(conn);
    exchange->SetCompleteCallback([this, weakConn] {
        if (auto c = weakConn.lock()) ProcessInput(c);
    });

    if (head.version() == protocol::RequestHead::kHttp11 &&
        protocol::EqualsIgnoreCase(head.header("Expect"), "100-continue")) {
        conn->Send(kContinue, sizeof(kContinue) - 1);
    }

    LOG_DEBUG << "EventServer " << conn->name() << " " << head.method() << " " << head.path();
    if (requestCallback_) {
        requestCallback_(exchange);
    } else {
        exchange->PassThrough();
    }
}

} // namespace engine
} // namespace portico
