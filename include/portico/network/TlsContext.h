#pragma once

#include "portico/common/noncopyable.h"

#include <memory>
#include <string>
#include <sys/types.h>

struct ssl_ctx_st;
struct ssl_st;

namespace portico {
namespace network {

// Server certificate and key, shared by every connection of one listener.
class TlsContext : portico::common::noncopyable {
public:
    // nullptr with the OpenSSL reason logged when the files cannot be used.
    static std::shared_ptr<TlsContext> Load(const std::string& certPath, const std::string& keyPath);

    ~TlsContext();

    ssl_ctx_st* native() const { return ctx_; }

private:
    explicit TlsContext(ssl_ctx_st* ctx) : ctx_(ctx) {}

    ssl_ctx_st* ctx_;
};

// Server side of one TLS connection over a non-blocking fd.
class TlsSession : portico::common::noncopyable {
public:
    enum class Io { kOk, kWantRead, kWantWrite, kClosed, kFailed };

    enum class Greeting { kTls, kPlain, kNothingYet, kEof };

    // Peeks at the first byte waiting on fd without consuming it.
    static Greeting Sniff(int fd);

    TlsSession(std::shared_ptr<TlsContext> context, int fd);
    ~TlsSession();

    bool valid() const { return ssl_ != nullptr; }
    bool established() const { return established_; }

    Io Handshake();
    // Bytes transferred when the result is kOk; otherwise 0.
    Io Read(char* buf, size_t cap, size_t* got);
    Io Write(const char* data, size_t len, size_t* wrote);
    void Close();

    // Last queued OpenSSL error, for logging.
    static std::string LastError();

private:
    Io Classify(int ret);

    std::shared_ptr<TlsContext> context_;
    ssl_st* ssl_;
    bool established_{false};
};

} // namespace network
} // namespace portico
