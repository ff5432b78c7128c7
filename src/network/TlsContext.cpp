#include "portico/network/TlsContext.h"
#include "portico/common/Logger.h"

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <sys/socket.h>
#include <cerrno>

namespace portico {
namespace network {

namespace {

SSL_CTX* AsCtx(ssl_ctx_st* ctx) { return reinterpret_cast<SSL_CTX*>(ctx); }
SSL* AsSsl(ssl_st* ssl) { return reinterpret_cast<SSL*>(ssl); }

struct CtxDeleter {
    void operator()(SSL_CTX* ctx) const { SSL_CTX_free(ctx); }
};

// Record type of a TLS handshake message.
constexpr unsigned char kHandshakeRecord = 0x16;

} // namespace

std::string TlsSession::LastError() {
    const unsigned long code = ERR_get_error();
    if (code == 0) {
        return "no OpenSSL error queued";
    }
    char buf[256];
    ERR_error_string_n(code, buf, sizeof buf);
    return buf;
}

std::shared_ptr<TlsContext> TlsContext::Load(const std::string& certPath, const std::string& keyPath) {
    OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS | OPENSSL_INIT_LOAD_CRYPTO_STRINGS, nullptr);

    std::unique_ptr<SSL_CTX, CtxDeleter> ctx(SSL_CTX_new(TLS_server_method()));
    if (!ctx) {
        LOG_ERROR << "SSL_CTX_new: " << TlsSession::LastError();
        return nullptr;
    }
    SSL_CTX_set_min_proto_version(ctx.get(), TLS1_2_VERSION);
    SSL_CTX_set_options(ctx.get(), SSL_OP_NO_COMPRESSION);
    // Non-blocking sockets hand back partial writes and may retry from a moved buffer.
    SSL_CTX_set_mode(ctx.get(), SSL_MODE_ENABLE_PARTIAL_WRITE | SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER);

    if (SSL_CTX_use_certificate_chain_file(ctx.get(), certPath.c_str()) != 1) {
        LOG_ERROR << "cannot load certificate " << certPath << ": " << TlsSession::LastError();
        return nullptr;
    }
    if (SSL_CTX_use_PrivateKey_file(ctx.get(), keyPath.c_str(), SSL_FILETYPE_PEM) != 1) {
        LOG_ERROR << "cannot load private key " << keyPath << ": " << TlsSession::LastError();
        return nullptr;
    }
    if (SSL_CTX_check_private_key(ctx.get()) != 1) {
        LOG_ERROR << "private key " << keyPath << " does not match " << certPath;
        return nullptr;
    }
    return std::shared_ptr<TlsContext>(new TlsContext(reinterpret_cast<ssl_ctx_st*>(ctx.release())));
}

TlsContext::~TlsContext() {
    SSL_CTX_free(AsCtx(ctx_));
}

TlsSession::Greeting TlsSession::Sniff(int fd) {
    unsigned char first = 0;
    const ssize_t n = ::recv(fd, &first, 1, MSG_PEEK);
    if (n == 1) {
        return first == kHandshakeRecord ? Greeting::kTls : Greeting::kPlain;
    }
    if (n == 0) {
        return Greeting::kEof;
    }
    // Errors other than EAGAIN surface on the real read.
    return (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) ? Greeting::kNothingYet
                                                                      : Greeting::kPlain;
}

TlsSession::TlsSession(std::shared_ptr<TlsContext> context, int fd)
    : context_(std::move(context)),
      ssl_(reinterpret_cast<ssl_st*>(SSL_new(AsCtx(context_->native())))) {
    if (ssl_ == nullptr) {
        LOG_ERROR << "SSL_new: " << LastError();
        return;
    }
    SSL_set_fd(AsSsl(ssl_), fd);
    SSL_set_accept_state(AsSsl(ssl_));
}

TlsSession::~TlsSession() {
    if (ssl_ != nullptr) {
        SSL_free(AsSsl(ssl_));
    }
}

TlsSession::Io TlsSession::Classify(int ret) {
    switch (SSL_get_error(AsSsl(ssl_), ret)) {
    case SSL_ERROR_WANT_READ:
        return Io::kWantRead;
    case SSL_ERROR_WANT_WRITE:
        return Io::kWantWrite;
    case SSL_ERROR_ZERO_RETURN:
        return Io::kClosed;
    default:
        return Io::kFailed;
    }
}

TlsSession::Io TlsSession::Handshake() {
    const int ret = SSL_accept(AsSsl(ssl_));
    if (ret == 1) {
        established_ = true;
        LOG_DEBUG << "TLS established with " << SSL_get_version(AsSsl(ssl_));
        return Io::kOk;
    }
    return Classify(ret);
}

TlsSession::Io TlsSession::Read(char* buf, size_t cap, size_t* got) {
    *got = 0;
    const int ret = SSL_read(AsSsl(ssl_), buf, static_cast<int>(cap));
    if (ret > 0) {
        *got = static_cast<size_t>(ret);
        return Io::kOk;
    }
    return Classify(ret);
}

TlsSession::Io TlsSession::Write(const char* data, size_t len, size_t* wrote) {
    *wrote = 0;
    const int ret = SSL_write(AsSsl(ssl_), data, static_cast<int>(len));
    if (ret > 0) {
        *wrote = static_cast<size_t>(ret);
        return Io::kOk;
    }
    return Classify(ret);
}

void TlsSession::Close() {
    if (established_) {
        SSL_shutdown(AsSsl(ssl_));
    }
}

} // namespace network
} // namespace portico
