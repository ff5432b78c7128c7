#include "portico/protocol/RequestParser.h"
#include "portico/common/Logger.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>

namespace portico {
namespace protocol {

namespace {

// A chunk-size line longer than this is not a size.
constexpr size_t kMaxChunkLine = 1024;

bool IsTokenChar(char c) {
    if (std::isalnum(static_cast<unsigned char>(c))) return true;
    static const char kExtra[] = "!#$%&'*+-.^_`|~";
    return c != '\0' && std::find(kExtra, kExtra + sizeof kExtra - 1, c) != kExtra + sizeof kExtra - 1;
}

// Parses digits in base 10 or 16; false on anything else or overflow.
bool ParseSize(const std::string& text, int base, size_t* out) {
    if (text.empty()) return false;
    for (char c : text) {
        const bool ok = base == 16 ? std::isxdigit(static_cast<unsigned char>(c))
                                   : std::isdigit(static_cast<unsigned char>(c));
        if (!ok) return false;
    }
    errno = 0;
    const unsigned long long value = std::strtoull(text.c_str(), nullptr, base);
    if (errno == ERANGE) return false;
    *out = static_cast<size_t>(value);
    return true;
}

} // namespace

// method SP target SP HTTP/1.x
bool RequestParser::takeRequestLine(const char* begin, const char* end) {
    const char* sp1 = std::find(begin, end, ' ');
    if (sp1 == begin || sp1 == end || !std::all_of(begin, sp1, IsTokenChar)) return false;
    const char* target = sp1 + 1;
    const char* sp2 = std::find(target, end, ' ');
    if (sp2 == target || sp2 == end) return false;
    const char* version = sp2 + 1;

    static const char kPrefix[] = "HTTP/1.";
    if (end - version != 8 || !std::equal(kPrefix, kPrefix + 7, version)) return false;
    switch (version[7]) {
    case '0':
        head_.version_ = RequestHead::kHttp10;
        break;
    case '1':
        head_.version_ = RequestHead::kHttp11;
        break;
    default:
        return false;
    }

    head_.method_.assign(begin, sp1);
    const char* q = std::find(target, sp2, '?');
    head_.path_.assign(target, q);
    if (q != sp2) {
        head_.query_.assign(q + 1, sp2);
    }
    return true;
}

// name ":" OWS value OWS; the value bytes are kept as they are.
bool RequestParser::takeHeader(const char* begin, const char* end) {
    const char* colon = std::find(begin, end, ':');
    if (colon == begin || colon == end) return false;
    head_.headers_.emplace_back(std::string(begin, colon), TrimSpace(std::string(colon + 1, end)));
    return true;
}

bool RequestParser::decideFraming() {
    // Transfer-Encoding wins over Content-Length.
    if (head_.hasHeader("Transfer-Encoding")) {
        const std::string te = head_.header("Transfer-Encoding");
        if (!HasToken(te, "chunked")) {
            LOG_DEBUG << "unsupported transfer-encoding: " << te;
            return false;
        }
        chunked_ = true;
        return true;
    }
    remaining_ = 0;
    return !head_.hasHeader("Content-Length") ||
           ParseSize(TrimSpace(head_.header("Content-Length")), 10, &remaining_);
}

bool RequestParser::parseHead(network::Buffer* buf) {
    while (stage_ == Stage::kRequestLine || stage_ == Stage::kHeaders) {
        const char* crlf = buf->FindCRLF();
        if (crlf == nullptr) {
            return headBytes_ + buf->ReadableBytes() <= kMaxHeaderBytes;
        }
        const char* line = buf->Peek();
        headBytes_ += static_cast<size_t>(crlf + 2 - line);
        if (headBytes_ > kMaxHeaderBytes) return false;

        bool ok = true;
        if (stage_ == Stage::kRequestLine) {
            // An empty line here is a stray CRLF between pipelined requests.
            if (crlf != line) {
                ok = takeRequestLine(line, crlf);
                stage_ = Stage::kHeaders;
            }
        } else if (crlf == line) {
            ok = decideFraming();
            stage_ = Stage::kBody;
        } else {
            ok = takeHeader(line, crlf);
        }
        buf->RetrieveUntil(crlf + 2);
        if (!ok) return false;
    }
    return true;
}

void RequestParser::finish(const BodyCallback& onBody) {
    stage_ = Stage::kDone;
    onBody("", 0, true);
}

bool RequestParser::parseBody(network::Buffer* buf, const BodyCallback& onBody) {
    if (stage_ != Stage::kBody) return true;
    if (chunked_) return parseChunked(buf, onBody);

    const size_t n = std::min(remaining_, buf->ReadableBytes());
    remaining_ -= n;
    if (n == 0 && remaining_ > 0) return true;
    // Copied out first: the callback may re-enter and consume from buf.
    const std::string piece(buf->Peek(), n);
    buf->Retrieve(n);
    if (remaining_ == 0) stage_ = Stage::kDone;
    onBody(piece.data(), piece.size(), remaining_ == 0);
    return true;
}

bool RequestParser::parseChunked(network::Buffer* buf, const BodyCallback& onBody) {
    while (stage_ == Stage::kBody) {
        switch (chunk_) {
        case Chunk::kSize: {
            const char* crlf = buf->FindCRLF();
            if (crlf == nullptr) return buf->ReadableBytes() <= kMaxChunkLine;
            std::string line(buf->Peek(), crlf);
            buf->RetrieveUntil(crlf + 2);
            const size_t ext = line.find(';');
            if (ext != std::string::npos) line.resize(ext);
            if (!ParseSize(TrimSpace(line), 16, &remaining_)) return false;
            chunk_ = remaining_ == 0 ? Chunk::kTrailers : Chunk::kData;
            break;
        }
        case Chunk::kData: {
            const size_t n = std::min(remaining_, buf->ReadableBytes());
            if (n == 0) return true;
            const std::string piece(buf->Peek(), n);
            buf->Retrieve(n);
            remaining_ -= n;
            if (remaining_ == 0) chunk_ = Chunk::kDataEnd;
            onBody(piece.data(), piece.size(), false);
            break;
        }
        case Chunk::kDataEnd:
            if (buf->ReadableBytes() < 2) return true;
            if (buf->Peek()[0] != '\r' || buf->Peek()[1] != '\n') return false;
            buf->Retrieve(2);
            chunk_ = Chunk::kSize;
            break;
        case Chunk::kTrailers: {
            // Trailer fields are dropped up to the empty line.
            const char* crlf = buf->FindCRLF();
            if (crlf == nullptr) return buf->ReadableBytes() <= kMaxHeaderBytes;
            const bool blank = crlf == buf->Peek();
            buf->RetrieveUntil(crlf + 2);
            if (blank) finish(onBody);
            break;
        }
        }
    }
    return true;
}

} // namespace protocol
} // namespace portico
