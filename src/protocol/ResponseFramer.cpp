#include "portico/protocol/ResponseFramer.h"

#include <cstdio>

namespace portico {
namespace protocol {

namespace {

bool BodyForbidden(int status) {
    return (status >= 100 && status < 200) || status == 204 || status == 304;
}

std::string ChunkOf(const std::string& data) {
    char size[32];
    snprintf(size, sizeof size, "%zx\r\n", data.size());
    std::string out(size);
    out.append(data);
    out.append("\r\n");
    return out;
}

} // namespace

ResponseFramer::ResponseFramer(RequestHead::Version version, bool headRequest, bool keepAlive)
    : version_(version),
      headRequest_(headRequest),
      keepAlive_(keepAlive) {}

void ResponseFramer::setStatus(int status, const std::string& reason) {
    status_ = status;
    reason_ = reason;
}

void ResponseFramer::addHeader(const std::string& name, const std::string& value) {
    // Framing headers belong to the framer. A HEAD response may still advertise the length
    // of the body it omits.
    if (EqualsIgnoreCase(name, "Transfer-Encoding")) return;
    if (EqualsIgnoreCase(name, "Content-Length")) {
        appContentLength_ = value;
        return;
    }
    if (EqualsIgnoreCase(name, "Connection")) {
        if (HasToken(value, "close")) keepAlive_ = false;
        return;
    }
    headers_.emplace_back(name, value);
}

std::string ResponseFramer::head(Framing framing, size_t contentLength) {
    framing_ = framing;
    headWritten_ = true;

    const char* reason = reason_.empty() ? defaultReason(status_) : reason_.c_str();
    char line[64];
    snprintf(line, sizeof line, "HTTP/1.1 %d ", status_);
    std::string out(line);
    out.append(reason);
    out.append("\r\n");

    for (const auto& h : headers_) {
        out.append(h.first);
        out.append(": ");
        out.append(h.second);
        out.append("\r\n");
    }

    if (framing == kContentLength) {
        if (headRequest_ && !appContentLength_.empty()) {
            out.append("Content-Length: " + appContentLength_ + "\r\n");
        } else if (!BodyForbidden(status_)) {
            snprintf(line, sizeof line, "Content-Length: %zu\r\n", contentLength);
            out.append(line);
        }
    } else if (framing == kChunked) {
        out.append("Transfer-Encoding: chunked\r\n");
    }

    if (!keepAlive_) {
        out.append("Connection: close\r\n");
    } else if (version_ == RequestHead::kHttp10) {
        out.append("Connection: keep-alive\r\n");
    }
    out.append("\r\n");
    return out;
}

std::string ResponseFramer::write(const std::string& chunk) {
    if (finished_) return std::string();
    std::string out;
    if (!headWritten_) {
        Framing framing = kChunked;
        if (headRequest_ || BodyForbidden(status_)) {
            framing = kNone;
        } else if (version_ != RequestHead::kHttp11) {
            framing = kUntilClose;
            keepAlive_ = false;
        }
        out = head(framing, 0);
    }
    if (chunk.empty()) return out;
    if (framing_ == kChunked) {
        out.append(ChunkOf(chunk));
    } else if (framing_ == kUntilClose) {
        out.append(chunk);
    }
    return out;
}

std::string ResponseFramer::end(const std::string& chunk) {
    if (finished_) return std::string();
    std::string out;
    if (!headWritten_) {
        out = head(kContentLength, chunk.size());
        if (!headRequest_ && !BodyForbidden(status_)) out.append(chunk);
    } else {
        out = write(chunk);
        if (framing_ == kChunked) out.append("0\r\n\r\n");
    }
    finished_ = true;
    return out;
}

const char* ResponseFramer::defaultReason(int status) {
    switch (status) {
        case 100: return "Continue";
        case 101: return "Switching Protocols";
        case 200: return "OK";
        case 201: return "Created";
        case 202: return "Accepted";
        case 204: return "No Content";
        case 206: return "Partial Content";
        case 301: return "Moved Permanently";
        case 302: return "Found";
        case 303: return "See Other";
        case 304: return "Not Modified";
        case 307: return "Temporary Redirect";
        case 308: return "Permanent Redirect";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 408: return "Request Timeout";
        case 409: return "Conflict";
        case 410: return "Gone";
        case 411: return "Length Required";
        case 413: return "Content Too Large";
        case 415: return "Unsupported Media Type";
        case 422: return "Unprocessable Content";
        case 429: return "Too Many Requests";
        case 431: return "Request Header Fields Too Large";
        case 500: return "Internal Server Error";
        case 501: return "Not Implemented";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        case 504: return "Gateway Timeout";
        default: return "Unknown";
    }
}

} // namespace protocol
} // namespace portico
