#include "portico/adapter/OriginResolver.h"
#include "portico/adapter/AddressResolver.h"
#include "portico/common/Logger.h"

#include <cctype>
#include <mutex>

namespace portico {
namespace adapter {

namespace {

std::once_flag gLocalhostWarning;

std::string Trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

// An IPv6 literal needs brackets in the authority part of a URL.
std::string HostFromIp(const std::string& ip) {
    if (ip.find(':') != std::string::npos) return "[" + ip + "]";
    return ip;
}

} // namespace

OriginResolver::OriginResolver(const AdapterOptions& options)
    : trustProxy_(options.trustProxy) {
    if (options.origin) {
        origin_ = ParseOrigin(*options.origin);
    }
}

ConnectionInfo OriginResolver::Describe(const http::Headers& headers,
                                        const std::string& peerAddressBytes,
                                        bool tls) const {
    ConnectionInfo info;
    info.peerIp = IpAddressBytesToString(peerAddressBytes);
    info.tls = tls;
    info.trustProxy = trustProxy_;
    info.origin = origin_;
    info.headers = &headers;
    return info;
}

std::string OriginResolver::ForwardedValue(const http::Headers& headers, const std::string& name) {
    auto value = headers.Get("x-forwarded-" + name);
    if (!value) return std::string();
    return Trim(value->substr(0, value->find(',')));
}

ResolvedOrigin OriginResolver::Resolve(const ConnectionInfo& connection,
                                       const std::string& rawPath,
                                       const std::string& rawQuery) {
    static const http::Headers kNoHeaders;
    const http::Headers& headers = connection.headers ? *connection.headers : kNoHeaders;

    ResolvedOrigin out;
    if (connection.origin) {
        out.scheme = connection.origin->scheme;
        out.host = connection.origin->host;
    }

    if (out.scheme.empty() && connection.trustProxy) {
        out.scheme = ForwardedValue(headers, "proto");
    }
    if (out.scheme.empty()) {
        out.scheme = connection.tls ? "https" : "http";
    }

    if (out.host.empty() && connection.trustProxy) {
        out.host = ForwardedValue(headers, "host");
    }
    if (out.host.empty()) {
        out.host = headers.Get("host").value_or(std::string());
    }
    if (out.host.empty() && !connection.peerIp.empty()) {
        out.host = HostFromIp(connection.peerIp);
    }
    if (out.host.empty()) {
        std::call_once(gLocalhostWarning, [] {
            LOG_WARN << "Could not determine the origin host, using 'localhost'. "
                     << "Set [adapter] origin or the ORIGIN environment variable.";
        });
        out.host = "localhost";
    }

    if (connection.trustProxy) {
        out.ip = ForwardedValue(headers, "for");
    }
    if (out.ip.empty()) {
        out.ip = connection.peerIp;
    }

    out.url = out.scheme + "://" + out.host + rawPath;
    if (!rawQuery.empty()) {
        out.url += "?" + rawQuery;
    }
    return out;
}

} // namespace adapter
} // namespace portico
