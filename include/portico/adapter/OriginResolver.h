#pragma once

#include "portico/adapter/AdapterOptions.h"
#include "portico/http/Headers.h"

#include <optional>
#include <string>

namespace portico {
namespace adapter {

// What the adapter knows about the connection a request arrived on.
struct ConnectionInfo {
    // Resolved before the handler runs; empty when the engine has no peer address.
    std::string peerIp;
    bool tls{false};
    bool trustProxy{false};
    std::optional<Origin> origin;
    // Request headers, read for x-forwarded-*. Not owned.
    const http::Headers* headers{nullptr};
};

struct ResolvedOrigin {
    std::string scheme;
    std::string host;
    // Client address exposed to the handler.
    std::string ip;
    std::string url;
};

class OriginResolver {
public:
    // Throws std::invalid_argument for a malformed origin.
    explicit OriginResolver(const AdapterOptions& options);

    bool trustProxy() const { return trustProxy_; }
    const std::optional<Origin>& origin() const { return origin_; }

    ConnectionInfo Describe(const http::Headers& headers,
                            const std::string& peerAddressBytes,
                            bool tls) const;

    // First match wins: configured origin, trusted x-forwarded-proto/host, then the
    // connection itself (TLS flag, host header, peer address, "localhost").
    static ResolvedOrigin Resolve(const ConnectionInfo& connection,
                                  const std::string& rawPath,
                                  const std::string& rawQuery);

    // Leftmost comma separated value of x-forwarded-<name>, trimmed.
    static std::string ForwardedValue(const http::Headers& headers, const std::string& name);

private:
    std::optional<Origin> origin_;
    bool trustProxy_;
};

} // namespace adapter
} // namespace portico
