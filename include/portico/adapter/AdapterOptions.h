#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace portico {
namespace common {
class Config;
} // namespace common

namespace adapter {

// Process-wide adapter settings, read once at startup.
struct AdapterOptions {
    struct Tls {
        std::string certPath;
        std::string keyPath;
    };

    // "scheme://host[:port]" used verbatim as the external origin.
    std::optional<std::string> origin;
    // Honor x-forwarded-* headers.
    bool trustProxy{false};
    // TLS termination in this process.
    std::optional<Tls> tls;
    // Request body bytes buffered before the native engine pauses reading.
    size_t bodyHighWaterMark{64 * 1024};

    // ORIGIN and TRUST_PROXY ("1") from the environment.
    static AdapterOptions FromEnvironment();
    // [adapter] and [tls] sections; unset keys fall back to the environment.
    static AdapterOptions FromConfig(const common::Config& config);

    // Throws std::invalid_argument on an unusable combination.
    void Validate() const;
};

struct Origin {
    std::string scheme;
    std::string host;
};

// Splits "scheme://host[:port][/...]". Throws std::invalid_argument when either part is missing.
Origin ParseOrigin(const std::string& origin);

} // namespace adapter
} // namespace portico
