#include "portico/adapter/AdapterOptions.h"
#include "portico/common/Config.h"
#include "portico/common/Env.h"
#include "portico/http/Headers.h"

#include <stdexcept>

namespace portico {
namespace adapter {

AdapterOptions AdapterOptions::FromEnvironment() {
    AdapterOptions options;
    auto origin = common::GetEnv("ORIGIN");
    if (origin && !origin->empty()) {
        options.origin = *origin;
    }
    auto trust = common::GetEnv("TRUST_PROXY");
    options.trustProxy = trust && *trust == "1";
    return options;
}

AdapterOptions AdapterOptions::FromConfig(const common::Config& config) {
    AdapterOptions options = FromEnvironment();

    const std::string origin = config.GetString("adapter", "origin", "");
    if (!origin.empty()) {
        options.origin = origin;
    }
    if (config.Has("adapter", "trust_proxy")) {
        options.trustProxy = config.GetBool("adapter", "trust_proxy", false);
    }
    const int highWaterKb = config.GetInt("adapter", "body_high_water_kb", 64);
    if (highWaterKb > 0) {
        options.bodyHighWaterMark = static_cast<size_t>(highWaterKb) * 1024;
    }

    if (config.GetBool("tls", "enable", false)) {
        Tls tls;
        tls.certPath = config.GetString("tls", "cert_path", "");
        tls.keyPath = config.GetString("tls", "key_path", "");
        options.tls = tls;
    }
    return options;
}

void AdapterOptions::Validate() const {
    if (tls && (tls->certPath.empty() || tls->keyPath.empty())) {
        throw std::invalid_argument("TLS requires certificate and key paths");
    }
    if (origin) {
        ParseOrigin(*origin);
    }
}

Origin ParseOrigin(const std::string& origin) {
    const size_t sep = origin.find("://");
    if (sep == std::string::npos || sep == 0) {
        throw std::invalid_argument("origin must look like scheme://host: " + origin);
    }
    Origin out;
    out.scheme = http::Headers::ToLower(origin.substr(0, sep));
    const size_t hostStart = sep + 3;
    const size_t hostEnd = origin.find_first_of("/?#", hostStart);
    out.host = origin.substr(hostStart, hostEnd == std::string::npos ? std::string::npos : hostEnd - hostStart);
    if (out.host.empty()) {
        throw std::invalid_argument("origin has no host: " + origin);
    }
    return out;
}

} // namespace adapter
} // namespace portico
