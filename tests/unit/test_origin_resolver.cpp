#include "portico/adapter/AdapterOptions.h"
#include "portico/adapter/OriginResolver.h"
#include "portico/common/Logger.h"
#include "portico/http/Headers.h"

#include <cassert>
#include <sstream>
#include <stdexcept>
#include <string>

using namespace portico::adapter;
using namespace portico::common;
using portico::http::Headers;

static const std::string kPeer4("\x0a\x00\x00\x05", 4);

static ResolvedOrigin ResolveWith(const AdapterOptions& options,
                                  const Headers& headers,
                                  const std::string& peer,
                                  bool tls,
                                  const std::string& path = "/p",
                                  const std::string& query = "") {
    OriginResolver resolver(options);
    return OriginResolver::Resolve(resolver.Describe(headers, peer, tls), path, query);
}

void testConfiguredOriginWins() {
    AdapterOptions options;
    options.origin = "https://example.com:8443";
    options.trustProxy = true;
    Headers headers{{"host", "internal"},
                    {"x-forwarded-proto", "http"},
                    {"x-forwarded-host", "proxy.local"}};
    ResolvedOrigin o = ResolveWith(options, headers, kPeer4, false, "/a/b", "x=1&y=2");
    assert(o.scheme == "https");
    assert(o.host == "example.com:8443");
    assert(o.url == "https://example.com:8443/a/b?x=1&y=2");
    LOG_INFO << "Configured origin PASS";
}

void testForwardedHeadersIgnoredWithoutTrust() {
    AdapterOptions options;
    Headers headers{{"host", "app.test"},
                    {"x-forwarded-proto", "https"},
                    {"x-forwarded-host", "public.test"},
                    {"x-forwarded-for", "9.9.9.9"}};
    ResolvedOrigin o = ResolveWith(options, headers, kPeer4, false);
    assert(o.scheme == "http");
    assert(o.host == "app.test");
    assert(o.ip == "10.0.0.5");
    assert(o.url == "http://app.test/p");
    LOG_INFO << "Untrusted forwarding PASS";
}

void testTrustedForwarding() {
    AdapterOptions options;
    options.trustProxy = true;
    Headers headers{{"host", "app.test"},
                    {"x-forwarded-proto", " https , http"},
                    {"x-forwarded-host", "public.test, other.test"},
                    {"x-forwarded-for", "1.2.3.4, 5.6.7.8"}};
    ResolvedOrigin o = ResolveWith(options, headers, kPeer4, false);
    assert(o.scheme == "https");
    assert(o.host == "public.test");
    assert(o.ip == "1.2.3.4");
    assert(o.url == "https://public.test/p");

    // Trusted but absent: fall back to the connection.
    Headers plain{{"host", "app.test"}};
    ResolvedOrigin fallback = ResolveWith(options, plain, kPeer4, true);
    assert(fallback.scheme == "https");
    assert(fallback.host == "app.test");
    assert(fallback.ip == "10.0.0.5");
    LOG_INFO << "Trusted forwarding PASS";
}

void testHostFallbacks() {
    AdapterOptions options;
    ResolvedOrigin byPeer = ResolveWith(options, Headers(), kPeer4, false);
    assert(byPeer.host == "10.0.0.5");
    assert(byPeer.url == "http://10.0.0.5/p");

    std::string peer6(16, '\0');
    peer6[0] = '\x20';
    peer6[1] = '\x01';
    peer6[15] = '\x01';
    ResolvedOrigin byPeer6 = ResolveWith(options, Headers(), peer6, false);
    assert(byPeer6.ip == "2001:0:0:0:0:0:0:1");
    assert(byPeer6.host == "[2001:0:0:0:0:0:0:1]");

    std::ostringstream captured;
    Logger::Instance().SetOutput(&captured);
    ResolvedOrigin nothing = ResolveWith(options, Headers(), std::string(), false, "/x");
    ResolvedOrigin again = ResolveWith(options, Headers(), std::string(), false, "/y");
    Logger::Instance().SetOutput(nullptr);
    assert(nothing.host == "localhost");
    assert(nothing.ip.empty());
    assert(nothing.url == "http://localhost/x");
    assert(again.url == "http://localhost/y");

    // Warned once per process.
    const std::string log = captured.str();
    const size_t first = log.find("Could not determine the origin host");
    assert(first != std::string::npos);
    assert(log.find("Could not determine the origin host", first + 1) == std::string::npos);
    LOG_INFO << "Host fallbacks PASS";
}

void testUrlIsNotNormalized() {
    AdapterOptions options;
    Headers headers{{"host", "h"}};
    ResolvedOrigin o = ResolveWith(options, headers, kPeer4, false, "/a%20b/../c", "q=%2F&&");
    assert(o.url == "http://h/a%20b/../c?q=%2F&&");
    ResolvedOrigin noQuery = ResolveWith(options, headers, kPeer4, false, "/", "");
    assert(noQuery.url == "http://h/");
    LOG_INFO << "URL verbatim PASS";
}

void testMalformedOriginRejected() {
    bool threw = false;
    try {
        AdapterOptions options;
        options.origin = "example.com";
        OriginResolver resolver(options);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        ParseOrigin("https://");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    Origin o = ParseOrigin("HTTPS://api.example.com/ignored?x");
    assert(o.scheme == "https");
    assert(o.host == "api.example.com");
    LOG_INFO << "Malformed origin PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);
    testConfiguredOriginWins();
    testForwardedHeadersIgnoredWithoutTrust();
    testTrustedForwarding();
    testHostFallbacks();
    testUrlIsNotNormalized();
    testMalformedOriginRejected();
    return 0;
}
