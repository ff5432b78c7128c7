#include "portico/adapter/AdapterOptions.h"
#include "portico/common/Config.h"
#include "portico/common/Env.h"
#include "portico/common/Logger.h"
#include "portico/engine/EventServer.h"
#include "portico/network/InetAddress.h"

#include <cassert>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>
#include <unistd.h>

using namespace portico::adapter;
using namespace portico::common;
using portico::engine::EventServerOptions;

void testConfigParsing() {
    auto& conf = Config::Instance();
    conf.Clear();
    assert(conf.LoadFromString(
        "; comment\n"
        "top_level = yes\n"
        "[adapter]\n"
        "  origin =  https://example.com  \n"
        "# another comment\n"
        "trust_proxy = on\n"
        "[numbers]\n"
        "i = 42\n"
        "d = 2.5\n"
        "bad = abc\n"));
    // Keys before any section land in [global].
    assert(conf.GetBool("global", "top_level", false));
    assert(conf.GetString("adapter", "origin") == "https://example.com");
    assert(conf.GetBool("adapter", "trust_proxy"));
    assert(conf.GetInt("numbers", "i") == 42);
    assert(conf.GetDouble("numbers", "d") == 2.5);
    assert(conf.GetInt("numbers", "bad", 7) == 7);
    assert(conf.GetBool("numbers", "bad", true));
    assert(!conf.Has("numbers", "missing"));
    assert(conf.GetString("missing", "key", "dflt") == "dflt");

    conf.SetString("numbers", "i", "43");
    assert(conf.GetInt("numbers", "i") == 43);
    assert(!conf.LoadedFilename().has_value());
    LOG_INFO << "Config parsing PASS";
}

void testConfigFile() {
    char path[] = "/tmp/portico_conf_XXXXXX";
    const int fd = ::mkstemp(path);
    assert(fd >= 0);
    ::close(fd);
    {
        std::ofstream out(path);
        out << "[global]\nlisten_port = 9123\nthreads = 3\nreuse_port = 1\n"
            << "[connection_limit]\nmax_total = 50\nidle_timeout_sec = 1.5\nwrite_high_water_kb = 8\n";
    }
    auto& conf = Config::Instance();
    assert(conf.Load(path));
    assert(conf.LoadedFilename().value() == path);

    EventServerOptions options = EventServerOptions::FromConfig(conf);
    assert(options.listenAddr.toPort() == 9123);
    assert(options.threads == 3);
    assert(options.reusePort);
    assert(options.maxConnections == 50);
    assert(options.idleTimeoutSec == 1.5);
    assert(options.writeHighWaterMark == 8 * 1024);
    ::unlink(path);

    assert(!conf.Load("/nonexistent/portico.conf"));
    LOG_INFO << "Config file PASS";
}

void testEnvironmentDefaults() {
    ::setenv("ORIGIN", "http://env.example", 1);
    ::setenv("TRUST_PROXY", "1", 1);
    AdapterOptions fromEnv = AdapterOptions::FromEnvironment();
    assert(fromEnv.origin.value() == "http://env.example");
    assert(fromEnv.trustProxy);

    ::setenv("TRUST_PROXY", "true", 1);
    assert(!AdapterOptions::FromEnvironment().trustProxy);

    auto& conf = Config::Instance();
    conf.Clear();
    conf.SetString("adapter", "trust_proxy", "0");
    AdapterOptions configured = AdapterOptions::FromConfig(conf);
    // Environment fills what the file leaves out; the file wins where it speaks.
    assert(configured.origin.value() == "http://env.example");
    assert(!configured.trustProxy);

    conf.SetString("adapter", "origin", "https://file.example");
    assert(AdapterOptions::FromConfig(conf).origin.value() == "https://file.example");

    ::unsetenv("ORIGIN");
    ::unsetenv("TRUST_PROXY");
    assert(!GetEnv("ORIGIN").has_value());
    assert(!AdapterOptions::FromEnvironment().origin.has_value());
    LOG_INFO << "Environment defaults PASS";
}

void testValidation() {
    auto& conf = Config::Instance();
    conf.Clear();
    conf.SetString("tls", "enable", "1");
    conf.SetString("tls", "cert_path", "/etc/cert.pem");
    AdapterOptions tls = AdapterOptions::FromConfig(conf);
    assert(tls.tls.has_value());

    bool threw = false;
    try {
        tls.Validate();
    } catch (const std::invalid_argument& e) {
        threw = std::string(e.what()) == "TLS requires certificate and key paths";
    }
    assert(threw);

    conf.SetString("tls", "key_path", "/etc/key.pem");
    AdapterOptions complete = AdapterOptions::FromConfig(conf);
    complete.Validate();

    AdapterOptions badOrigin;
    badOrigin.origin = "no-scheme.example";
    threw = false;
    try {
        badOrigin.Validate();
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    conf.Clear();
    conf.SetString("adapter", "body_high_water_kb", "16");
    assert(AdapterOptions::FromConfig(conf).bodyHighWaterMark == 16 * 1024);
    LOG_INFO << "Validation PASS";
}

void testLogLevelParsing() {
    Logger& logger = Logger::Instance();
    assert(logger.ParseLevel("DEBUG") == LogLevel::DEBUG);
    assert(logger.ParseLevel("ERROR") == LogLevel::ERROR);
    assert(logger.ParseLevel("bogus") == LogLevel::INFO);
    LOG_INFO << "Log level PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);
    testConfigParsing();
    testConfigFile();
    testEnvironmentDefaults();
    testValidation();
    testLogLevelParsing();
    return 0;
}
