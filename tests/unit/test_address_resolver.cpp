#include "portico/adapter/AddressResolver.h"
#include "portico/common/Logger.h"

#include <cassert>
#include <string>

using namespace portico::adapter;
using namespace portico::common;

static std::string Bytes(std::initializer_list<int> values) {
    std::string out;
    for (int v : values) out.push_back(static_cast<char>(v));
    return out;
}

void testIpv4() {
    assert(IpAddressBytesToString(Bytes({127, 0, 0, 1})) == "127.0.0.1");
    assert(IpAddressBytesToString(Bytes({255, 255, 255, 255})) == "255.255.255.255");
    assert(IpAddressBytesToString(Bytes({10, 0, 200, 7})) == "10.0.200.7");
    LOG_INFO << "IPv4 PASS";
}

void testIpv4Mapped() {
    const std::string mapped = Bytes({0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0xff, 0xff, 192, 168, 1, 20});
    assert(IpAddressBytesToString(mapped) == "192.168.1.20");
    assert(IpAddressBytesToString(mapped) == IpAddressBytesToString(Bytes({192, 168, 1, 20})));

    // Only ::ffff:0:0/96 is mapped; a non-zero prefix byte makes it plain IPv6.
    const std::string notMapped = Bytes({0, 1, 0, 0, 0, 0, 0, 0, 0, 0, 0xff, 0xff, 192, 168, 1, 20});
    assert(IpAddressBytesToString(notMapped) == "1:0:0:0:0:ffff:c0a8:114");
    LOG_INFO << "IPv4-mapped PASS";
}

void testIpv6() {
    const std::string doc = Bytes({0x20, 0x01, 0x0d, 0xb8, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 1});
    assert(IpAddressBytesToString(doc) == "2001:db8:0:0:0:0:0:1");

    const std::string loopback = Bytes({0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 1});
    assert(IpAddressBytesToString(loopback) == "0:0:0:0:0:0:0:1");

    const std::string upper = Bytes({0xfe, 0x80, 0, 0, 0, 0, 0, 0, 0xAB, 0xCD, 0x00, 0x0f, 0, 0, 0x10, 0});
    assert(IpAddressBytesToString(upper) == "fe80:0:0:0:abcd:f:0:1000");
    LOG_INFO << "IPv6 PASS";
}

void testOtherLengths() {
    assert(IpAddressBytesToString("").empty());
    assert(IpAddressBytesToString(Bytes({1, 2, 3})).empty());
    assert(IpAddressBytesToString(std::string(8, '\0')).empty());
    assert(IpAddressBytesToString(std::string(17, '\x01')).empty());
    LOG_INFO << "Other lengths PASS";
}

void testDottedQuadFields() {
    for (int a = 0; a < 256; a += 17) {
        const std::string ip = IpAddressBytesToString(Bytes({a, 255 - a, a / 2, 1}));
        int parts = 1;
        for (char c : ip) {
            if (c == '.') ++parts;
        }
        assert(parts == 4);
        assert(ip == std::to_string(a) + "." + std::to_string(255 - a) + "." +
                     std::to_string(a / 2) + ".1");
    }
    LOG_INFO << "Dotted quad fields PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);
    testIpv4();
    testIpv4Mapped();
    testIpv6();
    testOtherLengths();
    testDottedQuadFields();
    return 0;
}
