#include "portico/adapter/AddressResolver.h"

#include <cstdio>

namespace portico {
namespace adapter {

namespace {

std::string DottedQuad(const unsigned char* b) {
    char buf[16];
    snprintf(buf, sizeof buf, "%u.%u.%u.%u", b[0], b[1], b[2], b[3]);
    return buf;
}

bool IsV4Mapped(const unsigned char* b) {
    for (int i = 0; i < 10; ++i) {
        if (b[i] != 0) return false;
    }
    return b[10] == 0xff && b[11] == 0xff;
}

} // namespace

std::string IpAddressBytesToString(const std::string& bytes) {
    const auto* b = reinterpret_cast<const unsigned char*>(bytes.data());
    if (bytes.size() == 4) {
        return DottedQuad(b);
    }
    if (bytes.size() != 16) {
        return std::string();
    }
    if (IsV4Mapped(b)) {
        return DottedQuad(b + 12);
    }

    std::string out;
    out.reserve(39);
    char group[8];
    for (int i = 0; i < 16; i += 2) {
        if (i > 0) out.push_back(':');
        snprintf(group, sizeof group, "%x", (static_cast<unsigned>(b[i]) << 8) | b[i + 1]);
        out.append(group);
    }
    return out;
}

} // namespace adapter
} // namespace portico
