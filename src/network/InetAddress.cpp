#include "portico/network/InetAddress.h"

#include <arpa/inet.h>
#include <cstdio>
#include <cstring>

namespace portico {
namespace network {

InetAddress::InetAddress(uint16_t port, bool loopbackOnly, bool ipv6) {
    std::memset(&addr_, 0, sizeof addr_);
    if (ipv6) {
        addr_.sin6_family = AF_INET6;
        addr_.sin6_addr = loopbackOnly ? in6addr_loopback : in6addr_any;
        addr_.sin6_port = htons(port);
    } else {
        v4()->sin_family = AF_INET;
        in_addr_t ip = loopbackOnly ? INADDR_LOOPBACK : INADDR_ANY;
        v4()->sin_addr.s_addr = htonl(ip);
        v4()->sin_port = htons(port);
    }
}

InetAddress::InetAddress(const std::string& ip, uint16_t port) {
    std::memset(&addr_, 0, sizeof addr_);
    if (ip.find(':') != std::string::npos) {
        addr_.sin6_family = AF_INET6;
        addr_.sin6_port = htons(port);
        valid_ = ::inet_pton(AF_INET6, ip.c_str(), &addr_.sin6_addr) == 1;
    } else {
        v4()->sin_family = AF_INET;
        v4()->sin_port = htons(port);
        valid_ = ::inet_pton(AF_INET, ip.c_str(), &v4()->sin_addr) == 1;
    }
}

InetAddress::InetAddress(const struct sockaddr_in& addr) {
    std::memset(&addr_, 0, sizeof addr_);
    *v4() = addr;
}

InetAddress::InetAddress(const struct sockaddr_in6& addr)
    : addr_(addr) {
}

void InetAddress::setSockAddr(const struct sockaddr_storage& addr) {
    std::memset(&addr_, 0, sizeof addr_);
    if (addr.ss_family == AF_INET6) {
        std::memcpy(&addr_, &addr, sizeof(struct sockaddr_in6));
    } else {
        std::memcpy(&addr_, &addr, sizeof(struct sockaddr_in));
    }
    valid_ = true;
}

socklen_t InetAddress::getSockLen() const {
    return isIpv6() ? static_cast<socklen_t>(sizeof(struct sockaddr_in6))
                    : static_cast<socklen_t>(sizeof(struct sockaddr_in));
}

std::string InetAddress::toIp() const {
    char buf[INET6_ADDRSTRLEN] = "";
    if (isIpv6()) {
        ::inet_ntop(AF_INET6, &addr_.sin6_addr, buf, sizeof buf);
    } else {
        ::inet_ntop(AF_INET, &v4()->sin_addr, buf, sizeof buf);
    }
    return buf;
}

std::string InetAddress::toIpPort() const {
    char port[8];
    snprintf(port, sizeof port, "%u", toPort());
    if (isIpv6()) {
        return "[" + toIp() + "]:" + port;
    }
    return toIp() + ":" + port;
}

uint16_t InetAddress::toPort() const {
    return ntohs(isIpv6() ? addr_.sin6_port : v4()->sin_port);
}

std::string InetAddress::toBytes() const {
    if (isIpv6()) {
        return std::string(reinterpret_cast<const char*>(&addr_.sin6_addr), 16);
    }
    return std::string(reinterpret_cast<const char*>(&v4()->sin_addr), 4);
}

} // namespace network
} // namespace portico
