#pragma once

#include <netinet/in.h>
#include <cstdint>
#include <string>

namespace portico {
namespace network {

// IPv4 or IPv6 socket address.
class InetAddress {
public:
    explicit InetAddress(uint16_t port = 0, bool loopbackOnly = false, bool ipv6 = false);
    // ip may be a dotted-quad or an IPv6 literal (without brackets).
    InetAddress(const std::string& ip, uint16_t port);
    explicit InetAddress(const struct sockaddr_in& addr);
    explicit InetAddress(const struct sockaddr_in6& addr);

    sa_family_t family() const { return addr_.sin6_family; }
    bool isIpv6() const { return family() == AF_INET6; }
    bool valid() const { return valid_; }

    std::string toIp() const;
    std::string toIpPort() const;
    uint16_t toPort() const;
    // Raw network-order address bytes: 4 for IPv4, 16 for IPv6.
    std::string toBytes() const;

    const struct sockaddr* getSockAddr() const { return reinterpret_cast<const struct sockaddr*>(&addr_); }
    socklen_t getSockLen() const;
    void setSockAddr(const struct sockaddr_storage& addr);

private:
    const struct sockaddr_in* v4() const { return reinterpret_cast<const struct sockaddr_in*>(&addr_); }
    struct sockaddr_in* v4() { return reinterpret_cast<struct sockaddr_in*>(&addr_); }

    // sockaddr_in6 is large enough to hold either family.
    struct sockaddr_in6 addr_;
    bool valid_{true};
};

} // namespace network
} // namespace portico
