#include "portico/network/SocketOps.h"
#include "portico/common/Logger.h"

#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace portico {
namespace network {
namespace sockets {

namespace {

bool SetFlag(int fd, int level, int name, bool on) {
    const int value = on ? 1 : 0;
    return ::setsockopt(fd, level, name, &value, sizeof value) == 0;
}

} // namespace

int OpenListener(const InetAddress& addr, bool reusePort) {
    int fd = ::socket(addr.family(), SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, IPPROTO_TCP);
    if (fd < 0) {
        LOG_ERROR << "socket() failed: " << std::strerror(errno);
        return -1;
    }
    SetFlag(fd, SOL_SOCKET, SO_REUSEADDR, true);
    if (reusePort && !SetFlag(fd, SOL_SOCKET, SO_REUSEPORT, true)) {
        LOG_WARN << "SO_REUSEPORT unavailable: " << std::strerror(errno);
    }
    if (addr.isIpv6() && !SetFlag(fd, IPPROTO_IPV6, IPV6_V6ONLY, false)) {
        LOG_WARN << "could not clear IPV6_V6ONLY: " << std::strerror(errno);
    }
    if (::bind(fd, addr.getSockAddr(), addr.getSockLen()) != 0) {
        LOG_ERROR << "bind " << addr.toIpPort() << " failed: " << std::strerror(errno);
        ::close(fd);
        return -1;
    }
    if (::listen(fd, SOMAXCONN) != 0) {
        LOG_ERROR << "listen " << addr.toIpPort() << " failed: " << std::strerror(errno);
        ::close(fd);
        return -1;
    }
    return fd;
}

int AcceptPeer(int listenFd, InetAddress* peer) {
    sockaddr_storage storage;
    std::memset(&storage, 0, sizeof storage);
    socklen_t len = sizeof storage;
    int fd = ::accept4(listenFd, reinterpret_cast<sockaddr*>(&storage), &len,
                       SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (fd >= 0) {
        peer->setSockAddr(storage);
    }
    return fd;
}

void TuneConnection(int fd) {
    SetFlag(fd, IPPROTO_TCP, TCP_NODELAY, true);
    SetFlag(fd, SOL_SOCKET, SO_KEEPALIVE, true);
}

void ShutdownWrite(int fd) {
    if (::shutdown(fd, SHUT_WR) < 0) {
        LOG_DEBUG << "shutdown(SHUT_WR) fd=" << fd << ": " << std::strerror(errno);
    }
}

void Close(int fd) {
    if (::close(fd) < 0) {
        LOG_ERROR << "close fd=" << fd << ": " << std::strerror(errno);
    }
}

int PendingError(int fd) {
    int value = 0;
    socklen_t len = sizeof value;
    if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &value, &len) < 0) {
        return errno;
    }
    return value;
}

InetAddress LocalAddress(int fd) {
    sockaddr_storage storage;
    std::memset(&storage, 0, sizeof storage);
    socklen_t len = sizeof storage;
    InetAddress local;
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&storage), &len) < 0) {
        LOG_ERROR << "getsockname fd=" << fd << ": " << std::strerror(errno);
        return local;
    }
    local.setSockAddr(storage);
    return local;
}

} // namespace sockets
} // namespace network
} // namespace portico
