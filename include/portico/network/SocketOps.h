#pragma once

#include "portico/network/InetAddress.h"

namespace portico {
namespace network {
namespace sockets {

// Non-blocking listening socket bound to addr, or -1 with the cause logged.
// IPv6 listeners also accept IPv4 peers as ::ffff:a.b.c.d.
int OpenListener(const InetAddress& addr, bool reusePort);

// Non-blocking accepted fd, or -1 with errno set.
int AcceptPeer(int listenFd, InetAddress* peer);

// TCP_NODELAY and SO_KEEPALIVE for an accepted connection.
void TuneConnection(int fd);

void ShutdownWrite(int fd);
void Close(int fd);

// SO_ERROR of fd.
int PendingError(int fd);
InetAddress LocalAddress(int fd);

} // namespace sockets
} // namespace network
} // namespace portico
