#pragma once

// POSIX socket helpers for the SSH transport.

#include <poll.h>
#include <string>
#include <core/types.hpp>

using socket_t = int;
#define HOPSSH_INVALID_SOCKET (-1)

namespace platform {

// Resolve host and open a TCP connection, waiting at most timeout_secs.
// Fails with ErrorKind::Connection; cause carries the resolver/errno text.
Result<socket_t> connect_tcp(const std::string& host, int port, int timeout_secs);

// Set a socket to non-blocking mode.
void set_nonblocking(socket_t sock);

// Enable TCP keepalive probes on an established socket.
void enable_tcp_keepalive(socket_t sock);

// Poll events on a single socket. Returns revents, or 0 on timeout.
int poll_socket(socket_t sock, short events, int timeout_ms);

// Close a socket.
void close_socket(socket_t sock);

} // namespace platform
