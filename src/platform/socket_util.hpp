#pragma once

// Socket helpers for the SSH transport.

#include <string>
#include <poll.h>

using socket_t = int;
#define RPCTL_INVALID_SOCKET (-1)

namespace platform {

// Set a socket to non-blocking mode.
void set_nonblocking(socket_t sock);

// Poll events on a single socket. Returns revents, or 0 on timeout.
// events: POLLIN, POLLOUT, etc.
int poll_socket(socket_t sock, short events, int timeout_ms);

// Open a TCP connection to host:port within timeout_ms.
// Returns RPCTL_INVALID_SOCKET and fills `error` on failure.
socket_t connect_tcp(const std::string& host, int port, int timeout_ms, std::string& error);

// Close a socket.
void close_socket(socket_t sock);

} // namespace platform
