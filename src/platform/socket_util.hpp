#pragma once

// Socket utilities.

#include <string>
#include <poll.h>

using socket_t = int;
#define MAILPROBE_INVALID_SOCKET (-1)

namespace platform {

// Set a socket to non-blocking mode.
void set_nonblocking(socket_t sock);

// Poll events on a single socket. Returns revents, or 0 on timeout.
// events: POLLIN, POLLOUT, etc.
int poll_socket(socket_t sock, short events, int timeout_ms);

// Close a socket.
void close_socket(socket_t sock);

// Resolve host and open a non-blocking TCP connection, waiting at most
// timeout_ms for the handshake. Returns MAILPROBE_INVALID_SOCKET on failure
// and fills `error` with a human-readable reason.
socket_t connect_tcp(const std::string& host, int port, int timeout_ms, std::string& error);

} // namespace platform
