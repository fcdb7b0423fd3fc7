#pragma once

// Cross-platform socket utilities.

#ifdef _WIN32
#  define WIN32_LEAN_AND_MEAN
#  include <winsock2.h>
#  include <ws2tcpip.h>
   using socket_t = SOCKET;
#  define TANDEM_INVALID_SOCKET INVALID_SOCKET
   // WSAPoll uses the same constants as POSIX poll
#else
#  include <poll.h>
   using socket_t = int;
#  define TANDEM_INVALID_SOCKET (-1)
#endif

#include <string>

namespace platform {

// Initialize networking (WSAStartup on Windows, no-op on Unix).
void init_networking();

// Set a socket to non-blocking mode.
void set_nonblocking(socket_t sock);

// Poll events on a single socket. Returns revents, or 0 on timeout.
// events: POLLIN, POLLOUT, etc.
int poll_socket(socket_t sock, short events, int timeout_ms);

// Close a socket.
void close_socket(socket_t sock);

// Open a non-blocking TCP connection to host:port, waiting at most timeout_ms.
// Returns the connected socket, or TANDEM_INVALID_SOCKET with `error` set.
socket_t connect_tcp(const std::string& host, int port, int timeout_ms,
                     std::string* error = nullptr);

// Lightweight reachability check: connect and immediately close.
bool tcp_reachable(const std::string& host, int port, int timeout_ms);

} // namespace platform
