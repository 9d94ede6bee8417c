#pragma once

// Socket utilities shared by the SSH transport, tunnels and attach sockets.

#include <poll.h>
#include <cstddef>
#include <string>

using socket_t = int;
#define RECON_INVALID_SOCKET (-1)

namespace platform {

// Set a socket to non-blocking mode.
void set_nonblocking(socket_t sock);

// Poll events on a single socket. Returns revents, or 0 on timeout.
// events: POLLIN, POLLOUT, etc.
int poll_socket(socket_t sock, short events, int timeout_ms);

// Close a socket.
void close_socket(socket_t sock);

// A bound, listening socket.
struct Listener {
    socket_t fd = RECON_INVALID_SOCKET;
    int port = 0;             // TCP listeners only

    bool valid() const { return fd != RECON_INVALID_SOCKET; }
};

// Bind and listen on 127.0.0.1:port (0 = let the OS pick).
// On failure returns an invalid listener and sets err to errno.
Listener listen_loopback(int port, int& err);

// Bind and listen on a Unix-domain socket path (owner-only).
Listener listen_unix(const std::string& path, int& err);

// Connect to a Unix-domain socket. Returns RECON_INVALID_SOCKET on failure.
socket_t connect_unix(const std::string& path);

// Check if a local TCP port is accepting connections.
bool is_port_open(int port);

// Write the whole buffer to a blocking descriptor. False on error.
bool write_all(int fd, const char* data, size_t len);

} // namespace platform
