#include "socket_util.hpp"

#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace platform {

void set_nonblocking(socket_t sock) {
    int flags = fcntl(sock, F_GETFL, 0);
    fcntl(sock, F_SETFL, flags | O_NONBLOCK);
}

int poll_socket(socket_t sock, short events, int timeout_ms) {
    struct pollfd pfd;
    pfd.fd = sock;
    pfd.events = events;
    pfd.revents = 0;
    int ret = poll(&pfd, 1, timeout_ms);
    return (ret > 0) ? pfd.revents : 0;
}

void close_socket(socket_t sock) {
    if (sock != RECON_INVALID_SOCKET) close(sock);
}

Listener listen_loopback(int port, int& err) {
    Listener l;
    err = 0;

    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        err = errno;
        return l;
    }

    // Lets a just-closed tunnel port be rebound while its connections sit in
    // TIME_WAIT. A port with a live listener still fails with EADDRINUSE.
    int reuse = 1;
    setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);

    if (bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0 ||
        listen(fd, 16) < 0) {
        err = errno;
        close(fd);
        return l;
    }

    socklen_t len = sizeof(addr);
    if (getsockname(fd, reinterpret_cast<struct sockaddr*>(&addr), &len) < 0) {
        err = errno;
        close(fd);
        return l;
    }

    l.fd = fd;
    l.port = ntohs(addr.sin_port);
    return l;
}

Listener listen_unix(const std::string& path, int& err) {
    Listener l;
    err = 0;

    struct sockaddr_un addr{};
    if (path.size() >= sizeof(addr.sun_path)) {
        err = ENAMETOOLONG;
        return l;
    }

    int fd = socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd < 0) {
        err = errno;
        return l;
    }

    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
    unlink(path.c_str());

    if (bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0 ||
        listen(fd, 1) < 0) {
        err = errno;
        close(fd);
        return l;
    }
    chmod(path.c_str(), S_IRUSR | S_IWUSR);

    l.fd = fd;
    return l;
}

socket_t connect_unix(const std::string& path) {
    struct sockaddr_un addr{};
    if (path.size() >= sizeof(addr.sun_path)) return RECON_INVALID_SOCKET;

    int fd = socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd < 0) return RECON_INVALID_SOCKET;

    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
    if (connect(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        close(fd);
        return RECON_INVALID_SOCKET;
    }
    return fd;
}

bool is_port_open(int port) {
    int sock = socket(AF_INET, SOCK_STREAM, 0);
    if (sock < 0) return false;
    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    int rc = connect(sock, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr));
    close(sock);
    return rc == 0;
}

bool write_all(int fd, const char* data, size_t len) {
    size_t sent = 0;
    while (sent < len) {
        ssize_t w = write(fd, data + sent, len - sent);
        if (w < 0 && errno == EINTR) continue;
        if (w < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            poll_socket(fd, POLLOUT, 100);
            continue;
        }
        if (w <= 0) return false;
        sent += static_cast<size_t>(w);
    }
    return true;
}

} // namespace platform
