#include "attach.hpp"
#include "theme.hpp"
#include <core/attach_protocol.hpp>
#include <cerrno>
#include <platform/socket_util.hpp>
#include <platform/terminal.hpp>
#include <iostream>
#include <unistd.h>
#include <poll.h>

int run_attach(const std::string& socket_path) {
    socket_t sock = platform::connect_unix(socket_path);
    if (sock == RECON_INVALID_SOCKET) {
        std::cout << theme::fail("Cannot attach to " + socket_path);
        std::cout << theme::dim("    The session was closed or never opened.") << "\n";
        return 1;
    }

    std::string hello = build_attach_hello(platform::term_width(), platform::term_height());
    if (!platform::write_all(sock, hello.data(), hello.size())) {
        platform::close_socket(sock);
        std::cout << theme::fail("Attach handshake failed.");
        return 1;
    }

    platform::watch_terminal_resize();
    int status = 0;
    {
        platform::RawModeGuard raw(platform::RawModeGuard::kFullRaw);
        char rbuf[16384];

        for (;;) {
            // Propagate terminal resize to the remote PTY
            if (platform::take_terminal_resize()) {
                std::string frame = encode_resize_frame(platform::term_width(),
                                                        platform::term_height());
                if (!platform::write_all(sock, frame.data(), frame.size())) break;
            }

            struct pollfd fds[2];
            fds[0] = {STDIN_FILENO, POLLIN, 0};
            fds[1] = {sock, POLLIN, 0};
            int rc = poll(fds, 2, 100);
            if (rc < 0) {
                if (errno == EINTR) continue;
                status = 1;
                break;
            }

            // stdin → engine
            if (fds[0].revents & POLLIN) {
                ssize_t n = read(STDIN_FILENO, rbuf, sizeof(rbuf));
                if (n <= 0) break;
                std::string frames = encode_data_frames(rbuf, static_cast<size_t>(n));
                if (!platform::write_all(sock, frames.data(), frames.size())) break;
            }

            // engine → stdout
            if (fds[1].revents & (POLLIN | POLLHUP | POLLERR)) {
                ssize_t n = read(sock, rbuf, sizeof(rbuf));
                if (n <= 0) break;  // remote side closed
                if (!platform::write_all(STDOUT_FILENO, rbuf, static_cast<size_t>(n))) {
                    status = 1;
                    break;
                }
            }
        }
    }
    platform::unwatch_terminal_resize();
    platform::close_socket(sock);

    std::cout << "\r\n" << theme::dim("    Session closed. Press Enter to close this window.") << "\n";
    std::string line;
    std::getline(std::cin, line);
    return status;
}
