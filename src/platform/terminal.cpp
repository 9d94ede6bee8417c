#include "terminal.hpp"

#include <sys/ioctl.h>
#include <termios.h>
#include <unistd.h>
#include <poll.h>
#include <signal.h>

namespace platform {

// ── Terminal dimensions ──────────────────────────────────────

int term_width(int fd) {
    struct winsize ws;
    if (ioctl(fd, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0)
        return ws.ws_col;
    return 80;
}

int term_height(int fd) {
    struct winsize ws;
    if (ioctl(fd, TIOCGWINSZ, &ws) == 0 && ws.ws_row > 0)
        return ws.ws_row;
    return 24;
}

// ── RawModeGuard ─────────────────────────────────────────────

struct RawModeGuard::Impl {
    struct termios old_term;
};

RawModeGuard::RawModeGuard(Mode mode) {
    if (!isatty(STDIN_FILENO)) return;

    impl_ = new Impl;
    tcgetattr(STDIN_FILENO, &impl_->old_term);
    struct termios raw = impl_->old_term;
    if (mode == kFullRaw) {
        cfmakeraw(&raw);
    } else {
        raw.c_lflag &= ~(ECHO | ECHOE | ECHOK | ECHONL);
    }
    tcsetattr(STDIN_FILENO, TCSAFLUSH, &raw);
}

RawModeGuard::~RawModeGuard() {
    if (impl_) {
        tcsetattr(STDIN_FILENO, TCSAFLUSH, &impl_->old_term);
        delete impl_;
    }
}

bool RawModeGuard::active() const {
    return impl_ != nullptr;
}

// ── poll_stdin ───────────────────────────────────────────────

bool poll_stdin(int timeout_ms) {
    struct pollfd pfd = {STDIN_FILENO, POLLIN, 0};
    return poll(&pfd, 1, timeout_ms) > 0 && (pfd.revents & POLLIN);
}

// ── Resize tracking ──────────────────────────────────────────

static volatile sig_atomic_t g_resize_flag = 0;
static struct sigaction g_old_sa;

static void sigwinch_handler(int) {
    g_resize_flag = 1;
}

void watch_terminal_resize() {
    g_resize_flag = 0;

    struct sigaction sa;
    sa.sa_handler = sigwinch_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGWINCH, &sa, &g_old_sa);
}

void unwatch_terminal_resize() {
    sigaction(SIGWINCH, &g_old_sa, nullptr);
}

bool take_terminal_resize() {
    if (!g_resize_flag) return false;
    g_resize_flag = 0;
    return true;
}

} // namespace platform
