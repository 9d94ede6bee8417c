#pragma once

namespace platform {

// Get terminal dimensions of the given descriptor (default stdout).
int term_width(int fd = 1);
int term_height(int fd = 1);

// RAII guard for raw terminal mode.
// Constructor saves current mode and enters raw mode.
// Destructor restores the saved mode.
struct RawModeGuard {
    enum Mode {
        kFullRaw,   // cfmakeraw equivalent (for interactive relay)
        kNoEcho,    // Canonical on, echo off (for password input)
    };

    explicit RawModeGuard(Mode mode = kFullRaw);
    ~RawModeGuard();

    RawModeGuard(const RawModeGuard&) = delete;
    RawModeGuard& operator=(const RawModeGuard&) = delete;

    // False when stdin is not a terminal; nothing was changed.
    bool active() const;

private:
    struct Impl;
    Impl* impl_ = nullptr;
};

// Poll stdin for input readability with a timeout.
bool poll_stdin(int timeout_ms);

// SIGWINCH tracking. take_terminal_resize() returns true once per resize.
void watch_terminal_resize();
void unwatch_terminal_resize();
bool take_terminal_resize();

} // namespace platform
