#include "platform.hpp"
#include <cstdlib>
#include <system_error>
#include <unistd.h>
#include <limits.h>

namespace fs = std::filesystem;

namespace platform {

fs::path home_dir() {
    const char* home = std::getenv("HOME");
    if (!home || !*home) return temp_dir();
    return fs::path(home);
}

fs::path temp_dir() {
    std::error_code ec;
    auto p = fs::temp_directory_path(ec);
    return ec ? fs::path("/tmp") : p;
}

std::string self_executable() {
    char buf[PATH_MAX];
    ssize_t n = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (n <= 0) return "recon";
    buf[n] = '\0';
    return std::string(buf);
}

fs::path runtime_dir() {
    fs::path base;
    const char* xdg = std::getenv("XDG_RUNTIME_DIR");
    if (xdg && *xdg) {
        base = fs::path(xdg) / "recon";
    } else {
        base = temp_dir() / ("recon-" + std::to_string(getuid()));
    }
    std::error_code ec;
    fs::create_directories(base, ec);
    fs::permissions(base, fs::perms::owner_all, fs::perm_options::replace, ec);
    return base;
}

void sleep_ms(int ms) {
    usleep(static_cast<useconds_t>(ms) * 1000);
}

} // namespace platform
