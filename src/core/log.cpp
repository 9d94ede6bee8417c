#include "log.hpp"
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <chrono>
#include <ctime>
#include <fstream>
#include <mutex>

static std::mutex g_log_mutex;

static std::string& log_path_ref() {
    static std::string path = (platform::temp_dir() / "recon_debug.log").string();
    return path;
}

std::string recon_log_path() {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    return log_path_ref();
}

void set_log_path(const std::string& path) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (!path.empty()) log_path_ref() = path;
}

void recon_log(const std::string& msg) {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    std::string line = fmt::format("[{:02d}:{:02d}:{:02d}.{:03d}] {}\n",
                                   tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                                   static_cast<int>(ms.count()), msg);

    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::ofstream out(log_path_ref(), std::ios::app);
    if (!out) return;
    out << line;
}

void recon_log_cmd(const std::string& label, const std::string& cmd,
                   const CommandResult& r) {
    recon_log(fmt::format("{} CMD: {}", label, cmd));
    recon_log(fmt::format("{} exit={} stdout({})={}", label, r.exit_code,
                          r.stdout_data.size(), r.stdout_data.substr(0, 500)));
    if (!r.stderr_data.empty())
        recon_log(fmt::format("{} stderr={}", label, r.stderr_data.substr(0, 500)));
}
