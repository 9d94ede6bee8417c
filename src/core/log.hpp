#pragma once

#include <string>
#include <core/types.hpp>

// Debug log: one timestamped line per call, appended to
// <tmp>/recon_debug.log unless redirected with set_log_path().
std::string recon_log_path();
void set_log_path(const std::string& path);

void recon_log(const std::string& msg);

// Log a remote command and a truncated view of its output.
void recon_log_cmd(const std::string& label, const std::string& cmd,
                   const CommandResult& r);
