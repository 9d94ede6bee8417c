#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME, falling back to the temp dir).
std::filesystem::path home_dir();

// Returns the system temporary directory.
std::filesystem::path temp_dir();

// Absolute path of the running executable, or argv0-style fallback "recon".
std::string self_executable();

// Private per-user runtime directory for attach sockets (mode 0700).
std::filesystem::path runtime_dir();

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

} // namespace platform
