#pragma once

#include <string>

// Client side of a spawned terminal: connects to the engine's attach socket
// and relays this terminal until the remote side closes. Returns the exit
// status for main().
int run_attach(const std::string& socket_path);
