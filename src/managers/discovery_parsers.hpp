#pragma once

#include <string>
#include <vector>
#include <core/inventory.hpp>
#include <core/types.hpp>

// Parsers for the versioned discovery commands. Pure functions: they see only
// the command output and report DiscoveryError on any deviation from the
// expected format, so nothing half-parsed ever reaches the cache.

// Output of CONSOLE_DISCOVERY_CMD:
//   RECON-CONSOLES/1
//   /dev/ttyUSB0
//   /dev/ttyACM1
Result<std::vector<ConsoleDevice>> parse_console_listing(const std::string& output);

// Output of NETWORK_DISCOVERY_CMD:
//   RECON-NETWORKS/1
//   1: lo    inet 127.0.0.1/8 scope host lo\       valid_lft forever ...
//   2: eth0    inet 192.168.1.10/24 brd 192.168.1.255 scope global eth0\ ...
// Loopback and public addresses are dropped. The first private address of an
// interface wins; its subnet is stored in network form.
Result<std::vector<NetworkInterface>> parse_network_listing(const std::string& output);
