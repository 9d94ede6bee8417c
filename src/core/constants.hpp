#pragma once

// ── Version ─────────────────────────────────────────────────
constexpr const char* RECON_VERSION = "0.4.0";

// ── SSH ─────────────────────────────────────────────────────
constexpr int SSH_DEFAULT_PORT            = 22;
constexpr int SSH_CONNECT_TIMEOUT_SECS    = 3;     // TCP connect + handshake + auth
constexpr int SSH_CMD_TIMEOUT_SECS        = 30;    // Max time for a single remote command
constexpr int SSH_KEEPALIVE_SECS          = 30;    // Keepalive interval / loss detection
constexpr int SSH_MAX_CHANNELS            = 10;    // OpenSSH MaxSessions default
constexpr int CHANNEL_OPEN_TIMEOUT_SECS   = 30;    // Max time to negotiate one channel

// ── Discovery ───────────────────────────────────────────────
constexpr int SCAN_DEFAULT_WORKERS        = 4;
constexpr int SCAN_PROBE_TIMEOUT_SECS     = 1;
constexpr int SCAN_MAX_HOSTS              = 65536; // Refuse to enumerate anything wider than a /16
constexpr int SCAN_SLOT_RETRY_MS          = 50;    // Re-issue interval while the channel limit is hit

// ── Tunnels ─────────────────────────────────────────────────
constexpr int TUNNEL_REMOTE_PORT          = 443;
constexpr int TUNNEL_OPEN_TIMEOUT_SECS    = 10;
constexpr int TUNNEL_BIND_ATTEMPTS        = 16;
constexpr int TUNNEL_ACCEPT_POLL_MS       = 500;

// ── Interactive sessions ────────────────────────────────────
constexpr int ATTACH_TIMEOUT_SECS         = 15;    // Spawned terminal must attach within this
constexpr int SERIAL_DEFAULT_BAUD         = 115200;

// ── Buffer sizes ────────────────────────────────────────────
constexpr int SSH_READ_BUF_SIZE           = 4096;
constexpr int RELAY_BUF_SIZE              = 16384;
constexpr int RELAY_DRAIN_READS           = 64;    // Channel reads per turn before serving the local side
constexpr int RELAY_IDLE_POLL_MS          = 50;

// ── Remote commands ─────────────────────────────────────────
// Output begins with a versioned header so format drift is detected, not misparsed.
constexpr const char* CONSOLE_HEADER = "RECON-CONSOLES/1";
constexpr const char* NETWORK_HEADER = "RECON-NETWORKS/1";

constexpr const char* CONSOLE_DISCOVERY_CMD =
    "echo RECON-CONSOLES/1; "
    "for d in /dev/ttyUSB* /dev/ttyACM*; do [ -c \"$d\" ] && echo \"$d\"; done; true";

constexpr const char* NETWORK_DISCOVERY_CMD =
    "echo RECON-NETWORKS/1; ip -o -4 addr show";

// fmt::format(PROBE_CMD, timeout_secs, ip)
constexpr const char* PROBE_CMD = "ping -c 1 -W {} {} >/dev/null 2>&1";

// fmt::format(SERIAL_CMD, baud, device)
constexpr const char* SERIAL_CMD = "picocom -b {} -f x {}";
constexpr const char* SERIAL_CAPABILITY_CMD = "command -v picocom >/dev/null 2>&1";

// Shell exit status for "command not found"
constexpr int EXIT_COMMAND_NOT_FOUND = 127;

// ── Attach protocol ─────────────────────────────────────────
// First line a spawned terminal writes on its socket: "RECON-ATTACH <cols> <rows>\n"
constexpr const char* ATTACH_HELLO = "RECON-ATTACH";
