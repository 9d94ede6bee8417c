#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <core/types.hpp>

// IPv4 subnet arithmetic for network discovery and scanning.
struct Ipv4Subnet {
    uint32_t network = 0;   // host byte order, host bits cleared
    int prefix = 0;

    uint32_t mask() const {
        return prefix == 0 ? 0u : (0xFFFFFFFFu << (32 - prefix));
    }
    uint32_t broadcast() const { return network | ~mask(); }

    // Canonical "a.b.c.d/n"
    std::string to_string() const;

    // Number of scannable host addresses.
    uint64_t host_count() const;

    // Scannable host addresses in ascending order. Network and broadcast
    // addresses are excluded except for /31 (both) and /32 (the one address).
    std::vector<std::string> hosts() const;

    bool contains(uint32_t addr) const { return (addr & mask()) == network; }
};

// "192.168.1.10" -> host-order integer
bool parse_ipv4(const std::string& text, uint32_t& out);
std::string format_ipv4(uint32_t addr);

// "192.168.1.10/24" -> {192.168.1.0, 24}
Result<Ipv4Subnet> parse_cidr(const std::string& text);

// Ranges a remote bench network can live in: 10/8, 172.16/12, 192.168/16, 169.254/16.
bool is_private_ipv4(uint32_t addr);
bool is_loopback_ipv4(uint32_t addr);
