#include "discovery_parsers.hpp"
#include <core/constants.hpp>
#include <core/ipv4.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <set>
#include <sstream>

// ── Helpers ──────────────────────────────────────────────────

// Non-empty, trimmed lines of the output
static std::vector<std::string> output_lines(const std::string& output) {
    std::vector<std::string> lines;
    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        trim(line);
        if (!line.empty()) lines.push_back(line);
    }
    return lines;
}

static Result<void> check_header(const std::vector<std::string>& lines,
                                 const char* header) {
    if (lines.empty()) {
        return Result<void>::Err(ErrorKind::Discovery,
            fmt::format("Empty output, expected header {}", header));
    }
    if (lines.front() != header) {
        return Result<void>::Err(ErrorKind::Discovery,
            fmt::format("Unexpected header '{}', expected {}", lines.front(), header));
    }
    return Result<void>::Ok();
}

// ── Consoles ─────────────────────────────────────────────────

Result<std::vector<ConsoleDevice>> parse_console_listing(const std::string& output) {
    auto lines = output_lines(output);
    auto header = check_header(lines, CONSOLE_HEADER);
    if (header.is_err()) return Result<std::vector<ConsoleDevice>>::Err(header);

    std::vector<ConsoleDevice> devices;
    std::set<std::string> seen;
    for (size_t i = 1; i < lines.size(); i++) {
        const std::string& path = lines[i];
        bool valid = path.rfind("/dev/", 0) == 0
                  && path.size() > 5
                  && path.find_first_of(" \t") == std::string::npos;
        if (!valid) {
            return Result<std::vector<ConsoleDevice>>::Err(ErrorKind::Discovery,
                fmt::format("Malformed console line {}: '{}'", i + 1, path));
        }

        ConsoleDevice dev;
        dev.name = path.substr(path.rfind('/') + 1);
        dev.remote_path = path;
        if (dev.name.empty()) {
            return Result<std::vector<ConsoleDevice>>::Err(ErrorKind::Discovery,
                fmt::format("Malformed console line {}: '{}'", i + 1, path));
        }
        if (seen.insert(dev.name).second) devices.push_back(dev);
    }
    return Result<std::vector<ConsoleDevice>>::Ok(devices);
}

// ── Networks ─────────────────────────────────────────────────

Result<std::vector<NetworkInterface>> parse_network_listing(const std::string& output) {
    auto lines = output_lines(output);
    auto header = check_header(lines, NETWORK_HEADER);
    if (header.is_err()) return Result<std::vector<NetworkInterface>>::Err(header);

    std::vector<NetworkInterface> networks;
    std::set<std::string> seen;
    for (size_t i = 1; i < lines.size(); i++) {
        auto fields = split_ws(lines[i]);
        // <idx>: <ifname> inet <addr>/<prefix> ...
        bool shaped = fields.size() >= 4
                   && fields[0].size() > 1 && fields[0].back() == ':'
                   && fields[2] == "inet";
        if (!shaped) {
            return Result<std::vector<NetworkInterface>>::Err(ErrorKind::Discovery,
                fmt::format("Malformed interface line {}: '{}'", i + 1, lines[i]));
        }

        auto subnet = parse_cidr(fields[3]);
        if (subnet.is_err()) {
            return Result<std::vector<NetworkInterface>>::Err(ErrorKind::Discovery,
                fmt::format("Malformed address on line {}: {}", i + 1, subnet.error));
        }

        std::string name = fields[1];
        auto at = name.find('@');             // veth pairs: "eth0@if12"
        if (at != std::string::npos) name.erase(at);

        std::string address = fields[3].substr(0, fields[3].find('/'));
        uint32_t addr = 0;
        parse_ipv4(address, addr);
        if (is_loopback_ipv4(addr) || !is_private_ipv4(addr)) continue;
        if (!seen.insert(name).second) continue;

        NetworkInterface ni;
        ni.name = name;
        ni.subnet_cidr = subnet.value.to_string();
        ni.address = address;
        networks.push_back(ni);
    }
    return Result<std::vector<NetworkInterface>>::Ok(networks);
}
