#include "ipv4.hpp"
#include "utils.hpp"
#include <fmt/format.h>

bool parse_ipv4(const std::string& text, uint32_t& out) {
    uint32_t addr = 0;
    int octets = 0;
    size_t pos = 0;
    bool last = false;
    while (!last) {
        size_t end = text.find('.', pos);
        last = (end == std::string::npos);
        std::string part = text.substr(pos, last ? std::string::npos : end - pos);
        if (part.empty() || part.size() > 3 || ++octets > 4) return false;
        for (char c : part) {
            if (c < '0' || c > '9') return false;
        }
        int v = safe_stoi(part, -1);
        if (v < 0 || v > 255) return false;
        addr = (addr << 8) | static_cast<uint32_t>(v);
        pos = end + 1;
    }
    if (octets != 4) return false;
    out = addr;
    return true;
}

std::string format_ipv4(uint32_t addr) {
    return fmt::format("{}.{}.{}.{}", (addr >> 24) & 0xFF, (addr >> 16) & 0xFF,
                       (addr >> 8) & 0xFF, addr & 0xFF);
}

Result<Ipv4Subnet> parse_cidr(const std::string& text) {
    auto slash = text.find('/');
    if (slash == std::string::npos) {
        return Result<Ipv4Subnet>::Err(ErrorKind::Discovery,
            fmt::format("'{}' is not in address/prefix form", text));
    }

    uint32_t addr = 0;
    if (!parse_ipv4(text.substr(0, slash), addr)) {
        return Result<Ipv4Subnet>::Err(ErrorKind::Discovery,
            fmt::format("'{}' has an invalid address", text));
    }

    std::string prefix_text = text.substr(slash + 1);
    int prefix = safe_stoi(prefix_text, -1);
    if (prefix_text.empty() || prefix < 0 || prefix > 32) {
        return Result<Ipv4Subnet>::Err(ErrorKind::Discovery,
            fmt::format("'{}' has an invalid prefix length", text));
    }

    Ipv4Subnet subnet;
    subnet.prefix = prefix;
    subnet.network = addr & subnet.mask();
    return Result<Ipv4Subnet>::Ok(subnet);
}

std::string Ipv4Subnet::to_string() const {
    return fmt::format("{}/{}", format_ipv4(network), prefix);
}

uint64_t Ipv4Subnet::host_count() const {
    if (prefix == 32) return 1;
    if (prefix == 31) return 2;
    return (uint64_t{1} << (32 - prefix)) - 2;
}

std::vector<std::string> Ipv4Subnet::hosts() const {
    std::vector<std::string> out;
    uint64_t first = network;
    uint64_t last = broadcast();
    if (prefix < 31) {
        first += 1;
        last -= 1;
    }
    out.reserve(static_cast<size_t>(last - first + 1));
    for (uint64_t a = first; a <= last; a++) {
        out.push_back(format_ipv4(static_cast<uint32_t>(a)));
    }
    return out;
}

bool is_private_ipv4(uint32_t addr) {
    if ((addr & 0xFF000000u) == 0x0A000000u) return true;   // 10.0.0.0/8
    if ((addr & 0xFFF00000u) == 0xAC100000u) return true;   // 172.16.0.0/12
    if ((addr & 0xFFFF0000u) == 0xC0A80000u) return true;   // 192.168.0.0/16
    if ((addr & 0xFFFF0000u) == 0xA9FE0000u) return true;   // 169.254.0.0/16
    return false;
}

bool is_loopback_ipv4(uint32_t addr) {
    return (addr & 0xFF000000u) == 0x7F000000u;
}
