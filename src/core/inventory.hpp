#pragma once

#include <map>
#include <string>
#include <tuple>

// Keys all cached data for one remote host.
struct HostIdentity {
    std::string host;
    std::string user;

    std::string key() const { return user + "@" + host; }
    bool empty() const { return host.empty(); }

    bool operator==(const HostIdentity& o) const {
        return host == o.host && user == o.user;
    }
    bool operator!=(const HostIdentity& o) const { return !(*this == o); }
    bool operator<(const HostIdentity& o) const {
        return std::tie(host, user) < std::tie(o.host, o.user);
    }
};

struct Credentials {
    std::string password;
};

// Serial device on the remote host, e.g. {"ttyUSB0", "/dev/ttyUSB0"}
struct ConsoleDevice {
    std::string name;
    std::string remote_path;

    bool operator==(const ConsoleDevice& o) const {
        return name == o.name && remote_path == o.remote_path;
    }
};

// Remote network interface. subnet_cidr is in network form ("192.168.1.0/24").
struct NetworkInterface {
    std::string name;
    std::string subnet_cidr;
    std::string address;

    bool operator==(const NetworkInterface& o) const {
        return name == o.name && subnet_cidr == o.subnet_cidr && address == o.address;
    }
};

struct DiscoveredNode {
    std::string ip_address;
    std::string last_seen;   // ISO 8601 local time

    bool operator==(const DiscoveredNode& o) const {
        return ip_address == o.ip_address && last_seen == o.last_seen;
    }
};

// ip -> node
using NodeBucket = std::map<std::string, DiscoveredNode>;

// Everything cached for one HostIdentity.
struct HostInventory {
    std::map<std::string, ConsoleDevice> consoles;        // by name
    std::map<std::string, NetworkInterface> networks;     // by name
    std::map<std::string, NodeBucket> nodes;              // by subnet

    bool empty() const {
        return consoles.empty() && networks.empty() && nodes.empty();
    }
};

// Inventory sections, for clearing.
enum class InventorySection { Consoles, Networks, Nodes, All };

// How a discovery result combines with what is cached.
enum class MergeMode {
    Union,     // add new entries, keep existing ones
    Replace,   // explicit refresh: discard the cached section first
};
