#include "cache_store.hpp"
#include <core/log.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <system_error>

static std::string sanitize_key(const std::string& key) {
    std::string out;
    out.reserve(key.size());
    for (char c : key) {
        unsigned char u = static_cast<unsigned char>(c);
        if (std::isalnum(u) || c == '@' || c == '.' || c == '-' || c == '_') out += c;
        else out += '_';
    }
    return out;
}

CacheStore::CacheStore(fs::path dir) : dir_(std::move(dir)) {}

fs::path CacheStore::path_for(const HostIdentity& id) const {
    return dir_ / (sanitize_key(id.key()) + ".yaml");
}

// ── File format ───────────────────────────────────────────────

HostInventory CacheStore::read_file(const HostIdentity& id) const {
    HostInventory inv;
    fs::path path = path_for(id);

    if (!fs::exists(path)) {
        return inv;
    }

    try {
        YAML::Node root = YAML::LoadFile(path.string());
        if (!root.IsMap()) {
            recon_log("cache: " + path.string() + " is not a mapping, starting fresh");
            return HostInventory{};
        }

        if (root["consoles"] && root["consoles"].IsSequence()) {
            for (const auto& n : root["consoles"]) {
                ConsoleDevice c;
                c.name = n["name"].as<std::string>("");
                c.remote_path = n["path"].as<std::string>("");
                if (!c.name.empty()) inv.consoles[c.name] = c;
            }
        }

        if (root["networks"] && root["networks"].IsSequence()) {
            for (const auto& n : root["networks"]) {
                NetworkInterface ni;
                ni.name = n["name"].as<std::string>("");
                ni.subnet_cidr = n["subnet"].as<std::string>("");
                ni.address = n["address"].as<std::string>("");
                if (!ni.name.empty()) inv.networks[ni.name] = ni;
            }
        }

        if (root["nodes"] && root["nodes"].IsMap()) {
            for (const auto& bucket : root["nodes"]) {
                std::string subnet = bucket.first.as<std::string>();
                NodeBucket& nodes = inv.nodes[subnet];
                if (!bucket.second.IsSequence()) continue;
                for (const auto& n : bucket.second) {
                    DiscoveredNode node;
                    node.ip_address = n["ip"].as<std::string>("");
                    node.last_seen = n["last_seen"].as<std::string>("");
                    if (!node.ip_address.empty()) nodes[node.ip_address] = node;
                }
            }
        }
    } catch (const std::exception& e) {
        // Corrupted cache file, start fresh
        recon_log(fmt::format("cache: cannot read {} ({}), starting fresh", path.string(), e.what()));
        return HostInventory{};
    }

    return inv;
}

Result<void> CacheStore::write_file(const HostIdentity& id, const HostInventory& inv) const {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "host" << YAML::Value << id.host;
    out << YAML::Key << "user" << YAML::Value << id.user;

    out << YAML::Key << "consoles" << YAML::Value << YAML::BeginSeq;
    for (const auto& [name, c] : inv.consoles) {
        out << YAML::BeginMap;
        out << YAML::Key << "name" << YAML::Value << c.name;
        out << YAML::Key << "path" << YAML::Value << c.remote_path;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::Key << "networks" << YAML::Value << YAML::BeginSeq;
    for (const auto& [name, ni] : inv.networks) {
        out << YAML::BeginMap;
        out << YAML::Key << "name" << YAML::Value << ni.name;
        out << YAML::Key << "subnet" << YAML::Value << ni.subnet_cidr;
        out << YAML::Key << "address" << YAML::Value << ni.address;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::Key << "nodes" << YAML::Value << YAML::BeginMap;
    for (const auto& [subnet, bucket] : inv.nodes) {
        out << YAML::Key << subnet << YAML::Value << YAML::BeginSeq;
        for (const auto& [ip, node] : bucket) {
            out << YAML::BeginMap;
            out << YAML::Key << "ip" << YAML::Value << node.ip_address;
            out << YAML::Key << "last_seen" << YAML::Value << node.last_seen;
            out << YAML::EndMap;
        }
        out << YAML::EndSeq;
    }
    out << YAML::EndMap;

    out << YAML::EndMap;

    fs::path path = path_for(id);
    fs::path tmp = path;
    tmp += ".tmp";

    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) {
        return Result<void>::Err(ErrorKind::Io,
            fmt::format("Cannot create cache directory {}: {}", dir_.string(), ec.message()));
    }

    {
        std::ofstream fout(tmp.string(), std::ios::trunc);
        if (!fout) {
            return Result<void>::Err(ErrorKind::Io, "Cannot write " + tmp.string());
        }
        fout << out.c_str() << "\n";
        fout.flush();
        if (!fout) {
            return Result<void>::Err(ErrorKind::Io, "Short write to " + tmp.string());
        }
    }

    // Replace in one step so readers never see a half-written file
    fs::rename(tmp, path, ec);
    if (ec) {
        fs::remove(tmp, ec);
        return Result<void>::Err(ErrorKind::Io,
            fmt::format("Cannot replace {}: {}", path.string(), ec.message()));
    }
    return Result<void>::Ok();
}

// ── Entries ───────────────────────────────────────────────────

std::shared_ptr<CacheStore::Entry> CacheStore::entry_for(const HostIdentity& id) {
    std::lock_guard<std::mutex> lock(entries_mutex_);
    auto& slot = entries_[id];
    if (!slot) slot = std::make_shared<Entry>();
    return slot;
}

void CacheStore::ensure_loaded(const HostIdentity& id, Entry& entry) {
    if (entry.loaded) return;
    entry.inventory = read_file(id);
    entry.loaded = true;
}

HostInventory CacheStore::load(const HostIdentity& id) {
    auto entry = entry_for(id);
    std::lock_guard<std::mutex> lock(entry->mutex);
    ensure_loaded(id, *entry);
    return entry->inventory;
}

Result<HostInventory> CacheStore::update(const HostIdentity& id,
                                         const std::function<void(HostInventory&)>& mutate) {
    auto entry = entry_for(id);
    std::lock_guard<std::mutex> lock(entry->mutex);
    ensure_loaded(id, *entry);

    HostInventory next = entry->inventory;
    mutate(next);

    auto written = write_file(id, next);
    if (written.is_err()) {
        recon_log("cache: " + written.error);
        return Result<HostInventory>::Err(written);
    }

    entry->inventory = std::move(next);
    return Result<HostInventory>::Ok(entry->inventory);
}

// ── Merges ────────────────────────────────────────────────────

Result<HostInventory> CacheStore::merge_consoles(const HostIdentity& id,
                                                 const std::vector<ConsoleDevice>& found,
                                                 MergeMode mode) {
    return update(id, [&](HostInventory& inv) {
        if (mode == MergeMode::Replace) inv.consoles.clear();
        for (const auto& c : found) inv.consoles[c.name] = c;
    });
}

Result<HostInventory> CacheStore::merge_networks(const HostIdentity& id,
                                                 const std::vector<NetworkInterface>& found,
                                                 MergeMode mode) {
    return update(id, [&](HostInventory& inv) {
        if (mode == MergeMode::Replace) inv.networks.clear();
        for (const auto& ni : found) inv.networks[ni.name] = ni;
    });
}

Result<NodeBucket> CacheStore::merge_nodes(const HostIdentity& id, const std::string& subnet,
                                           const std::vector<DiscoveredNode>& found,
                                           MergeMode mode) {
    auto result = update(id, [&](HostInventory& inv) {
        NodeBucket& bucket = inv.nodes[subnet];
        if (mode == MergeMode::Replace) bucket.clear();
        for (const auto& node : found) {
            auto it = bucket.find(node.ip_address);
            if (it == bucket.end()) {
                bucket[node.ip_address] = node;
            } else if (it->second.last_seen < node.last_seen) {
                // ISO 8601 strings order chronologically
                it->second.last_seen = node.last_seen;
            }
        }
    });
    if (result.is_err()) return Result<NodeBucket>::Err(result);
    return Result<NodeBucket>::Ok(result.value.nodes[subnet]);
}

Result<void> CacheStore::clear(const HostIdentity& id, InventorySection section) {
    auto result = update(id, [&](HostInventory& inv) {
        switch (section) {
            case InventorySection::Consoles: inv.consoles.clear(); break;
            case InventorySection::Networks: inv.networks.clear(); break;
            case InventorySection::Nodes:    inv.nodes.clear(); break;
            case InventorySection::All:      inv = HostInventory{}; break;
        }
    });
    if (result.is_err()) return Result<void>::Err(result);
    return Result<void>::Ok();
}

Result<void> CacheStore::forget(const HostIdentity& id) {
    auto entry = entry_for(id);
    std::lock_guard<std::mutex> lock(entry->mutex);

    std::error_code ec;
    fs::remove(path_for(id), ec);
    if (ec) {
        return Result<void>::Err(ErrorKind::Io,
            fmt::format("Cannot remove {}: {}", path_for(id).string(), ec.message()));
    }
    entry->inventory = HostInventory{};
    entry->loaded = true;
    return Result<void>::Ok();
}

std::vector<HostIdentity> CacheStore::known_hosts() const {
    std::vector<HostIdentity> hosts;
    std::error_code ec;
    if (!fs::is_directory(dir_, ec)) return hosts;

    for (const auto& file : fs::directory_iterator(dir_, ec)) {
        if (file.path().extension() != ".yaml") continue;
        try {
            YAML::Node root = YAML::LoadFile(file.path().string());
            HostIdentity id;
            id.host = root["host"].as<std::string>("");
            id.user = root["user"].as<std::string>("");
            if (!id.host.empty()) hosts.push_back(id);
        } catch (const std::exception& e) {
            recon_log(fmt::format("cache: skipping {} ({})", file.path().string(), e.what()));
        }
    }
    std::sort(hosts.begin(), hosts.end());
    return hosts;
}
