#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <functional>
#include <core/inventory.hpp>
#include <core/types.hpp>

namespace fs = std::filesystem;

// Persistent inventory per HostIdentity, one YAML file per host:
//   <dir>/<user@host>.yaml
//
// Files are read lazily on first access and written through on every merge.
// A merge works on a copy: the copy is persisted, then swapped in, so a
// failed write leaves the in-memory inventory as it was. Each host has its
// own lock; different hosts never contend.
class CacheStore {
public:
    explicit CacheStore(fs::path dir);

    const fs::path& dir() const { return dir_; }
    fs::path path_for(const HostIdentity& id) const;

    // Snapshot of the cached inventory (empty if nothing is cached or the
    // file is unreadable).
    HostInventory load(const HostIdentity& id);

    Result<HostInventory> merge_consoles(const HostIdentity& id,
                                         const std::vector<ConsoleDevice>& found,
                                         MergeMode mode);

    Result<HostInventory> merge_networks(const HostIdentity& id,
                                         const std::vector<NetworkInterface>& found,
                                         MergeMode mode);

    // Nodes are bucketed by subnet; entries are unique by ip within a bucket.
    // Union keeps the newest last_seen for an ip already present.
    Result<NodeBucket> merge_nodes(const HostIdentity& id, const std::string& subnet,
                                   const std::vector<DiscoveredNode>& found,
                                   MergeMode mode);

    Result<void> clear(const HostIdentity& id, InventorySection section);

    // Drop everything cached for a host, file included.
    Result<void> forget(const HostIdentity& id);

    // Identities with a cache file, sorted.
    std::vector<HostIdentity> known_hosts() const;

private:
    struct Entry {
        std::mutex mutex;
        bool loaded = false;
        HostInventory inventory;
    };

    fs::path dir_;
    std::mutex entries_mutex_;
    std::map<HostIdentity, std::shared_ptr<Entry>> entries_;

    std::shared_ptr<Entry> entry_for(const HostIdentity& id);
    void ensure_loaded(const HostIdentity& id, Entry& entry);
    HostInventory read_file(const HostIdentity& id) const;
    Result<void> write_file(const HostIdentity& id, const HostInventory& inv) const;

    // Copy, mutate, persist, swap
    Result<HostInventory> update(const HostIdentity& id,
                                 const std::function<void(HostInventory&)>& mutate);
};
