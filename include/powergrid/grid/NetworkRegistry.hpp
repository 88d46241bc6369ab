#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <unordered_map>
#include <vector>

#include "powergrid/grid/Types.hpp"

namespace powergrid {

class ConnectivityTracker;

struct Network {
    NetworkId           id{NoNetwork};
    std::vector<NodeId> members;               // sorted
    std::uint64_t       cumulative_supply{0};  // operational producers only
    std::uint64_t       cumulative_demand{0};  // every consumer, powered or not
    bool                has_surplus{true};

    [[nodiscard]] NetworkStats stats() const noexcept {
        return NetworkStats{members.size(), cumulative_supply, cumulative_demand, has_surplus};
    }
};

// What one incremental update did to the partition.
struct RegistryUpdate {
    std::vector<NetworkId> touched;   // current ids whose member set was (re)written, ascending
    std::vector<NetworkId> retired;   // ids that no longer exist, ascending
};

// Owns the partition of live nodes into networks. Only the clusters the tracker
// reports as touched are re-derived; everything else keeps its id and members.
//
// Id rules:
//   - a cluster made only of nodes that had no network gets a fresh id;
//   - a cluster fed by intact networks keeps the smallest of their ids (merge);
//   - a network whose members ended up in two or more clusters is retired and
//     every cluster that received part of it gets a fresh id (split).
// Fresh ids are strictly increasing, so a split never reuses the old id.
class NetworkRegistry {
public:
    // `removed` lists nodes dropped from the tracker since the last update.
    RegistryUpdate update(ConnectivityTracker& tracker, const std::vector<NodeId>& removed);

    [[nodiscard]] const Network* find(NetworkId id) const;
    [[nodiscard]] Network* find(NetworkId id);
    [[nodiscard]] NetworkId network_of(NodeId node) const;

    [[nodiscard]] const std::map<NetworkId, Network>& networks() const noexcept { return networks_; }
    [[nodiscard]] std::size_t size() const noexcept { return networks_.size(); }
    [[nodiscard]] NetworkId next_id() const noexcept { return next_id_; }

    void clear();

private:
    NetworkId mint() { return next_id_++; }

    std::map<NetworkId, Network>          networks_;
    std::unordered_map<NodeId, NetworkId> node_network_;
    NetworkId                             next_id_{1};
};

} // namespace powergrid
