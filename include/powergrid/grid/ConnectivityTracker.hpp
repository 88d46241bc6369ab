#pragma once
#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <vector>

#include "powergrid/grid/Types.hpp"

namespace powergrid {

// Disjoint-set over node handles with union-by-rank and path compression.
//
// Union-find cannot split, so disconnect() and remove_node() throw away the
// parent/rank state of the cluster the cut lives in and re-union that cluster
// from its remaining live edges. Cost is bounded by the cluster, never the world.
//
// Every operation records the live nodes whose cluster may have changed; the
// network registry drains that journal with take_touched() once per tick.
class ConnectivityTracker {
public:
    // Returns false if the node is already tracked.
    bool add_node(NodeId id);

    // Drops the node and all its links. Unknown ids log a warning and return false.
    bool remove_node(NodeId id);

    // Idempotent: self-links, duplicate links and links to unknown nodes return false.
    bool connect(NodeId a, NodeId b);

    // Returns false when there is no such link.
    bool disconnect(NodeId a, NodeId b);

    // NullNode for unknown ids.
    NodeId find_root(NodeId id);

    [[nodiscard]] bool connected(NodeId a, NodeId b);

    // Sorted members of the cluster rooted at `root`; empty if `root` is not a root.
    [[nodiscard]] std::vector<NodeId> members_of_root(NodeId root) const;

    [[nodiscard]] bool contains(NodeId id) const { return slots_.find(id) != slots_.end(); }
    [[nodiscard]] bool linked(NodeId a, NodeId b) const;
    [[nodiscard]] const std::vector<NodeId>& links_of(NodeId id) const;

    // Live nodes touched since the last call, sorted and de-duplicated.
    std::vector<NodeId> take_touched();

    [[nodiscard]] std::size_t node_count() const noexcept { return slots_.size(); }
    [[nodiscard]] std::size_t link_count() const noexcept { return links_; }

    void clear();

private:
    struct Slot {
        NodeId              parent{NullNode};
        std::uint32_t       rank{0};
        std::vector<NodeId> members;   // only meaningful while this slot is a root
        std::vector<NodeId> links;
    };

    NodeId root_of(NodeId id);
    void unite(NodeId a, NodeId b);
    void rebuild_cluster(const std::vector<NodeId>& cluster);

    std::unordered_map<NodeId, Slot> slots_;
    std::vector<NodeId>              touched_;
    std::size_t                      links_{0};
};

} // namespace powergrid
