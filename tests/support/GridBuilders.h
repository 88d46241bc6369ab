#pragma once
// Small helpers shared by the grid tests: placing nodes and reading back
// a whole grid in a form that is easy to compare.

#include <algorithm>
#include <cstdint>
#include <optional>
#include <set>
#include <vector>

#include "powergrid/grid/Components.hpp"
#include "powergrid/grid/PowerGrid.hpp"

namespace pgtest {

using namespace powergrid;

inline NodeId Place(PowerGrid& grid, NodeKind kind, GridPos pos, std::uint32_t amount = 0)
{
    const NodeId id = grid.create_node_id();
    grid.submit(evt::NodePlaced{id, kind, pos, amount, false, std::nullopt, std::nullopt});
    return id;
}

inline NodeId PlaceFuelled(PowerGrid& grid, GridPos pos, std::uint32_t output,
                           std::uint32_t startup_delay, double consumption_rate = 1.0)
{
    const NodeId id = grid.create_node_id();
    grid.submit(evt::NodePlaced{id, NodeKind::Producer, pos, output, true, consumption_rate, startup_delay});
    return id;
}

inline void Link(PowerGrid& grid, NodeId a, NodeId b)   { grid.submit(evt::LinkEstablished{a, b}); }
inline void Unlink(PowerGrid& grid, NodeId a, NodeId b) { grid.submit(evt::LinkBroken{a, b}); }
inline void Remove(PowerGrid& grid, NodeId id)          { grid.submit(evt::NodeRemoved{id}); }
inline void Refuel(PowerGrid& grid, NodeId id, double amount) { grid.submit(evt::FuelDeposited{id, amount}); }

// Live nodes according to the component registry.
inline std::set<NodeId> LiveNodes(const PowerGrid& grid)
{
    std::set<NodeId> out;
    for (const auto e : grid.registry().view<comp::PowerNode>())
        out.insert(e);
    return out;
}

// Partition check: every live node in exactly one network, no strays.
inline bool PartitionHolds(const PowerGrid& grid)
{
    std::set<NodeId> seen;
    for (const auto& [id, net] : grid.network_registry().networks())
    {
        if (net.members.empty() || net.id != id)
            return false;
        for (const NodeId m : net.members)
        {
            if (!seen.insert(m).second)
                return false;
            if (grid.network_of(m) != id)
                return false;
        }
    }
    return seen == LiveNodes(grid);
}

inline std::size_t CountKind(const std::vector<evt::NetworkTopologyChanged>& changes, evt::TopologyChangeKind kind)
{
    return static_cast<std::size_t>(std::count_if(changes.begin(), changes.end(),
        [kind](const evt::NetworkTopologyChanged& c) { return c.change_kind == kind; }));
}

} // namespace pgtest
