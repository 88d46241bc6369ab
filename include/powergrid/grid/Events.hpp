#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <variant>
#include <vector>

#include "powergrid/grid/Types.hpp"

namespace powergrid::evt {

// ---- inbound: produced by world/placement management -----------------------

struct NodePlaced {
    NodeId        id{NullNode};          // from PowerGrid::create_node_id()
    NodeKind      kind{NodeKind::Link};
    GridPos       position{};
    std::uint32_t supply_or_demand{0};   // output for producers, demand for consumers
    bool          requires_fuel{false};  // producers only

    // Unset -> GridConfig defaults.
    std::optional<double>        consumption_rate;
    std::optional<std::uint32_t> startup_delay_ticks;
};

struct NodeRemoved     { NodeId id{NullNode}; };
struct LinkEstablished { NodeId a{NullNode}; NodeId b{NullNode}; };
struct LinkBroken      { NodeId a{NullNode}; NodeId b{NullNode}; };
struct FuelDeposited   { NodeId producer_id{NullNode}; double amount{0.0}; };

using InboundEvent = std::variant<NodePlaced, NodeRemoved, LinkEstablished, LinkBroken, FuelDeposited>;

// ---- outbound: consumed by the scripting bridge and UI -------------------

enum class TopologyChangeKind : std::uint8_t {
    NetworkCreated,
    NetworkSplit,
    NetworkMerged,
    NetworkRemoved,
    GeneratorStateChanged,
    ProducerAdded,
    ProducerRemoved,
    ConsumerAdded,
    ConsumerRemoved,
    LinkAdded,
    LinkRemoved,
    BalanceChanged,
};

constexpr std::size_t kTopologyChangeKindCount = 12;

const char* ToString(TopologyChangeKind kind) noexcept;
bool ParseTopologyChangeKind(std::string_view text, TopologyChangeKind& out) noexcept;

struct NetworkTopologyChanged {
    NetworkId          network_id{NoNetwork};
    TopologyChangeKind change_kind{TopologyChangeKind::NetworkCreated};

    NodeId                 node{NullNode};    // generator/producer/consumer/link kinds
    std::vector<NetworkId> into;              // NetworkSplit: every resulting id; NetworkMerged: the survivor
    bool                   operational{false}; // GeneratorStateChanged
    bool                   has_surplus{false}; // BalanceChanged
};

// Only on an actual flip.
struct ConsumerPowerStateChanged {
    NodeId consumer_id{NullNode};
    bool   powered{false};
};

} // namespace powergrid::evt
