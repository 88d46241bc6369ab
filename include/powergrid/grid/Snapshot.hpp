#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>
#include <entt/entt.hpp>

#include "powergrid/grid/Types.hpp"

namespace powergrid {

struct Network;
class ConsumerGate;

struct MemberView {
    NodeId        id{NullNode};
    NodeKind      kind{NodeKind::Link};
    ProducerState state{ProducerState::Idle};
    bool          operational{false};
    double        fuel_remaining{0.0};
    bool          powered{false};
};

struct NetworkView {
    NetworkId               id{NoNetwork};
    std::vector<MemberView> members;   // ascending by id
    std::uint64_t           supply{0};
    std::uint64_t           demand{0};
    bool                    has_surplus{true};

    [[nodiscard]] const MemberView* member(NodeId node) const;
    [[nodiscard]] NetworkStats stats() const noexcept {
        return NetworkStats{members.size(), supply, demand, has_surplus};
    }
};

using NetworkViewPtr = std::shared_ptr<const NetworkView>;

// node -> network lookup, split into shards by entity slot. A snapshot that
// only rewrote a few networks shares every shard those networks don't touch.
class NodeIndex {
public:
    using Shard = std::unordered_map<NodeId, NetworkId>;
    static constexpr unsigned kShardBits = 8;   // 256 slots per shard

    [[nodiscard]] NetworkId find(NodeId node) const;
    [[nodiscard]] std::size_t size() const noexcept { return size_; }
    [[nodiscard]] std::size_t shard_count() const noexcept { return shards_.size(); }
    [[nodiscard]] const Shard* shard(std::size_t i) const {
        return i < shards_.size() ? shards_[i].get() : nullptr;
    }

    // Erases `erase`, then applies `assign`. Shards neither list lands in are
    // shared with *this.
    [[nodiscard]] NodeIndex updated(const std::vector<std::pair<NodeId, NetworkId>>& assign,
                                    const std::vector<NodeId>& erase) const;

private:
    std::vector<std::shared_ptr<const Shard>> shards_;
    std::size_t                               size_{0};
};

// Immutable picture of the grid at the end of a tick. Networks that did not
// change share their view with the previous snapshot.
struct GridSnapshot {
    std::uint64_t                        tick{0};
    std::map<NetworkId, NetworkViewPtr>  networks;
    std::shared_ptr<const NodeIndex>     node_index = std::make_shared<const NodeIndex>();

    [[nodiscard]] NetworkId network_of(NodeId node) const;
    [[nodiscard]] const NetworkView* network(NetworkId id) const;
    [[nodiscard]] const MemberView* node(NodeId node) const;
    [[nodiscard]] std::size_t node_count() const noexcept { return node_index->size(); }

    [[nodiscard]] std::optional<NetworkStats> get_network_stats(NetworkId id) const;
    [[nodiscard]] bool is_powered(NodeId consumer) const;
    [[nodiscard]] std::optional<ProducerStatus> get_producer_state(NodeId producer) const;
};

NetworkViewPtr BuildNetworkView(const Network& net, const entt::registry& reg, const ConsumerGate& gate);

// Hand-off point for readers on other threads: they only ever get a
// shared_ptr to a finished, immutable snapshot.
class SnapshotPublisher {
public:
    SnapshotPublisher() : current_(std::make_shared<const GridSnapshot>()) {}

    void publish(std::shared_ptr<const GridSnapshot> snapshot);
    [[nodiscard]] std::shared_ptr<const GridSnapshot> latest() const;
    void reset();

private:
    mutable std::mutex                  mutex_;
    std::shared_ptr<const GridSnapshot> current_;
};

} // namespace powergrid
