#include "powergrid/grid/Snapshot.hpp"
#include "powergrid/grid/Components.hpp"
#include "powergrid/grid/ConsumerGate.hpp"
#include "powergrid/grid/NetworkRegistry.hpp"

#include <algorithm>
#include <utility>

namespace powergrid {

const MemberView* NetworkView::member(NodeId node) const
{
    const auto it = std::lower_bound(members.begin(), members.end(), node,
                                     [](const MemberView& m, NodeId id) { return m.id < id; });
    return (it != members.end() && it->id == node) ? &*it : nullptr;
}

namespace {

std::size_t ShardOf(NodeId node)
{
    return static_cast<std::size_t>(entt::to_entity(node)) >> NodeIndex::kShardBits;
}

} // namespace

NetworkId NodeIndex::find(NodeId node) const
{
    if (node == NullNode)
        return NoNetwork;
    const Shard* s = shard(ShardOf(node));
    if (!s)
        return NoNetwork;
    const auto it = s->find(node);
    return it == s->end() ? NoNetwork : it->second;
}

NodeIndex NodeIndex::updated(const std::vector<std::pair<NodeId, NetworkId>>& assign,
                             const std::vector<NodeId>& erase) const
{
    NodeIndex out = *this;
    std::unordered_map<std::size_t, std::shared_ptr<Shard>> cloned;

    auto writable = [&](std::size_t i) -> Shard& {
        if (auto it = cloned.find(i); it != cloned.end())
            return *it->second;
        if (i >= out.shards_.size())
            out.shards_.resize(i + 1);
        auto copy = out.shards_[i] ? std::make_shared<Shard>(*out.shards_[i]) : std::make_shared<Shard>();
        Shard& ref = *copy;
        cloned.emplace(i, std::move(copy));
        return ref;
    };

    for (const NodeId node : erase)
    {
        if (node == NullNode || find(node) == NoNetwork)
            continue;
        out.size_ -= writable(ShardOf(node)).erase(node);
    }
    for (const auto& [node, network] : assign)
    {
        if (node == NullNode)
            continue;
        if (writable(ShardOf(node)).insert_or_assign(node, network).second)
            ++out.size_;
    }

    for (auto& [i, s] : cloned)
        out.shards_[i] = std::move(s);
    return out;
}

NetworkId GridSnapshot::network_of(NodeId node) const
{
    return node_index->find(node);
}

const NetworkView* GridSnapshot::network(NetworkId id) const
{
    const auto it = networks.find(id);
    return it == networks.end() ? nullptr : it->second.get();
}

const MemberView* GridSnapshot::node(NodeId node) const
{
    const NetworkView* net = network(network_of(node));
    return net ? net->member(node) : nullptr;
}

std::optional<NetworkStats> GridSnapshot::get_network_stats(NetworkId id) const
{
    if (const NetworkView* net = network(id))
        return net->stats();
    return std::nullopt;
}

bool GridSnapshot::is_powered(NodeId consumer) const
{
    const MemberView* m = node(consumer);
    return m && m->kind == NodeKind::Consumer && m->powered;
}

std::optional<ProducerStatus> GridSnapshot::get_producer_state(NodeId producer) const
{
    const MemberView* m = node(producer);
    if (!m || m->kind != NodeKind::Producer)
        return std::nullopt;
    return ProducerStatus{m->state, m->fuel_remaining};
}

NetworkViewPtr BuildNetworkView(const Network& net, const entt::registry& reg, const ConsumerGate& gate)
{
    auto view = std::make_shared<NetworkView>();
    view->id = net.id;
    view->supply = net.cumulative_supply;
    view->demand = net.cumulative_demand;
    view->has_surplus = net.has_surplus;
    view->members.reserve(net.members.size());

    for (const NodeId m : net.members)
    {
        MemberView mv;
        mv.id = m;
        if (const auto* node = reg.try_get<comp::PowerNode>(m))
            mv.kind = node->kind;
        if (const auto* p = reg.try_get<comp::Producer>(m))
        {
            mv.state = p->state;
            mv.operational = p->operational();
        }
        if (const auto* fuel = reg.try_get<comp::FuelSlot>(m))
            mv.fuel_remaining = fuel->quantity;
        if (mv.kind == NodeKind::Consumer)
            mv.powered = gate.is_powered(m);

        view->members.push_back(mv);
    }

    return view;
}

void SnapshotPublisher::publish(std::shared_ptr<const GridSnapshot> snapshot)
{
    std::lock_guard<std::mutex> lock(mutex_);
    current_.swap(snapshot);
}

std::shared_ptr<const GridSnapshot> SnapshotPublisher::latest() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

void SnapshotPublisher::reset()
{
    auto empty = std::make_shared<const GridSnapshot>();
    std::lock_guard<std::mutex> lock(mutex_);
    current_.swap(empty);
}

} // namespace powergrid
