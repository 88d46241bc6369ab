#include "powergrid/grid/TopologyNotifier.hpp"

#include <algorithm>
#include <set>
#include <utility>

namespace powergrid {

namespace {

using evt::NetworkTopologyChanged;
using evt::TopologyChangeKind;

TopologyChangeKind AddedKind(NodeKind kind)
{
    switch (kind)
    {
    case NodeKind::Producer: return TopologyChangeKind::ProducerAdded;
    case NodeKind::Consumer: return TopologyChangeKind::ConsumerAdded;
    case NodeKind::Link:     break;
    }
    return TopologyChangeKind::LinkAdded;
}

TopologyChangeKind RemovedKind(NodeKind kind)
{
    switch (kind)
    {
    case NodeKind::Producer: return TopologyChangeKind::ProducerRemoved;
    case NodeKind::Consumer: return TopologyChangeKind::ConsumerRemoved;
    case NodeKind::Link:     break;
    }
    return TopologyChangeKind::LinkRemoved;
}

NetworkTopologyChanged NetworkLevel(NetworkId id, TopologyChangeKind kind)
{
    NetworkTopologyChanged e;
    e.network_id = id;
    e.change_kind = kind;
    return e;
}

NetworkTopologyChanged NodeLevel(NetworkId id, TopologyChangeKind kind, NodeId node)
{
    NetworkTopologyChanged e = NetworkLevel(id, kind);
    e.node = node;
    return e;
}

bool Ordered(const NetworkTopologyChanged& a, const NetworkTopologyChanged& b)
{
    if (a.network_id != b.network_id)
        return a.network_id < b.network_id;

    const bool aNode = a.node != NullNode;
    const bool bNode = b.node != NullNode;
    if (aNode != bNode)
        return !aNode;
    if (aNode && a.node != b.node)
        return a.node < b.node;
    return a.change_kind < b.change_kind;
}

} // namespace

const std::vector<NetworkTopologyChanged>& TopologyNotifier::diff(const GridSnapshot& previous,
                                                                  const GridSnapshot& current)
{
    changes_.clear();

    std::set<NetworkId> derived;

    // Ids that disappeared: follow their surviving members.
    for (const auto& [id, pv] : previous.networks)
    {
        if (current.networks.count(id) != 0)
            continue;

        std::set<NetworkId> dest;
        for (const MemberView& m : pv->members)
        {
            const NetworkId now = current.network_of(m.id);
            if (now != NoNetwork)
                dest.insert(now);
        }

        if (dest.empty())
        {
            changes_.push_back(NetworkLevel(id, TopologyChangeKind::NetworkRemoved));
        }
        else
        {
            auto e = NetworkLevel(id, dest.size() == 1 ? TopologyChangeKind::NetworkMerged
                                                       : TopologyChangeKind::NetworkSplit);
            e.into.assign(dest.begin(), dest.end());
            changes_.push_back(std::move(e));
            derived.insert(dest.begin(), dest.end());
        }

        for (const MemberView& m : pv->members)
        {
            if (current.network_of(m.id) == NoNetwork)
                changes_.push_back(NodeLevel(id, RemovedKind(m.kind), m.id));
        }
    }

    for (const auto& [id, cv] : current.networks)
    {
        const auto pit = previous.networks.find(id);
        const NetworkView* pv = pit == previous.networks.end() ? nullptr : pit->second.get();

        if (pv == cv.get())
            continue;   // shared view: nothing changed

        if (!pv)
        {
            if (derived.count(id) == 0)
                changes_.push_back(NetworkLevel(id, TopologyChangeKind::NetworkCreated));
        }
        else
        {
            if (pv->has_surplus != cv->has_surplus)
            {
                auto e = NetworkLevel(id, TopologyChangeKind::BalanceChanged);
                e.has_surplus = cv->has_surplus;
                changes_.push_back(std::move(e));
            }

            for (const MemberView& m : pv->members)
            {
                if (current.network_of(m.id) == NoNetwork)
                    changes_.push_back(NodeLevel(id, RemovedKind(m.kind), m.id));
            }
        }

        for (const MemberView& m : cv->members)
        {
            const MemberView* before = previous.node(m.id);
            if (!before)
            {
                changes_.push_back(NodeLevel(id, AddedKind(m.kind), m.id));
                continue;
            }

            if (m.kind == NodeKind::Producer && before->operational != m.operational)
            {
                auto e = NodeLevel(id, TopologyChangeKind::GeneratorStateChanged, m.id);
                e.operational = m.operational;
                changes_.push_back(std::move(e));
            }
        }
    }

    std::stable_sort(changes_.begin(), changes_.end(), Ordered);
    return changes_;
}

} // namespace powergrid
