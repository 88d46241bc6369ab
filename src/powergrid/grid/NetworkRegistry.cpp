#include "powergrid/grid/NetworkRegistry.hpp"
#include "powergrid/grid/ConnectivityTracker.hpp"

#include <algorithm>
#include <set>
#include <unordered_set>
#include <utility>

namespace powergrid {

RegistryUpdate NetworkRegistry::update(ConnectivityTracker& tracker, const std::vector<NodeId>& removed)
{
    RegistryUpdate out;

    std::set<NetworkId>    affected;
    std::vector<NetworkId> expand;
    auto mark = [&](NetworkId id) {
        if (affected.insert(id).second)
            expand.push_back(id);
    };

    for (const NodeId n : removed)
    {
        const auto it = node_network_.find(n);
        if (it == node_network_.end())
            continue;
        mark(it->second);
        node_network_.erase(it);
    }

    std::vector<std::vector<NodeId>>   clusters;
    std::unordered_set<NodeId>         seenRoots;
    auto absorb = [&](NodeId n) {
        const NodeId root = tracker.find_root(n);
        if (root == NullNode || seenRoots.count(root) != 0)
            return;
        seenRoots.insert(root);
        clusters.push_back(tracker.members_of_root(root));
    };

    for (const NodeId n : tracker.take_touched())
        absorb(n);

    // Every old network that lost or shared a member must be re-derived in full,
    // otherwise its untouched remainder would keep a retired id.
    std::size_t scanned = 0;
    for (;;)
    {
        for (; scanned < clusters.size(); ++scanned)
        {
            for (const NodeId m : clusters[scanned])
            {
                const auto it = node_network_.find(m);
                if (it != node_network_.end())
                    mark(it->second);
            }
        }

        if (expand.empty())
            break;

        const NetworkId id = expand.back();
        expand.pop_back();
        if (const Network* net = find(id))
        {
            for (const NodeId m : net->members)
                absorb(m);
        }
    }

    if (clusters.empty() && affected.empty())
        return out;

    std::sort(clusters.begin(), clusters.end(),
              [](const auto& a, const auto& b) { return a.front() < b.front(); });

    std::vector<std::vector<NetworkId>> sources(clusters.size());
    std::map<NetworkId, std::size_t>    fanOut;
    for (std::size_t ci = 0; ci < clusters.size(); ++ci)
    {
        auto& src = sources[ci];
        for (const NodeId m : clusters[ci])
        {
            const auto it = node_network_.find(m);
            if (it != node_network_.end())
                src.push_back(it->second);
        }
        std::sort(src.begin(), src.end());
        src.erase(std::unique(src.begin(), src.end()), src.end());
        for (const NetworkId s : src)
            ++fanOut[s];
    }

    auto isSplit = [&](NetworkId id) { return fanOut[id] > 1; };

    std::vector<NetworkId> ids(clusters.size(), NoNetwork);
    std::set<NetworkId>    reused;
    for (std::size_t ci = 0; ci < clusters.size(); ++ci)
    {
        const auto& src = sources[ci];
        if (src.empty() || std::any_of(src.begin(), src.end(), isSplit))
        {
            ids[ci] = mint();
        }
        else
        {
            ids[ci] = src.front();   // smallest id survives a merge
            reused.insert(ids[ci]);
        }
    }

    for (const NetworkId id : affected)
    {
        if (reused.count(id) == 0)
        {
            networks_.erase(id);
            out.retired.push_back(id);
        }
    }

    for (std::size_t ci = 0; ci < clusters.size(); ++ci)
    {
        const NetworkId id = ids[ci];
        Network& net = networks_[id];
        net.id = id;
        net.members = std::move(clusters[ci]);
        for (const NodeId m : net.members)
            node_network_[m] = id;

        out.touched.push_back(id);
    }
    std::sort(out.touched.begin(), out.touched.end());
    return out;
}

const Network* NetworkRegistry::find(NetworkId id) const
{
    const auto it = networks_.find(id);
    return it == networks_.end() ? nullptr : &it->second;
}

Network* NetworkRegistry::find(NetworkId id)
{
    const auto it = networks_.find(id);
    return it == networks_.end() ? nullptr : &it->second;
}

NetworkId NetworkRegistry::network_of(NodeId node) const
{
    const auto it = node_network_.find(node);
    return it == node_network_.end() ? NoNetwork : it->second;
}

void NetworkRegistry::clear()
{
    networks_.clear();
    node_network_.clear();
    next_id_ = 1;
}

} // namespace powergrid
