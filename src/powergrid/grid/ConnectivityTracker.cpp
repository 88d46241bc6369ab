#include "powergrid/grid/ConnectivityTracker.hpp"

#include <algorithm>
#include <utility>

#include <spdlog/spdlog.h>

namespace powergrid {

namespace {

const std::vector<NodeId> kNoLinks{};

void EraseValue(std::vector<NodeId>& v, NodeId value)
{
    const auto it = std::find(v.begin(), v.end(), value);
    if (it != v.end())
    {
        *it = v.back();
        v.pop_back();
    }
}

} // namespace

bool ConnectivityTracker::add_node(NodeId id)
{
    if (id == NullNode)
        return false;

    const auto [it, inserted] = slots_.try_emplace(id);
    if (!inserted)
        return false;

    it->second.parent = id;
    it->second.members.push_back(id);
    touched_.push_back(id);
    return true;
}

bool ConnectivityTracker::remove_node(NodeId id)
{
    const auto it = slots_.find(id);
    if (it == slots_.end())
    {
        spdlog::warn("ConnectivityTracker: remove_node on unknown node {}", ToIntegral(id));
        return false;
    }

    const NodeId root = root_of(id);
    std::vector<NodeId> cluster = std::move(slots_.at(root).members);

    for (const NodeId other : it->second.links)
        EraseValue(slots_.at(other).links, id);
    links_ -= it->second.links.size();

    slots_.erase(it);
    EraseValue(cluster, id);
    rebuild_cluster(cluster);
    return true;
}

bool ConnectivityTracker::connect(NodeId a, NodeId b)
{
    if (a == b)
        return false;

    const auto ia = slots_.find(a);
    const auto ib = slots_.find(b);
    if (ia == slots_.end() || ib == slots_.end())
        return false;

    auto& la = ia->second.links;
    if (std::find(la.begin(), la.end(), b) != la.end())
        return false;

    la.push_back(b);
    ib->second.links.push_back(a);
    ++links_;

    unite(a, b);
    touched_.push_back(a);
    touched_.push_back(b);
    return true;
}

bool ConnectivityTracker::disconnect(NodeId a, NodeId b)
{
    if (!linked(a, b))
        return false;

    EraseValue(slots_.at(a).links, b);
    EraseValue(slots_.at(b).links, a);
    --links_;

    // The cut can only split the cluster a and b shared before it.
    const NodeId root = root_of(a);
    const std::vector<NodeId> cluster = std::move(slots_.at(root).members);
    rebuild_cluster(cluster);
    return true;
}

NodeId ConnectivityTracker::find_root(NodeId id)
{
    if (!contains(id))
        return NullNode;
    return root_of(id);
}

bool ConnectivityTracker::connected(NodeId a, NodeId b)
{
    const NodeId ra = find_root(a);
    return ra != NullNode && ra == find_root(b);
}

std::vector<NodeId> ConnectivityTracker::members_of_root(NodeId root) const
{
    const auto it = slots_.find(root);
    if (it == slots_.end() || it->second.parent != root)
        return {};

    std::vector<NodeId> out = it->second.members;
    std::sort(out.begin(), out.end());
    return out;
}

bool ConnectivityTracker::linked(NodeId a, NodeId b) const
{
    const auto it = slots_.find(a);
    if (it == slots_.end() || !contains(b))
        return false;
    const auto& l = it->second.links;
    return std::find(l.begin(), l.end(), b) != l.end();
}

const std::vector<NodeId>& ConnectivityTracker::links_of(NodeId id) const
{
    const auto it = slots_.find(id);
    return it == slots_.end() ? kNoLinks : it->second.links;
}

std::vector<NodeId> ConnectivityTracker::take_touched()
{
    std::vector<NodeId> out;
    out.swap(touched_);

    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
    out.erase(std::remove_if(out.begin(), out.end(),
                             [this](NodeId n) { return !contains(n); }),
              out.end());
    return out;
}

void ConnectivityTracker::clear()
{
    slots_.clear();
    touched_.clear();
    links_ = 0;
}

NodeId ConnectivityTracker::root_of(NodeId id)
{
    NodeId root = id;
    for (NodeId p = slots_.at(root).parent; p != root; p = slots_.at(root).parent)
        root = p;

    // Path compression
    while (id != root)
    {
        Slot& s = slots_.at(id);
        const NodeId next = s.parent;
        s.parent = root;
        id = next;
    }
    return root;
}

void ConnectivityTracker::unite(NodeId a, NodeId b)
{
    NodeId ra = root_of(a);
    NodeId rb = root_of(b);
    if (ra == rb)
        return;

    Slot* sa = &slots_.at(ra);
    Slot* sb = &slots_.at(rb);
    if (sa->rank < sb->rank)
    {
        std::swap(ra, rb);
        std::swap(sa, sb);
    }

    sb->parent = ra;
    if (sa->rank == sb->rank)
        ++sa->rank;

    sa->members.insert(sa->members.end(), sb->members.begin(), sb->members.end());
    sb->members.clear();
    sb->members.shrink_to_fit();
}

void ConnectivityTracker::rebuild_cluster(const std::vector<NodeId>& cluster)
{
    for (const NodeId n : cluster)
    {
        Slot& s = slots_.at(n);
        s.parent = n;
        s.rank = 0;
        s.members.assign(1, n);
    }

    // Each link is stored on both endpoints; union it once.
    for (const NodeId n : cluster)
    {
        for (const NodeId other : slots_.at(n).links)
        {
            if (n < other)
                unite(n, other);
        }
    }

    touched_.insert(touched_.end(), cluster.begin(), cluster.end());
}

} // namespace powergrid
