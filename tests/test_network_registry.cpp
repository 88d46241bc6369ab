// tests/test_network_registry.cpp
//
// Incremental partition + network id rules.

#include <doctest/doctest.h>

#include "powergrid/grid/ConnectivityTracker.hpp"
#include "powergrid/grid/NetworkRegistry.hpp"

#include <vector>

using namespace powergrid;

namespace {

struct Fixture {
    entt::registry       reg;
    ConnectivityTracker  tracker;
    NetworkRegistry      networks;
    std::vector<NodeId>  removed;

    NodeId add()
    {
        const NodeId id = reg.create();
        tracker.add_node(id);
        return id;
    }

    void remove(NodeId id)
    {
        tracker.remove_node(id);
        removed.push_back(id);
    }

    RegistryUpdate update()
    {
        RegistryUpdate out = networks.update(tracker, removed);
        removed.clear();
        return out;
    }
};

} // namespace

TEST_CASE("NetworkRegistry: new isolated nodes get fresh ids in node order")
{
    Fixture f;
    const NodeId a = f.add();
    const NodeId b = f.add();

    const auto u = f.update();
    CHECK(u.touched == std::vector<NetworkId>{1, 2});
    CHECK(u.retired.empty());
    CHECK(f.networks.network_of(a) == 1);
    CHECK(f.networks.network_of(b) == 2);
    CHECK(f.networks.next_id() == 3);

    // Nothing changed: nothing touched, ids stable.
    const auto idle = f.update();
    CHECK(idle.touched.empty());
    CHECK(idle.retired.empty());
    CHECK(f.networks.size() == 2);
}

TEST_CASE("NetworkRegistry: merging networks 3 and 7 keeps id 3")
{
    Fixture f;
    std::vector<NodeId> n;
    for (int i = 0; i < 7; ++i)
        n.push_back(f.add());
    f.update();
    REQUIRE(f.networks.network_of(n[2]) == 3);
    REQUIRE(f.networks.network_of(n[6]) == 7);

    f.tracker.connect(n[6], n[2]);
    const auto u = f.update();

    CHECK(u.touched == std::vector<NetworkId>{3});
    CHECK(u.retired == std::vector<NetworkId>{7});
    CHECK(f.networks.network_of(n[6]) == 3);
    CHECK(f.networks.find(7) == nullptr);
    CHECK(f.networks.find(3)->members == std::vector<NodeId>{n[2], n[6]});
    // Untouched networks keep their ids.
    CHECK(f.networks.network_of(n[0]) == 1);
}

TEST_CASE("NetworkRegistry: splitting network 3 yields two new ids, neither 3")
{
    Fixture f;
    f.add();
    f.add();
    const NodeId a = f.add();
    const NodeId b = f.add();
    const NodeId c = f.add();
    f.tracker.connect(a, b);
    f.tracker.connect(b, c);
    f.update();
    REQUIRE(f.networks.network_of(a) == 3);
    REQUIRE(f.networks.network_of(c) == 3);

    f.tracker.disconnect(b, c);
    const auto u = f.update();

    CHECK(u.retired == std::vector<NetworkId>{3});
    REQUIRE(u.touched.size() == 2);
    CHECK(u.touched[0] != 3);
    CHECK(u.touched[1] != 3);
    CHECK(f.networks.network_of(a) == f.networks.network_of(b));
    CHECK(f.networks.network_of(a) != f.networks.network_of(c));
    CHECK(f.networks.find(3) == nullptr);
}

TEST_CASE("NetworkRegistry: trimming a leaf keeps the id, removing everything retires it")
{
    Fixture f;
    const NodeId a = f.add();
    const NodeId b = f.add();
    const NodeId c = f.add();
    f.tracker.connect(a, b);
    f.tracker.connect(b, c);
    f.update();
    const NetworkId id = f.networks.network_of(a);

    f.remove(c);
    auto u = f.update();
    CHECK(u.touched == std::vector<NetworkId>{id});
    CHECK(u.retired.empty());
    CHECK(f.networks.find(id)->members == std::vector<NodeId>{a, b});
    CHECK(f.networks.network_of(c) == NoNetwork);

    f.remove(a);
    f.remove(b);
    u = f.update();
    CHECK(u.touched.empty());
    CHECK(u.retired == std::vector<NetworkId>{id});
    CHECK(f.networks.size() == 0);
}

TEST_CASE("NetworkRegistry: removing the middle of a chain is a split")
{
    Fixture f;
    const NodeId a = f.add();
    const NodeId b = f.add();
    const NodeId c = f.add();
    f.tracker.connect(a, b);
    f.tracker.connect(b, c);
    f.update();
    const NetworkId id = f.networks.network_of(a);

    f.remove(b);
    const auto u = f.update();
    CHECK(u.retired == std::vector<NetworkId>{id});
    CHECK(u.touched.size() == 2);
    CHECK(f.networks.network_of(a) != id);
    CHECK(f.networks.network_of(c) != id);
    CHECK(f.networks.network_of(a) != f.networks.network_of(c));
}

TEST_CASE("NetworkRegistry: a fresh node joining an existing network does not change its id")
{
    Fixture f;
    const NodeId a = f.add();
    f.update();
    const NetworkId id = f.networks.network_of(a);

    const NodeId b = f.add();
    f.tracker.connect(a, b);
    const auto u = f.update();
    CHECK(u.touched == std::vector<NetworkId>{id});
    CHECK(f.networks.network_of(b) == id);
    CHECK(f.networks.find(id)->members.size() == 2);
}

TEST_CASE("NetworkRegistry: split and merge in one update mint a fresh id for the joined part")
{
    Fixture f;
    const NodeId a = f.add();
    const NodeId b = f.add();
    const NodeId c = f.add();
    f.tracker.connect(a, b);
    f.update();
    const NetworkId ab = f.networks.network_of(a);
    const NetworkId cid = f.networks.network_of(c);

    f.tracker.disconnect(a, b);
    f.tracker.connect(b, c);
    const auto u = f.update();

    CHECK(u.retired == std::vector<NetworkId>{ab, cid});
    CHECK(f.networks.network_of(b) == f.networks.network_of(c));
    CHECK(f.networks.network_of(b) > cid);
    CHECK(f.networks.network_of(a) > cid);
}

TEST_CASE("NetworkRegistry::clear resets ids")
{
    Fixture f;
    f.add();
    f.update();
    f.networks.clear();
    CHECK(f.networks.size() == 0);
    CHECK(f.networks.next_id() == 1);
}
