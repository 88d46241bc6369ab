// tests/test_grid_save.cpp
//
// Save format and the export/import path through PowerGrid.
//
// Goals:
//   - JSON keeps unknown fields of newer writers
//   - LoadGridSave reports each failure class with its own code
//   - A grid exported and imported again answers every query the same way

#include <doctest/doctest.h>

#include "powergrid/grid/PowerGrid.hpp"
#include "powergrid/save/GridSave.hpp"
#include "support/GridBuilders.h"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

namespace fs = std::filesystem;
using namespace powergrid;
using namespace pgtest;
using nlohmann::json;

namespace {

fs::path make_unique_temp_dir()
{
    std::error_code ec;
    fs::path base = fs::temp_directory_path(ec);
    if (ec || base.empty())
        base = fs::path(".");

    const auto stamp = static_cast<long long>(
        std::chrono::high_resolution_clock::now().time_since_epoch().count());

    fs::path dir = base / ("powergrid_save_tests_" + std::to_string(stamp));
    fs::create_directories(dir, ec);
    if (ec)
        return base;

    return dir;
}

void write_text(const fs::path& p, const std::string& text)
{
    std::ofstream f(p, std::ios::binary | std::ios::trunc);
    REQUIRE(f.good());
    f << text;
}

} // namespace

TEST_CASE("GridSave JSON keeps unknown fields at every level")
{
    const json in = json::parse(R"({
        "schema_version": 1,
        "tick": 42,
        "world_name": "north",
        "nodes": [
            { "kind": "producer", "position": [0, 0, 0], "amount": 8,
              "requires_fuel": true, "fuel": 3.5, "consumption_rate": 0.5,
              "startup_delay_ticks": 4, "startup_timer": 2, "state": "idle",
              "skin": "rusty" },
            { "kind": "consumer", "position": { "x": 1, "y": 0, "z": 0 }, "amount": 3 }
        ],
        "links": [ [0, 1] ]
    })");

    const save::GridSave s = in.get<save::GridSave>();
    CHECK(s.tick == 42);
    REQUIRE(s.nodes.size() == 2);
    CHECK(s.nodes[0].kind == NodeKind::Producer);
    CHECK(s.nodes[0].requires_fuel);
    CHECK(s.nodes[0].fuel == doctest::Approx(3.5));
    CHECK(s.nodes[0].startup_timer == 2);
    CHECK(s.nodes[0].extras.at("skin") == "rusty");
    CHECK(s.nodes[1].position == GridPos{1, 0, 0});
    REQUIRE(s.links.size() == 1);
    CHECK(s.links[0].b == 1);
    CHECK(s.extras.at("world_name") == "north");

    const json out = s;
    CHECK(out.at("world_name") == "north");
    CHECK(out.at("nodes").at(0).at("skin") == "rusty");
    CHECK(out.at("nodes").at(0).at("state") == "idle");
    // Producer-only fields are not written for consumers.
    CHECK_FALSE(out.at("nodes").at(1).contains("fuel"));
}

TEST_CASE("GridSave rejects unknown node kinds")
{
    const json bad = json::parse(R"({ "nodes": [ { "kind": "battery", "position": [0,0,0] } ] })");
    CHECK_THROWS_AS(bad.get<save::GridSave>(), json::type_error);
}

TEST_CASE("LoadGridSave reports a distinct code per failure")
{
    const fs::path dir = make_unique_temp_dir() / "errors";
    std::error_code ec;
    fs::create_directories(dir, ec);

    SUBCASE("missing file")
    {
        const auto r = save::LoadGridSave(dir / "nope.json");
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code == save::SaveError::Code::IoOpenFail);
    }

    SUBCASE("malformed json")
    {
        write_text(dir / "broken.json", "{ \"nodes\": [ ");
        const auto r = save::LoadGridSave(dir / "broken.json");
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code == save::SaveError::Code::JsonParseError);
    }

    SUBCASE("root is not an object")
    {
        write_text(dir / "array.json", "[1, 2, 3]");
        const auto r = save::LoadGridSave(dir / "array.json");
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code == save::SaveError::Code::JsonTypeError);
    }

    SUBCASE("wrong field types")
    {
        write_text(dir / "types.json", R"({ "schema_version": 1, "nodes": [ { "kind": 7 } ] })");
        const auto r = save::LoadGridSave(dir / "types.json");
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code == save::SaveError::Code::JsonTypeError);
    }

    SUBCASE("newer schema")
    {
        write_text(dir / "future.json", R"({ "schema_version": 99, "nodes": [] })");
        const auto r = save::LoadGridSave(dir / "future.json");
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code == save::SaveError::Code::MigrationFailed);
    }

    std::error_code dec;
    fs::remove_all(dir, dec);
}

TEST_CASE("SaveGridSave writes a file LoadGridSave reads back")
{
    const fs::path dir = make_unique_temp_dir() / "roundtrip";
    std::error_code ec;
    fs::create_directories(dir, ec);
    const fs::path file = dir / "grid.json";

    save::GridSave s;
    s.tick = 7;
    save::NodeRecord p;
    p.kind = NodeKind::Producer;
    p.amount = 5;
    save::NodeRecord c;
    c.kind = NodeKind::Consumer;
    c.position = {2, 0, 0};
    c.amount = 5;
    s.nodes = {p, c};
    s.links = {save::LinkRecord{0, 1}};

    REQUIRE(save::SaveGridSave(s, file).has_value());
    CHECK(fs::exists(file));
    CHECK_FALSE(fs::exists(dir / "grid.json.tmp"));

    const auto loaded = save::LoadGridSave(file);
    REQUIRE(loaded.has_value());
    CHECK(loaded->tick == 7);
    CHECK(loaded->nodes.size() == 2);
    CHECK(loaded->nodes[1].position == GridPos{2, 0, 0});
    CHECK(loaded->links.size() == 1);

    std::error_code dec;
    fs::remove_all(dir, dec);
}

TEST_CASE("PowerGrid export/import reproduces networks, balance and producer state")
{
    PowerGrid grid;
    const NodeId gen = PlaceFuelled(grid, {0, 0, 0}, 6, 1, 0.5);
    const NodeId c = Place(grid, NodeKind::Consumer, {1, 0, 0}, 6);
    const NodeId far = Place(grid, NodeKind::Consumer, {9, 0, 0}, 2);
    const NodeId wire = Place(grid, NodeKind::Link, {9, 1, 0});
    Link(grid, gen, c);
    Link(grid, far, wire);
    Refuel(grid, gen, 4.0);
    grid.tick();
    grid.tick();

    REQUIRE(grid.get_producer_state(gen)->state == ProducerState::Operational);
    REQUIRE(grid.is_powered(c));

    const save::GridSave saved = grid.export_state();
    CHECK(saved.tick == 2);
    CHECK(saved.nodes.size() == 4);
    CHECK(saved.links.size() == 2);

    PowerGrid restored;
    CHECK(restored.import_state(saved) == 4);
    CHECK(restored.tick_index() == 2);
    CHECK(restored.networks().size() == 2);
    CHECK(PartitionHolds(restored));
    CHECK(restored.last_changes().empty());

    const NodeId gen2 = restored.node_at({0, 0, 0});
    const NodeId c2 = restored.node_at({1, 0, 0});
    const NodeId far2 = restored.node_at({9, 0, 0});
    REQUIRE(gen2 != NullNode);
    REQUIRE(c2 != NullNode);
    REQUIRE(far2 != NullNode);

    const auto st = restored.get_producer_state(gen2);
    REQUIRE(st);
    CHECK(st->state == ProducerState::Operational);
    CHECK(st->fuel_remaining == doctest::Approx(grid.get_producer_state(gen)->fuel_remaining));
    CHECK(restored.is_powered(c2));
    CHECK_FALSE(restored.is_powered(far2));
    CHECK(restored.network_of(gen2) == restored.network_of(c2));

    const auto a = grid.get_network_stats(grid.network_of(c));
    const auto b = restored.get_network_stats(restored.network_of(c2));
    REQUIRE(a);
    REQUIRE(b);
    CHECK(a->supply == b->supply);
    CHECK(a->demand == b->demand);
    CHECK(a->member_count == b->member_count);

    // Simulation continues from the restored state.
    restored.tick();
    CHECK(restored.get_producer_state(gen2)->fuel_remaining
          == doctest::Approx(st->fuel_remaining - 0.5));
}

TEST_CASE("PowerGrid::import_state skips links to missing records")
{
    save::GridSave s;
    save::NodeRecord a;
    a.kind = NodeKind::Link;
    save::NodeRecord b;
    b.kind = NodeKind::Link;
    b.position = {1, 0, 0};
    save::NodeRecord clash = b;    // same position: not restored
    s.nodes = {a, b, clash};
    s.links = {save::LinkRecord{0, 1}, save::LinkRecord{0, 5}, save::LinkRecord{1, 2}};

    PowerGrid grid;
    CHECK(grid.import_state(s) == 2);
    CHECK(grid.node_count() == 2);
    CHECK(grid.networks().size() == 1);
    CHECK(grid.links_of(grid.node_at({0, 0, 0})).size() == 1);
    CHECK(PartitionHolds(grid));
}
