#include <charconv>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <map>
#include <string>
#include <system_error>

#include <spdlog/spdlog.h>

#include "core/Config.h"
#include "core/TickLoop.h"
#include "logging/Log.h"
#include "powergrid/grid/Components.hpp"
#include "powergrid/grid/PowerGrid.hpp"
#include "powergrid/save/GridSave.hpp"

using std::string;
namespace fs = std::filesystem;
namespace pg = powergrid;

// --- utilities ---------------------------------------------------------------

static std::map<string, string> parse_kv(int argc, char** argv) {
    std::map<string,string> kv;
    for (int i=1;i<argc;++i) {
        string a = argv[i];
        auto eq = a.find('=');
        if (eq != string::npos) {
            kv[a.substr(0,eq)] = a.substr(eq+1);
        } else if (a.rfind("--",0)==0 && i+1<argc && string(argv[i+1]).rfind("--",0)!=0) {
            kv[a] = argv[++i];
        } else {
            kv[a] = "";
        }
    }
    return kv;
}

static bool parse_u64(const string& s, std::uint64_t& out) {
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    return !s.empty() && ec == std::errc{} && ptr == s.data() + s.size();
}

static void on_topology(const pg::evt::NetworkTopologyChanged& e) {
    if (e.node != pg::NullNode)
        spdlog::info("network {}: {} (node {})", e.network_id, pg::evt::ToString(e.change_kind), pg::ToIntegral(e.node));
    else
        spdlog::info("network {}: {}", e.network_id, pg::evt::ToString(e.change_kind));
}

static void on_power(const pg::evt::ConsumerPowerStateChanged& e) {
    spdlog::info("consumer {} {}", pg::ToIntegral(e.consumer_id), e.powered ? "powered" : "unpowered");
}

// --- demo --------------------------------------------------------------------

// A generator and a furnace on one line, a second consumer hanging off a
// relay, and a fuelled boiler that only starts once it is refuelled.
static void build_demo(pg::PowerGrid& grid) {
    using namespace pg::evt;

    const auto gen     = grid.create_node_id();
    const auto furnace = grid.create_node_id();
    const auto relay   = grid.create_node_id();
    const auto press   = grid.create_node_id();
    const auto boiler  = grid.create_node_id();

    grid.submit(NodePlaced{gen,     pg::NodeKind::Producer, {0, 0, 0}, 10, false, {}, {}});
    grid.submit(NodePlaced{furnace, pg::NodeKind::Consumer, {2, 0, 0}, 10, false, {}, {}});
    grid.submit(NodePlaced{relay,   pg::NodeKind::Link,     {1, 0, 0},  0, false, {}, {}});
    grid.submit(NodePlaced{press,   pg::NodeKind::Consumer, {1, 1, 0},  5, false, {}, {}});
    grid.submit(NodePlaced{boiler,  pg::NodeKind::Producer, {1,-1, 0},  8, true, 0.5, 3u});

    grid.submit(LinkEstablished{gen, relay});
    grid.submit(LinkEstablished{relay, furnace});
    grid.submit(LinkEstablished{relay, press});
    grid.submit(LinkEstablished{relay, boiler});
    grid.submit(FuelDeposited{boiler, 4.0});
}

// Stands in for the inventory side: every fuelled producer gets `amount`.
static void refuel_all(pg::PowerGrid& grid, double amount) {
    for (const auto e : grid.registry().view<pg::comp::FuelSlot>())
        grid.submit(pg::evt::FuelDeposited{e, amount});
}

static void print_stats(const pg::PowerGrid& grid) {
    std::cout << "tick " << grid.tick_index() << ": " << grid.node_count() << " nodes, "
              << grid.networks().size() << " networks\n";
    for (const pg::NetworkId id : grid.networks()) {
        const auto stats = grid.get_network_stats(id);
        if (!stats) continue;
        std::cout << "  network " << id
                  << "  members=" << stats->member_count
                  << "  supply=" << stats->supply
                  << "  demand=" << stats->demand
                  << "  surplus=" << stats->surplus()
                  << (stats->has_surplus ? "  [ok]" : "  [deficit]") << "\n";
    }
}

int main(int argc, char** argv) {
    auto kv = parse_kv(argc, argv);

    if (kv.count("--help") || kv.count("-h")) {
        std::cerr <<
          "Usage:\n"
          "  powergrid_sim [--config <dir>] [--load <save.json> | --demo] [--ticks <n>]\n"
          "                [--realtime] [--refuel-every <n>] [--save <save.json>]\n";
        return 1;
    }

    core::Config cfg;
    if (kv.count("--config")) {
        if (!core::LoadConfig(cfg, kv.at("--config")))
            std::cerr << "No " << core::ConfigPath(kv.at("--config")).string() << "; using defaults.\n";
    }
    logsys::init(cfg.log);

    std::uint64_t ticks = 100;
    if (kv.count("--ticks") && !parse_u64(kv.at("--ticks"), ticks)) {
        std::cerr << "Bad --ticks value '" << kv.at("--ticks") << "'\n";
        logsys::shutdown();
        return 1;
    }

    std::uint64_t refuelEvery = 0;
    if (kv.count("--refuel-every") && !parse_u64(kv.at("--refuel-every"), refuelEvery)) {
        std::cerr << "Bad --refuel-every value '" << kv.at("--refuel-every") << "'\n";
        logsys::shutdown();
        return 1;
    }

    pg::PowerGrid grid(cfg.grid);
    grid.events().sink<pg::evt::NetworkTopologyChanged>().connect<&on_topology>();
    grid.events().sink<pg::evt::ConsumerPowerStateChanged>().connect<&on_power>();

    if (kv.count("--load")) {
        auto loaded = pg::save::LoadGridSave(kv.at("--load"));
        if (!loaded) {
            spdlog::error("load {} failed: {}", kv.at("--load"), loaded.error().message);
            logsys::shutdown();
            return 2;
        }
        grid.import_state(*loaded);
    } else if (kv.count("--demo")) {
        build_demo(grid);
    }

    const std::uint64_t last = grid.tick_index() + ticks;

    core::TickLoop loop;
    loop.IsRunning = [&] { return grid.tick_index() < last; };
    loop.SampleInputsForStep = [&](std::uint64_t step) {
        if (refuelEvery != 0 && step % refuelEvery == 0)
            refuel_all(grid, 2.0);
    };
    loop.UpdateFixed = [&](double) { grid.tick(); };

    core::TickLoopConfig loopCfg;
    loopCfg.fixed_dt = 1.0 / static_cast<double>(cfg.grid.tick_rate_hz);
    loopCfg.realtime = kv.count("--realtime") != 0;
    loop.Run(loopCfg);

    print_stats(grid);

    int rc = 0;
    if (kv.count("--save")) {
        const auto saved = pg::save::SaveGridSave(grid.export_state(), kv.at("--save"));
        if (!saved) {
            spdlog::error("save {} failed: {}", kv.at("--save"), saved.error().message);
            rc = 2;
        }
    }

    grid.teardown();
    logsys::shutdown();
    return rc;
}
