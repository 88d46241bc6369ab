#include <benchmark/benchmark.h>
#include "powergrid/grid/PowerGrid.hpp"
#include <spdlog/spdlog.h>
#include <random>
#include <vector>

using namespace powergrid;

// A w*w sheet of wires in the z=0 plane, one producer per row start and a
// consumer every fourth cell. Everything is a single network.
static std::vector<NodeId> make_sheet(PowerGrid& grid, int w, std::uint32_t seed = 1337) {
    std::mt19937 rng(seed);
    std::uniform_int_distribution<std::uint32_t> demand(1, 4);
    std::vector<NodeId> ids(static_cast<std::size_t>(w) * w);
    for (int y=0;y<w;++y) for (int x=0;x<w;++x) {
        NodeKind kind = NodeKind::Link;
        std::uint32_t amount = 0;
        if (x==0)          { kind = NodeKind::Producer; amount = 4u * static_cast<std::uint32_t>(w); }
        else if (x%4==0)   { kind = NodeKind::Consumer; amount = demand(rng); }
        const NodeId id = grid.create_node_id();
        grid.submit(evt::NodePlaced{id, kind, GridPos{x,y,0}, amount, false, std::nullopt, std::nullopt});
        ids[static_cast<std::size_t>(y*w+x)] = id;
    }
    for (int y=0;y<w;++y) for (int x=0;x<w;++x) {
        const NodeId id = ids[static_cast<std::size_t>(y*w+x)];
        if (x+1<w) grid.submit(evt::LinkEstablished{id, ids[static_cast<std::size_t>(y*w+x+1)]});
        if (y+1<w) grid.submit(evt::LinkEstablished{id, ids[static_cast<std::size_t>((y+1)*w+x)]});
    }
    grid.tick();
    return ids;
}

// Cuts and restores one vertical seam per iteration: split, then merge.
static void bench_seam_churn(benchmark::State& st) {
    spdlog::set_level(spdlog::level::err);
    const int w = static_cast<int>(st.range(0));
    PowerGrid grid;
    const auto ids = make_sheet(grid, w);
    const int seam = w/2;
    for (auto _ : st) {
        for (int y=0;y<w;++y)
            grid.submit(evt::LinkBroken{ids[static_cast<std::size_t>(y*w+seam-1)], ids[static_cast<std::size_t>(y*w+seam)]});
        auto cut = grid.tick();
        for (int y=0;y<w;++y)
            grid.submit(evt::LinkEstablished{ids[static_cast<std::size_t>(y*w+seam-1)], ids[static_cast<std::size_t>(y*w+seam)]});
        auto joined = grid.tick();
        benchmark::DoNotOptimize(cut.touched_networks + joined.touched_networks);
    }
    st.SetItemsProcessed(st.iterations() * 2);
}
BENCHMARK(bench_seam_churn)->Arg(10)->Arg(100);

// Random single-link toggles inside one large network; most are not bridges.
static void bench_random_link_toggle(benchmark::State& st) {
    spdlog::set_level(spdlog::level::err);
    const int w = static_cast<int>(st.range(0));
    PowerGrid grid;
    const auto ids = make_sheet(grid, w);
    std::mt19937 rng(7);
    std::uniform_int_distribution<int> coord(0, w-2);
    for (auto _ : st) {
        const int x = coord(rng), y = coord(rng);
        const NodeId a = ids[static_cast<std::size_t>(y*w+x)];
        const NodeId b = ids[static_cast<std::size_t>(y*w+x+1)];
        grid.submit(evt::LinkBroken{a, b});
        grid.tick();
        grid.submit(evt::LinkEstablished{a, b});
        auto r = grid.tick();
        benchmark::DoNotOptimize(r.applied_events);
    }
}
BENCHMARK(bench_random_link_toggle)->Arg(10)->Arg(100);

// Steady state: no inbound events, only fuel-less generators and the snapshot.
static void bench_quiet_tick(benchmark::State& st) {
    spdlog::set_level(spdlog::level::err);
    const int w = static_cast<int>(st.range(0));
    PowerGrid grid;
    make_sheet(grid, w);
    for (auto _ : st) {
        auto r = grid.tick();
        benchmark::DoNotOptimize(r.tick);
    }
}
BENCHMARK(bench_quiet_tick)->Arg(10)->Arg(100);

BENCHMARK_MAIN();
