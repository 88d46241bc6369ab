#include "powergrid/grid/BalanceCalculator.hpp"
#include "powergrid/grid/Components.hpp"

#include <spdlog/spdlog.h>

namespace powergrid {

namespace {

using Clock = std::chrono::steady_clock;

double MillisSince(Clock::time_point start)
{
    return std::chrono::duration<double, std::milli>(Clock::now() - start).count();
}

} // namespace

void BalanceCalculator::Recompute(Network& net, const entt::registry& reg)
{
    std::uint64_t supply = 0;
    std::uint64_t demand = 0;

    for (const NodeId m : net.members)
    {
        if (const auto* p = reg.try_get<comp::Producer>(m); p && p->operational())
            supply += p->output;
        if (const auto* c = reg.try_get<comp::Consumer>(m))
            demand += c->demand;
    }

    net.cumulative_supply = supply;
    net.cumulative_demand = demand;
    net.has_surplus = HasSurplus(supply, demand);
}

BalancePass BalanceCalculator::run(NetworkRegistry& networks, const entt::registry& reg,
                                   const std::vector<NetworkId>& dirty) const
{
    BalancePass pass;
    const auto start = Clock::now();

    for (const NetworkId id : dirty)
    {
        Network* net = networks.find(id);
        if (!net)
            continue;

        const auto netStart = Clock::now();
        const bool before = net->has_surplus;
        Recompute(*net, reg);
        const double ms = MillisSince(netStart);

        if (pass.slowest == NoNetwork || ms > pass.slowest_ms)
        {
            pass.slowest_ms = ms;
            pass.slowest = id;
        }
        if (ms > budget_ms_)
        {
            spdlog::warn("balance: network {} ({} members) took {:.3f} ms, budget {:.1f} ms",
                         id, net->members.size(), ms, budget_ms_);
        }
        if (before != net->has_surplus)
            pass.flipped.push_back(id);
    }

    pass.elapsed_ms = MillisSince(start);
    return pass;
}

} // namespace powergrid
