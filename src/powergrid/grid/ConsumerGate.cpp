#include "powergrid/grid/ConsumerGate.hpp"
#include "powergrid/grid/Components.hpp"

#include <algorithm>

namespace powergrid {

std::vector<PowerFlip> ConsumerGate::refresh(const NetworkRegistry& networks, const entt::registry& reg,
                                             const std::vector<NetworkId>& dirty)
{
    std::vector<PowerFlip> flips;

    for (const NetworkId id : dirty)
    {
        const Network* net = networks.find(id);
        if (!net)
            continue;

        for (const NodeId m : net->members)
        {
            if (!reg.all_of<comp::Consumer>(m))
                continue;

            const auto it = powered_.try_emplace(m, false).first;
            if (it->second != net->has_surplus)
            {
                it->second = net->has_surplus;
                flips.push_back(PowerFlip{m, it->second});
            }
        }
    }

    std::sort(flips.begin(), flips.end(),
              [](const PowerFlip& a, const PowerFlip& b) { return a.consumer < b.consumer; });
    return flips;
}

bool ConsumerGate::is_powered(NodeId consumer) const
{
    const auto it = powered_.find(consumer);
    return it != powered_.end() && it->second;
}

} // namespace powergrid
