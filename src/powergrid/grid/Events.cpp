#include "powergrid/grid/Events.hpp"

#include <array>

namespace powergrid::evt {

namespace {

constexpr std::array<const char*, kTopologyChangeKindCount> kNames = {
    "network_created",
    "network_split",
    "network_merged",
    "network_removed",
    "generator_state_changed",
    "producer_added",
    "producer_removed",
    "consumer_added",
    "consumer_removed",
    "link_added",
    "link_removed",
    "balance_changed",
};

static_assert(static_cast<std::size_t>(TopologyChangeKind::BalanceChanged) + 1 == kTopologyChangeKindCount,
              "kNames out of sync with TopologyChangeKind");

} // namespace

const char* ToString(TopologyChangeKind kind) noexcept
{
    const auto i = static_cast<std::size_t>(kind);
    return i < kNames.size() ? kNames[i] : "unknown";
}

bool ParseTopologyChangeKind(std::string_view text, TopologyChangeKind& out) noexcept
{
    for (std::size_t i = 0; i < kNames.size(); ++i)
    {
        if (text == kNames[i])
        {
            out = static_cast<TopologyChangeKind>(i);
            return true;
        }
    }
    return false;
}

} // namespace powergrid::evt
