#pragma once
#include <array>
#include <cstddef>
#include <cstdint>

#include "powergrid/grid/Events.hpp"

namespace powergrid {

struct GridConfig {
    int           tick_rate_hz{20};
    double        budget_ms{50.0};          // per-tick recompute guideline
    std::uint32_t max_event_depth{16};
    bool          auto_link_adjacent{false};

    // Used when a NodePlaced leaves them unset.
    double        default_consumption_rate{1.0};
    std::uint32_t default_startup_delay_ticks{20};

    // External stream filter, indexed by TopologyChangeKind. The internal
    // change list (PowerGrid::last_changes) is never filtered.
    std::array<bool, evt::kTopologyChangeKindCount> forward{
        true, true, true, true, true, true, true, true, true, true, true, true};
    bool forward_consumer_power{true};

    [[nodiscard]] bool forwards(evt::TopologyChangeKind kind) const noexcept {
        const auto i = static_cast<std::size_t>(kind);
        return i < forward.size() && forward[i];
    }
};

} // namespace powergrid
